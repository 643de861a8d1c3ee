//
// Scenario.cpp
//

#include <gtest/gtest.h>
#include <memory>

#include "../core/Game.hpp"
#include "../core/Scenario.hpp"
#include "../core/TacticalRules.hpp"

using namespace hexwar::core;
using error::ConfigurationError;

namespace
{
    auto Skirmish() -> Scenario
    {
        Scenario sc{};
        sc.cols = 12;
        sc.rows = 10;
        sc.walls = {{5, 5}};
        sc.armory.Add({"Rifle", 10, 1, 3, 4, 0, 1});
        sc.profiles = {{"Trooper", 10, 6, 4, 3, 0, 5, false, "Rifle", ""}};
        sc.units = {
            {1, 0, "Trooper", {1, 1}},
            {2, 1, "Trooper", {10, 8}},
        };
        return sc;
    }
}

TEST(Scenario_Loading, Default_Scenario_Builds)
{
    Scenario const sc = DefaultScenario();
    GameState const s = BuildInitialState(sc, Config{});

    ASSERT_NE(s.board, nullptr);
    EXPECT_EQ(s.board->Cols(), 25);
    EXPECT_EQ(s.board->Rows(), 21);
    EXPECT_EQ(s.board->Walls().size(), 9u);
    ASSERT_EQ(s.units.size(), 6u);
    EXPECT_EQ(s.LiveCount(0), 3);
    EXPECT_EQ(s.LiveCount(1), 3);
    EXPECT_EQ(s.turn, 1);
    EXPECT_EQ(s.phase, Phase::Move);
    EXPECT_EQ(s.current_player, 0);
    EXPECT_TRUE(s.pool.empty());

    for (Unit const& u : s.units) EXPECT_EQ(u.hp, u.profile->max_hp);

    // Units sharing a template share one immutable profile.
    Unit const* a = s.Find(1);
    Unit const* b = s.Find(4);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(a->profile.get(), b->profile.get());
    ASSERT_TRUE(a->profile->ranged.has_value());
    EXPECT_EQ(a->profile->ranged->name, "Bolt Rifle");
    EXPECT_TRUE(s.Find(2)->profile->blocks_los);
}

TEST(Scenario_Loading, Armory_Lookup_Is_Strict)
{
    Scenario const sc = DefaultScenario();
    auto const hit = sc.armory.Find("Plasma Gun");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ((*hit)->damage, 2);

    auto const miss = sc.armory.Find("Plasma Cannon");
    ASSERT_FALSE(miss.has_value());
    EXPECT_EQ(miss.error().key, "Plasma Cannon");
    EXPECT_EQ(miss.error().where, "armory");

    EXPECT_FALSE(sc.FindProfile("Terminators").has_value());
}

TEST(Scenario_Loading, Armory_Rejects_Bad_Weapons)
{
    Armory armory;
    armory.Add({"Rifle", 10, 1, 3, 4, 0, 1});
    EXPECT_THROW(armory.Add({"Rifle", 8, 1, 3, 4, 0, 1}), ConfigurationError);
    EXPECT_THROW(armory.Add({"Wand", 8, 1, 1, 4, 0, 1}), ConfigurationError);
    EXPECT_THROW(armory.Add({"Stick", 0, 1, 3, 4, 0, 1}), ConfigurationError);
    EXPECT_THROW(armory.Add({"", 8, 1, 3, 4, 0, 1}), ConfigurationError);
    EXPECT_THROW(armory.Add({"Leaky", 8, 1, 3, 4, -1, 1}), ConfigurationError);
    EXPECT_EQ(armory.Size(), 1u);
}

TEST(Scenario_Loading, Unknown_Weapon_Reference)
{
    Scenario sc = Skirmish();
    sc.profiles[0].melee = "Chainsword";
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);
}

TEST(Scenario_Loading, Bad_Profile_Stats)
{
    Scenario sc = Skirmish();
    sc.profiles[0].armor_save = 1;
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.profiles[0].invul_save = 7;
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.profiles.push_back(sc.profiles[0]);
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);
}

TEST(Scenario_Loading, Bad_Placements)
{
    Scenario sc = Skirmish();
    sc.units.push_back({3, 0, "Trooper", {12, 0}});
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.units.push_back({3, 0, "Trooper", {5, 5}});
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.units.push_back({3, 0, "Trooper", {1, 1}});
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.units.push_back({1, 0, "Trooper", {2, 2}});
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.units.push_back({3, 2, "Trooper", {2, 2}});
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.units.push_back({3, 0, "Terminator", {2, 2}});
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.units.pop_back();
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);
}

TEST(Scenario_Loading, Bad_Board_And_Limits)
{
    Scenario sc = Skirmish();
    sc.walls.push_back({40, 2});
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    sc = Skirmish();
    sc.cols = 0;
    EXPECT_THROW((void)BuildInitialState(sc, Config{}), ConfigurationError);

    Config cfg{};
    cfg.max_turns = 0;
    EXPECT_THROW((void)BuildInitialState(Skirmish(), cfg), ConfigurationError);

    cfg = Config{};
    cfg.max_steps = 0;
    EXPECT_THROW((void)BuildInitialState(Skirmish(), cfg), ConfigurationError);
}

TEST(Scenario_Loading, Rejected_Reset_Keeps_Previous_Episode)
{
    GameImpl game(Config{}, std::make_unique<TacticalRules>());
    (void)game.Reset(DefaultScenario());
    ActionResult const r = game.Step(ActionRequest{1, ActionKind::Pass});
    ASSERT_TRUE(r.legal);

    Scenario broken = Skirmish();
    broken.units.push_back({3, 0, "Trooper", {5, 5}});
    EXPECT_THROW((void)game.Reset(broken), ConfigurationError);

    EXPECT_EQ(game.State().units.size(), 6u);
    EXPECT_EQ(game.Steps(), 1u);
    EXPECT_EQ(game.History().size(), 1u);
}
