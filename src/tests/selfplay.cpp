//
// selfplay.cpp
//

#include <gtest/gtest.h>
#include <array>
#include <filesystem>
#include <format>
#include <memory>
#include <print>
#include <unordered_set>

#include "../core/Game.hpp"
#include "../core/RandomAi.hpp"
#include "../core/Scenario.hpp"
#include "../core/TacticalRules.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"

using namespace hexwar::core;

namespace
{
    auto MakeGame(std::uint64_t seed) -> GameImpl
    {
        Config cfg{};
        cfg.seed = seed;
        cfg.max_turns = 5;
        GameImpl game(cfg, std::make_unique<TacticalRules>());
        (void)game.Reset(DefaultScenario());
        return game;
    }

    auto MakePlayers(std::uint64_t seed) -> std::array<std::unique_ptr<Player>, constants::PlayerCount>
    {
        return {std::make_unique<RandomAI>(seed + 1), std::make_unique<RandomAI>(seed + 2)};
    }

    // Plays to the end; every chosen request must be accepted.
    auto PlayOut(GameImpl& game, std::uint64_t seed, debug::AuditLogger* log = nullptr) -> void
    {
        auto players = MakePlayers(seed);
        while (!game.Over())
        {
            PlyrIdxT const actor = game.ActingPlayer();
            ActionRequest const req = players[actor]->Play(game.SnapshotFor(actor));
            ActionResult const r = game.Step(req);
            if (log) log->record(game.History().back());
            ASSERT_TRUE(r.legal) << error::describe(*r.violation);
            ASSERT_LE(game.Steps(), game.Settings().max_steps);
        }
    }
}

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            GameImpl game = MakeGame(seed);
            {
                debug::AuditLogger log(std::format("_artifacts/episode_{}.log", seed));
                ASSERT_TRUE(log.is_open());
                log.start(game);
                PlayOut(game, seed, &log);
                log.end(game);
            }

            EXPECT_TRUE(game.Over());
            debug::CheckInvariants(game);

            GameState const& s = game.State();
            int const live0 = s.LiveCount(0);
            int const live1 = s.LiveCount(1);
            if (live0 > live1) EXPECT_EQ(game.Winner(), std::optional<PlyrIdxT>{0});
            if (live1 > live0) EXPECT_EQ(game.Winner(), std::optional<PlyrIdxT>{1});
            if (live0 == live1) EXPECT_FALSE(game.Winner().has_value());

            auto const path = fs::path(std::format("_artifacts/episode_{}.log", seed));
            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e.to_str());
        FAIL() << e.what();
    }
}

TEST(SelfPlay, Damage_Only_Goes_Down_And_Dead_Stay_Dead)
{
    for (std::uint64_t seed : {5ull, 6ull, 7ull, 8ull})
    {
        GameImpl game = MakeGame(seed);
        PlayOut(game, seed);

        std::unordered_set<UnitIdT> dead;
        for (ActionRecord const& rec : game.History())
        {
            if (!rec.result.legal) continue;
            EXPECT_FALSE(dead.contains(rec.request.unit)) << "dead unit " << rec.request.unit << " acted";
            if (rec.request.target_unit)
                EXPECT_FALSE(dead.contains(*rec.request.target_unit)) << "dead unit " << *rec.request.target_unit << " targeted";

            for (UnitDelta const& d : rec.result.deltas)
            {
                EXPECT_LE(d.hp_after, d.hp_before);
                EXPECT_GE(d.hp_after, 0);
                if (d.hp_after == 0) dead.insert(d.unit);
            }
        }
        for (UnitIdT const id : dead) EXPECT_FALSE(game.State().Find(id)->Alive());
    }
}

TEST(SelfPlay, Same_Seed_Same_History)
{
    GameImpl a = MakeGame(4242);
    GameImpl b = MakeGame(4242);
    PlayOut(a, 4242);
    PlayOut(b, 4242);

    ASSERT_EQ(a.History().size(), b.History().size());
    for (std::size_t i{}; i < a.History().size(); ++i)
    {
        ActionRecord const& x = a.History()[i];
        ActionRecord const& y = b.History()[i];
        EXPECT_EQ(x.request, y.request) << "record " << i;
        EXPECT_EQ(x.result.deltas, y.result.deltas) << "record " << i;
        EXPECT_EQ(x.result.outcome, y.result.outcome) << "record " << i;
        EXPECT_EQ(x.result.reward, y.result.reward) << "record " << i;
    }
    EXPECT_EQ(a.Winner(), b.Winner());
    EXPECT_EQ(a.Observe(), b.Observe());
}

TEST(SelfPlay, Enumerated_Actions_All_Validate)
{
    GameImpl game = MakeGame(909);
    TacticalRules const rules{};
    auto players = MakePlayers(909);

    int checked{};
    while (!game.Over() && checked < 60)
    {
        auto const legal = game.LegalActions();
        ASSERT_FALSE(legal.empty());
        for (ActionRequest const& a : legal)
        {
            auto const v = rules.Validate(game.State(), a);
            EXPECT_TRUE(v.has_value()) << debug::FormatRequest(a) << ": " << error::describe(v.error());
        }

        PlyrIdxT const actor = game.ActingPlayer();
        ASSERT_TRUE(game.Step(players[actor]->Play(game.SnapshotFor(actor))).legal);
        ++checked;
    }
}
