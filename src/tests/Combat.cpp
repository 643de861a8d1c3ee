//
// Combat.cpp
//

#include <gtest/gtest.h>
#include <array>
#include <memory>

#include "../core/Combat.hpp"
#include "../core/Dice.hpp"
#include "../core/Scenario.hpp"

using namespace hexwar::core;
using RVC = error::RuleViolationCode;

namespace
{
    auto MakeProfile(int max_hp, int models, int toughness, int armor, int invul = 0) -> UnitProfileSP
    {
        return std::make_shared<UnitProfile const>(UnitProfile{
            .name = "Dummy",
            .max_hp = max_hp,
            .move = 6,
            .toughness = toughness,
            .armor_save = armor,
            .invul_save = invul,
            .models = models,
        });
    }

    // Shooter at (5,10); targets in range, out of range and behind a wall.
    auto ShootingRange() -> Scenario
    {
        Scenario sc{};
        sc.cols = 25;
        sc.rows = 21;
        sc.walls = {{5, 6}};
        sc.armory.Add({"Rifle", 10, 1, 3, 4, 0, 1});
        sc.armory.Add({"Blade", 1, 2, 3, 4, 0, 1});
        sc.profiles = {
            {"Trooper", 10, 6, 4, 3, 0, 5, false, "Rifle", "Blade"},
            {"Brute", 6, 6, 5, 4, 0, 1, false, "", "Blade"},
        };
        sc.units = {
            {1, 0, "Trooper", {5, 10}},
            {2, 1, "Trooper", {12, 10}},
            {3, 1, "Trooper", {20, 10}},
            {4, 1, "Trooper", {5, 2}},
            {5, 0, "Trooper", {5, 14}},
            {6, 0, "Brute", {2, 2}},
        };
        return sc;
    }

    auto Code(error::ValidateResult const& r) -> RVC
    {
        return r.error().code;
    }
}

TEST(Combat_Tables, Wound_Target)
{
    EXPECT_EQ(combat::WoundTarget(8, 4), 2);
    EXPECT_EQ(combat::WoundTarget(5, 4), 3);
    EXPECT_EQ(combat::WoundTarget(4, 4), 4);
    EXPECT_EQ(combat::WoundTarget(3, 4), 5);
    EXPECT_EQ(combat::WoundTarget(2, 4), 6);
    EXPECT_EQ(combat::WoundTarget(4, 8), 6);
    EXPECT_EQ(combat::WoundTarget(4, 7), 5);
    EXPECT_EQ(combat::WoundTarget(7, 4), 3);
}

TEST(Combat_Tables, Save_Target_Is_Clamped)
{
    EXPECT_EQ(combat::SaveTarget(3, 1, 0), 4);
    EXPECT_EQ(combat::SaveTarget(3, 0, 5), 3);
    EXPECT_EQ(combat::SaveTarget(3, 3, 5), 5);
    EXPECT_EQ(combat::SaveTarget(2, 0, 0), 2);
    EXPECT_EQ(combat::SaveTarget(6, 3, 0), 6);
    EXPECT_EQ(combat::SaveTarget(7, 0, 0), 6);
    EXPECT_EQ(combat::SaveTarget(2, 0, 4), 2);
}

TEST(Combat_Models, Live_Models_Round_Up)
{
    Unit u{1, 0, {0, 0}, 10, MakeProfile(10, 5, 4, 3)};
    EXPECT_EQ(u.LiveModels(), 5);
    u.hp = 3;
    EXPECT_EQ(u.LiveModels(), 2);
    u.hp = 1;
    EXPECT_EQ(u.LiveModels(), 1);
    u.hp = 0;
    EXPECT_EQ(u.LiveModels(), 0);
    EXPECT_FALSE(u.Alive());
}

TEST(Combat_Preconditions, Shooting)
{
    Scenario const sc = ShootingRange();
    GameState s = BuildInitialState(sc, Config{});
    Unit const& shooter = s.units[0];

    EXPECT_TRUE(combat::CheckShot(s, shooter, 2).has_value());
    EXPECT_EQ(Code(combat::CheckShot(s, shooter, 3)), RVC::Shoot_OutOfRange);
    EXPECT_EQ(Code(combat::CheckShot(s, shooter, 4)), RVC::Shoot_NoLineOfSight);
    EXPECT_EQ(Code(combat::CheckShot(s, shooter, 5)), RVC::Shoot_TargetFriendly);
    EXPECT_EQ(Code(combat::CheckShot(s, shooter, 42)), RVC::Shoot_TargetNotFound);
    EXPECT_EQ(Code(combat::CheckShot(s, s.units[5], 2)), RVC::Shoot_NoRangedWeapon);

    auto const out_of_range = combat::CheckShot(s, shooter, 3);
    EXPECT_EQ(out_of_range.error().distance, 15);
    EXPECT_EQ(out_of_range.error().limit, 10);

    s.units[1].hp = 0;
    EXPECT_EQ(Code(combat::CheckShot(s, shooter, 2)), RVC::Shoot_TargetDead);

    // An enemy in base contact pins the shooter.
    s.units[2].pos = {6, 10};
    EXPECT_EQ(Code(combat::CheckShot(s, shooter, 4)), RVC::Shoot_ShooterEngaged);
}

TEST(Combat_Preconditions, Fighting)
{
    Scenario const sc = ShootingRange();
    GameState s = BuildInitialState(sc, Config{});
    s.units[1].pos = {6, 10};
    Unit const& attacker = s.units[0];

    EXPECT_TRUE(combat::CheckFight(s, attacker, 2).has_value());
    EXPECT_EQ(Code(combat::CheckFight(s, attacker, 3)), RVC::Fight_TargetNotAdjacent);
    EXPECT_EQ(Code(combat::CheckFight(s, attacker, 5)), RVC::Fight_TargetFriendly);
    EXPECT_EQ(Code(combat::CheckFight(s, attacker, 99)), RVC::Fight_TargetNotFound);

    s.units[1].hp = 0;
    EXPECT_EQ(Code(combat::CheckFight(s, attacker, 2)), RVC::Fight_TargetDead);
}

TEST(Combat_Resolution, Rolls_Are_Consistent)
{
    WeaponProfile const rifle{"Rifle", 10, 2, 3, 4, 1, 1};
    for (std::uint64_t seed : {1ull, 7ull, 99ull, 12345ull})
    {
        Unit const attacker{1, 0, {0, 0}, 10, MakeProfile(10, 5, 4, 3)};
        Unit target{2, 1, {3, 0}, 10, MakeProfile(10, 5, 4, 3)};
        Dice dice{seed};

        AttackOutcome const out = combat::ResolveAttacks(attacker, target, rifle, dice);

        EXPECT_EQ(out.attacks, 10);
        EXPECT_LE(out.rolls.size(), 10u);
        EXPECT_LE(out.wounds, out.hits);
        EXPECT_EQ(out.hit, out.hits > 0);
        EXPECT_EQ(out.damage, 10 - target.hp);
        EXPECT_EQ(out.killed, !target.Alive());

        int hits{};
        int dealt{};
        for (AttackRoll const& r : out.rolls)
        {
            EXPECT_GE(r.hit, 1);
            EXPECT_LE(r.hit, 6);
            if (r.hit >= rifle.skill)
            {
                ++hits;
            }
            else
            {
                EXPECT_EQ(r.wound, 0);
            }
            dealt += r.damage;
        }
        EXPECT_EQ(hits, out.hits);
        EXPECT_EQ(dealt, out.damage);
    }
}

TEST(Combat_Resolution, Same_Seed_Same_Rolls)
{
    WeaponProfile const blade{"Blade", 1, 3, 3, 4, 0, 1};
    Unit const attacker{1, 0, {0, 0}, 10, MakeProfile(10, 5, 4, 3)};

    Unit t1{2, 1, {1, 0}, 10, MakeProfile(10, 5, 4, 3)};
    Unit t2 = t1;
    Dice d1{2024};
    Dice d2{2024};

    AttackOutcome const a = combat::ResolveAttacks(attacker, t1, blade, d1);
    AttackOutcome const b = combat::ResolveAttacks(attacker, t2, blade, d2);
    EXPECT_EQ(a.rolls, b.rolls);
    EXPECT_EQ(t1.hp, t2.hp);
    EXPECT_EQ(d1.Rolled(), d2.Rolled());
}

TEST(Combat_Resolution, Overkill_Is_Not_Counted)
{
    // 60 attacks hitting, wounding and failing saves on 2+/2+/6: the target dies.
    WeaponProfile const hammer{"Hammer", 1, 60, 2, 20, 6, 10};
    Unit const attacker{1, 0, {0, 0}, 10, MakeProfile(10, 1, 4, 3)};
    Unit target{2, 1, {1, 0}, 3, MakeProfile(3, 1, 4, 3)};
    Dice dice{77};

    AttackOutcome const out = combat::ResolveAttacks(attacker, target, hammer, dice);

    ASSERT_TRUE(out.killed);
    EXPECT_EQ(target.hp, 0);
    EXPECT_EQ(out.damage, 3);
    ASSERT_FALSE(out.rolls.empty());
    // Nothing is rolled once the target is down.
    EXPECT_EQ(out.rolls.back().damage, 3);
    EXPECT_LT(out.rolls.size(), 60u);
}

TEST(Combat_Resolution, Dead_Attacker_Makes_No_Attacks)
{
    WeaponProfile const rifle{"Rifle", 10, 2, 3, 4, 1, 1};
    Unit const attacker{1, 0, {0, 0}, 0, MakeProfile(10, 5, 4, 3)};
    Unit target{2, 1, {3, 0}, 10, MakeProfile(10, 5, 4, 3)};
    Dice dice{5};

    AttackOutcome const out = combat::ResolveAttacks(attacker, target, rifle, dice);
    EXPECT_EQ(out.attacks, 0);
    EXPECT_TRUE(out.rolls.empty());
    EXPECT_EQ(target.hp, 10);
    EXPECT_EQ(dice.Rolled(), 0u);
}

TEST(Dice_Rolls, Faces_And_Determinism)
{
    Dice a{31337};
    Dice b{31337};
    std::array<int, 7> seen{};
    for (int i = 0; i < 6000; ++i)
    {
        int const x = a.D6();
        ASSERT_GE(x, 1);
        ASSERT_LE(x, 6);
        ++seen[x];
        EXPECT_EQ(x, b.D6());
    }
    for (int f = 1; f <= 6; ++f) EXPECT_GT(seen[f], 0);
    EXPECT_EQ(a.Rolled(), 6000u);

    int const sum = a.Sum(2);
    EXPECT_GE(sum, 2);
    EXPECT_LE(sum, 12);
    EXPECT_EQ(a.Rolled(), 6002u);
    EXPECT_EQ(a.Seed(), 31337u);
}
