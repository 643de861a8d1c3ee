//
// Combat.cpp
//

#include "Combat.hpp"

#include <algorithm>
#include "HexGeometry.hpp"
#include "LineOfSight.hpp"

namespace
{
    inline auto Viol(hexwar::core::error::RuleViolationCode code) -> hexwar::core::error::RuleViolation
    {
        return hexwar::core::error::RuleViolation{.code = code};
    }
}

namespace hexwar::core::combat
{
    using RVC = error::RuleViolationCode;

    auto CheckShot(GameState const& state, Unit const& shooter, UnitIdT const target_id) -> error::ValidateResult
    {
        HXW_ASSERT(shooter.profile != nullptr, "Shooter without a profile");
        if (!shooter.profile->ranged)
            return std::unexpected(Viol(RVC::Shoot_NoRangedWeapon).with_unit(shooter.id));

        Unit const* target = state.Find(target_id);
        if (target == nullptr)
            return std::unexpected(Viol(RVC::Shoot_TargetNotFound).with_unit(shooter.id).with_target(target_id));
        if (!target->Alive())
            return std::unexpected(Viol(RVC::Shoot_TargetDead).with_unit(shooter.id).with_target(target_id));
        if (target->player == shooter.player)
            return std::unexpected(Viol(RVC::Shoot_TargetFriendly).with_unit(shooter.id).with_target(target_id));

        if (state.Engaged(shooter))
            return std::unexpected(Viol(RVC::Shoot_ShooterEngaged).with_unit(shooter.id).with_hex(shooter.pos));

        int const dist = hex::Distance(shooter.pos, target->pos);
        int const range = shooter.profile->ranged->range;
        if (dist > range)
            return std::unexpected(Viol(RVC::Shoot_OutOfRange)
                                   .with_unit(shooter.id).with_target(target_id)
                                   .with_distance(dist).with_limit(range));

        if (!los::HasLineOfSight(shooter.pos, target->pos, *state.board, los::BuildLosBlockers(state)))
            return std::unexpected(Viol(RVC::Shoot_NoLineOfSight)
                                   .with_unit(shooter.id).with_target(target_id).with_hex(target->pos));

        return {};
    }

    auto CheckFight(GameState const& state, Unit const& attacker, UnitIdT const target_id) -> error::ValidateResult
    {
        HXW_ASSERT(attacker.profile != nullptr, "Attacker without a profile");
        if (!attacker.profile->melee)
            return std::unexpected(Viol(RVC::Fight_NoMeleeWeapon).with_unit(attacker.id));

        Unit const* target = state.Find(target_id);
        if (target == nullptr)
            return std::unexpected(Viol(RVC::Fight_TargetNotFound).with_unit(attacker.id).with_target(target_id));
        if (!target->Alive())
            return std::unexpected(Viol(RVC::Fight_TargetDead).with_unit(attacker.id).with_target(target_id));
        if (target->player == attacker.player)
            return std::unexpected(Viol(RVC::Fight_TargetFriendly).with_unit(attacker.id).with_target(target_id));

        int const dist = hex::Distance(attacker.pos, target->pos);
        if (dist > constants::MeleeRange)
            return std::unexpected(Viol(RVC::Fight_TargetNotAdjacent)
                                   .with_unit(attacker.id).with_target(target_id)
                                   .with_distance(dist).with_limit(constants::MeleeRange));
        return {};
    }

    auto ResolveAttacks(Unit const& attacker, Unit& target, WeaponProfile const& weapon, Dice& dice) -> AttackOutcome
    {
        HXW_ASSERT(target.profile != nullptr, "Target without a profile");

        AttackOutcome out{};
        out.attacks = std::max(0, weapon.attacks) * attacker.LiveModels();
        out.rolls.reserve(static_cast<std::size_t>(out.attacks));

        int const to_wound = WoundTarget(weapon.strength, target.profile->toughness);
        int const to_save = SaveTarget(target.profile->armor_save, weapon.ap, target.profile->invul_save);

        for (int i = 0; i < out.attacks && target.Alive(); ++i)
        {
            AttackRoll roll{};
            roll.hit = static_cast<std::uint8_t>(dice.D6());
            if (roll.hit < weapon.skill)
            {
                out.rolls.push_back(roll);
                continue;
            }
            ++out.hits;

            roll.wound = static_cast<std::uint8_t>(dice.D6());
            if (roll.wound < to_wound)
            {
                out.rolls.push_back(roll);
                continue;
            }
            ++out.wounds;

            roll.save = static_cast<std::uint8_t>(dice.D6());
            if (roll.save >= to_save)
            {
                out.rolls.push_back(roll);
                continue;
            }

            // Overkill is not counted.
            int const dealt = std::min(std::max(0, weapon.damage), target.hp);
            target.hp -= dealt;
            roll.damage = dealt;
            out.damage += dealt;
            out.rolls.push_back(roll);
        }

        out.hit = out.hits > 0;
        out.killed = !target.Alive();
        return out;
    }
}
