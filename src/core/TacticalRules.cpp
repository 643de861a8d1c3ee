//
// TacticalRules.cpp
//

#include "TacticalRules.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include "Combat.hpp"
#include "HexGeometry.hpp"
#include "Reachability.hpp"

namespace
{
    using hexwar::core::error::RuleViolation;
    using hexwar::core::error::RuleViolationCode;

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{.code = code};
    }

    auto KindFor(hexwar::core::Phase const p) -> hexwar::core::ActionKind
    {
        using hexwar::core::ActionKind;
        using hexwar::core::Phase;
        switch (p)
        {
        case Phase::Move: return ActionKind::Move;
        case Phase::Shoot: return ActionKind::Shoot;
        case Phase::Charge: return ActionKind::Charge;
        case Phase::Fight: return ActionKind::Fight;
        case Phase::EndTurn: return ActionKind::Pass;
        }
        return ActionKind::Pass;
    }

    auto ActedThisPhase(hexwar::core::UnitTurnFlags const& f, hexwar::core::Phase const p) -> bool
    {
        using hexwar::core::Phase;
        switch (p)
        {
        case Phase::Move: return f.moved;
        case Phase::Shoot: return f.shot;
        case Phase::Charge: return f.charged;
        case Phase::Fight: return f.fought;
        case Phase::EndTurn: return false;
        }
        return false;
    }

    auto Hostile(hexwar::core::Unit const& a, hexwar::core::Unit const& b) -> bool
    {
        return b.Alive() && a.player != b.player;
    }

    auto Opponent(hexwar::core::PlyrIdxT const p) -> hexwar::core::PlyrIdxT
    {
        return static_cast<hexwar::core::PlyrIdxT>((p + 1) % hexwar::core::constants::PlayerCount);
    }
}

namespace hexwar::core
{
    using RVC = error::RuleViolationCode;

    auto TacticalRules::NextPhase(Phase const p) noexcept -> Phase
    {
        switch (p)
        {
        case Phase::Move: return Phase::Shoot;
        case Phase::Shoot: return Phase::Charge;
        case Phase::Charge: return Phase::Fight;
        case Phase::Fight: return Phase::EndTurn;
        case Phase::EndTurn: return Phase::Move;
        }
        return Phase::Move;
    }

    auto TacticalRules::BeginEpisode(GameState& state) -> void
    {
        HXW_ASSERT(state.board != nullptr, "BeginEpisode without a board");
        state.turn = 1;
        state.phase = Phase::Move;
        state.current_player = 0;
        state.acting_player = 0;
        state.fight_initiative = Opponent(0);
        state.steps = 0;
        state.over = false;
        state.truncated = false;
        state.winner.reset();
        state.flags.assign(state.units.size(), UnitTurnFlags{});
        if (CheckTermination(state)) return;
        OpenPhase(state);
    }

    auto TacticalRules::OpenPhase(GameState& state) -> void
    {
        state.pool.clear();
        for (std::size_t slot{}; slot < state.units.size(); ++slot)
        {
            if (Eligible(state, slot)) state.pool.push_back(slot);
        }
        if (state.phase == Phase::Fight) state.fight_initiative = Opponent(state.current_player);
        PickActingPlayer(state);
    }

    auto TacticalRules::ChargersPending(GameState const& state) -> bool
    {
        return std::ranges::any_of(state.pool, [&state](std::size_t const slot)
        {
            return state.units[slot].player == state.current_player && state.flags[slot].charged;
        });
    }

    auto TacticalRules::PickActingPlayer(GameState& state) -> void
    {
        if (state.phase != Phase::Fight || ChargersPending(state))
        {
            state.acting_player = state.current_player;
            return;
        }

        // Alternation; a side with nobody left hands the rest of the phase to the other.
        bool const due_has_units = std::ranges::any_of(state.pool, [&state](std::size_t const slot)
        {
            return state.units[slot].player == state.fight_initiative;
        });
        state.acting_player = due_has_units ? state.fight_initiative : Opponent(state.fight_initiative);
    }

    auto TacticalRules::CanActNow(GameState const& state, std::size_t const slot) -> bool
    {
        if (!state.InPool(slot) || state.units[slot].player != state.acting_player) return false;
        return state.phase != Phase::Fight || !ChargersPending(state) || state.flags[slot].charged;
    }

    auto TacticalRules::Eligible(GameState const& state, std::size_t const slot) -> bool
    {
        Unit const& u = state.units[slot];
        UnitTurnFlags const& f = state.flags[slot];
        if (!u.Alive()) return false;
        // Fight is the only phase where the player not owning the turn acts.
        if (state.phase != Phase::Fight && u.player != state.current_player) return false;

        switch (state.phase)
        {
        case Phase::Move:
            return !f.moved;
        case Phase::Shoot:
            if (f.shot || f.fled || !u.profile->ranged || state.Engaged(u)) return false;
            return std::ranges::any_of(state.units, [&](Unit const& t)
            {
                return Hostile(u, t) && combat::CheckShot(state, u, t.id).has_value();
            });
        case Phase::Charge:
            if (f.charged || f.fled || !u.profile->melee || state.Engaged(u)) return false;
            return std::ranges::any_of(state.units, [&](Unit const& t)
            {
                return Hostile(u, t)
                    && hex::Distance(u.pos, t.pos) <= constants::MaxChargeDistance
                    && PickChargeDestination(state, u, t).has_value();
            });
        case Phase::Fight:
            if (f.fought || !u.profile->melee) return false;
            return std::ranges::any_of(state.units, [&](Unit const& t)
            {
                return Hostile(u, t) && hex::Adjacent(u.pos, t.pos);
            });
        case Phase::EndTurn:
            return false;
        }
        return false;
    }

    auto TacticalRules::PickChargeDestination(GameState const& state, Unit const& charger, Unit const& target)
        -> std::optional<ChargePlan>
    {
        Board const& board = *state.board;
        reach::MovementContext const ctx = reach::BuildMovementContext(state, charger);

        std::optional<ChargePlan> best{};
        for (Hex const& n : hex::Neighbors(target.pos))
        {
            if (!board.InBounds(n) || board.IsWall(n) || ctx.occupied.Test(n)) continue;

            auto const d = reach::ShortestDistance(charger.pos, n, constants::MaxChargeDistance, ctx);
            if (!d) continue;

            if (!best || *d < best->distance || (*d == best->distance && n < best->destination))
                best = ChargePlan{n, *d};
        }
        return best;
    }

    auto TacticalRules::Validate(GameState const& state, ActionRequest const& a) const -> CheckResult
    {
        if (state.over)
            return std::unexpected(Viol(RVC::EpisodeOver).with_phase(state.phase));

        auto const slot = state.FindSlot(a.unit);
        if (!slot)
            return std::unexpected(Viol(RVC::UnknownUnit).with_unit(a.unit));

        Unit const& u = state.units[*slot];
        if (!u.Alive())
            return std::unexpected(Viol(RVC::UnitDead).with_unit(u.id));

        if (u.player != state.acting_player)
            return std::unexpected(Viol(RVC::WrongPlayer).with_unit(u.id).with_actor(u.player));

        if (a.kind != ActionKind::Pass && a.kind != KindFor(state.phase))
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state.phase).with_unit(u.id));

        if (ActedThisPhase(state.flags[*slot], state.phase))
            return std::unexpected(Viol(RVC::AlreadyActed).with_phase(state.phase).with_unit(u.id));

        auto const tag = [&](CheckResult r) -> CheckResult
        {
            if (r) return r;
            RuleViolation v = r.error();
            v.with_phase(state.phase).with_actor(u.player);
            return std::unexpected(v);
        };

        CheckResult kind_check{};
        switch (a.kind)
        {
        case ActionKind::Move:
            kind_check = tag(ValidateMove(state, u, a));
            break;
        case ActionKind::Shoot:
            if (!a.target_unit)
                return std::unexpected(Viol(RVC::MissingTargetUnit).with_phase(state.phase).with_unit(u.id));
            if (state.flags[*slot].fled)
                return std::unexpected(Viol(RVC::Shoot_UnitFled).with_phase(state.phase).with_unit(u.id));
            kind_check = tag(combat::CheckShot(state, u, *a.target_unit));
            break;
        case ActionKind::Charge:
            kind_check = tag(ValidateCharge(state, u, a));
            break;
        case ActionKind::Fight:
            if (!a.target_unit)
                return std::unexpected(Viol(RVC::MissingTargetUnit).with_phase(state.phase).with_unit(u.id));
            kind_check = tag(combat::CheckFight(state, u, *a.target_unit));
            break;
        case ActionKind::Pass:
            break;
        }
        if (!kind_check) return kind_check;

        // Passed units and units without a valid target fall out here.
        if (!state.InPool(*slot))
            return std::unexpected(Viol(RVC::NotEligible).with_phase(state.phase).with_unit(u.id));

        if (!CanActNow(state, *slot))
            return std::unexpected(Viol(RVC::Fight_ChargersStrikeFirst).with_phase(state.phase).with_unit(u.id));

        return {};
    }

    auto TacticalRules::ValidateMove(GameState const& state, Unit const& u, ActionRequest const& a) -> CheckResult
    {
        if (!a.target_hex)
            return std::unexpected(Viol(RVC::MissingTargetHex).with_unit(u.id));

        Board const& board = *state.board;
        Hex const dest = *a.target_hex;

        if (!board.InBounds(dest))
            return std::unexpected(Viol(RVC::Move_OutOfBounds).with_unit(u.id).with_hex(dest));
        if (board.IsWall(dest))
            return std::unexpected(Viol(RVC::Move_DestinationWall).with_unit(u.id).with_hex(dest));
        if (dest == u.pos)
            return std::unexpected(Viol(RVC::Move_DestinationIsOrigin).with_unit(u.id).with_hex(dest));
        if (Unit const* other = state.UnitAt(dest))
            return std::unexpected(Viol(RVC::Move_DestinationOccupied)
                                   .with_unit(u.id).with_hex(dest).with_target(other->id));

        reach::MovementContext const ctx = reach::BuildMovementContext(state, u);
        auto const dist = reach::ShortestDistance(u.pos, dest, u.profile->move, ctx);
        if (!dist)
            return std::unexpected(Viol(RVC::Move_Unreachable)
                                   .with_unit(u.id).with_hex(dest).with_limit(u.profile->move));

        if (ctx.enemy_adjacent.Test(dest))
            return std::unexpected(Viol(RVC::Move_DestinationAdjacentToEnemy)
                                   .with_unit(u.id).with_hex(dest).with_distance(*dist));
        return {};
    }

    auto TacticalRules::ValidateCharge(GameState const& state, Unit const& u, ActionRequest const& a) -> CheckResult
    {
        if (!a.target_unit)
            return std::unexpected(Viol(RVC::MissingTargetUnit).with_unit(u.id));
        if (!u.profile->melee)
            return std::unexpected(Viol(RVC::Charge_NoMeleeWeapon).with_unit(u.id));

        auto const slot = state.FindSlot(u.id);
        if (slot && state.flags[*slot].fled)
            return std::unexpected(Viol(RVC::Charge_UnitFled).with_unit(u.id));
        if (state.Engaged(u))
            return std::unexpected(Viol(RVC::Charge_AlreadyEngaged).with_unit(u.id).with_hex(u.pos));

        UnitIdT const target_id = *a.target_unit;
        Unit const* target = state.Find(target_id);
        if (target == nullptr)
            return std::unexpected(Viol(RVC::Charge_TargetNotFound).with_unit(u.id).with_target(target_id));
        if (!target->Alive())
            return std::unexpected(Viol(RVC::Charge_TargetDead).with_unit(u.id).with_target(target_id));
        if (target->player == u.player)
            return std::unexpected(Viol(RVC::Charge_TargetFriendly).with_unit(u.id).with_target(target_id));

        int const gap = hex::Distance(u.pos, target->pos);
        if (gap > constants::MaxChargeDistance)
            return std::unexpected(Viol(RVC::Charge_TargetTooFar)
                                   .with_unit(u.id).with_target(target_id)
                                   .with_distance(gap).with_limit(constants::MaxChargeDistance));

        if (!a.target_hex)
        {
            if (!PickChargeDestination(state, u, *target))
                return std::unexpected(Viol(RVC::Charge_NoReachableDestination)
                                       .with_unit(u.id).with_target(target_id));
            return {};
        }

        Board const& board = *state.board;
        Hex const dest = *a.target_hex;
        if (!board.InBounds(dest))
            return std::unexpected(Viol(RVC::Charge_OutOfBounds).with_unit(u.id).with_hex(dest));
        if (board.IsWall(dest))
            return std::unexpected(Viol(RVC::Charge_DestinationWall).with_unit(u.id).with_hex(dest));
        if (state.UnitAt(dest) != nullptr)
            return std::unexpected(Viol(RVC::Charge_DestinationOccupied).with_unit(u.id).with_hex(dest));
        if (!hex::Adjacent(dest, target->pos))
            return std::unexpected(Viol(RVC::Charge_DestinationNotAdjacentToTarget)
                                   .with_unit(u.id).with_target(target_id).with_hex(dest));

        reach::MovementContext const ctx = reach::BuildMovementContext(state, u);
        if (!reach::Reachable(u.pos, dest, constants::MaxChargeDistance, ctx))
            return std::unexpected(Viol(RVC::Charge_Unreachable)
                                   .with_unit(u.id).with_hex(dest).with_limit(constants::MaxChargeDistance));
        return {};
    }

    auto TacticalRules::Apply(GameState& state, Dice& dice, ActionRequest const& a, ActionResult& result) -> void
    {
        if (state.over) HXW_THROW(error::Code::State, "Apply on a finished episode");

        auto const slot = state.FindSlot(a.unit);
        if (!slot) HXW_THROW(error::Code::InvalidAction, std::format("Apply for unknown unit {}", a.unit));

        Unit& u = state.units[*slot];
        UnitTurnFlags& f = state.flags[*slot];
        bool const alternating = state.phase == Phase::Fight && !ChargersPending(state);

        auto const target_slot = [&]() -> std::size_t
        {
            if (!a.target_unit) HXW_THROW(error::Code::InvalidAction, "Apply without a target unit");
            auto const t = state.FindSlot(*a.target_unit);
            if (!t) HXW_THROW(error::Code::InvalidAction, std::format("Apply against unknown unit {}", *a.target_unit));
            return *t;
        };

        auto const attack = [&](WeaponProfile const& weapon)
        {
            Unit& target = state.units[target_slot()];
            int const hp_before = target.hp;
            result.attack = combat::ResolveAttacks(u, target, weapon, dice);
            result.deltas.push_back(UnitDelta{target.id, target.pos, target.pos, hp_before, target.hp});
        };

        switch (a.kind)
        {
        case ActionKind::Move:
        {
            if (!a.target_hex) HXW_THROW(error::Code::InvalidAction, "Move without a destination");
            bool const was_engaged = state.Engaged(u);
            Hex const from = u.pos;
            u.pos = *a.target_hex;
            f.moved = true;
            f.fled = f.fled || was_engaged;
            result.deltas.push_back(UnitDelta{u.id, from, u.pos, u.hp, u.hp});
            break;
        }
        case ActionKind::Shoot:
            if (!u.profile->ranged) HXW_THROW(error::Code::InvalidAction, "Shoot without a ranged weapon");
            attack(*u.profile->ranged);
            f.shot = true;
            break;
        case ActionKind::Charge:
        {
            Unit const& target = state.units[target_slot()];
            std::optional<ChargePlan> plan{};
            if (a.target_hex)
            {
                reach::MovementContext const ctx = reach::BuildMovementContext(state, u);
                auto const d = reach::ShortestDistance(u.pos, *a.target_hex, constants::MaxChargeDistance, ctx);
                if (d) plan = ChargePlan{*a.target_hex, *d};
            }
            else
            {
                plan = PickChargeDestination(state, u, target);
            }
            if (!plan) HXW_THROW(error::Code::InvalidAction, "Charge without a reachable destination");

            int const roll = dice.Sum(constants::ChargeDice);
            bool const success = plan->distance <= roll;
            result.charge = ChargeRoll{roll, plan->distance, success};
            if (success)
            {
                Hex const from = u.pos;
                u.pos = plan->destination;
                result.deltas.push_back(UnitDelta{u.id, from, u.pos, u.hp, u.hp});
            }
            f.charged = true;
            break;
        }
        case ActionKind::Fight:
            if (!u.profile->melee) HXW_THROW(error::Code::InvalidAction, "Fight without a melee weapon");
            attack(*u.profile->melee);
            f.fought = true;
            break;
        case ActionKind::Pass:
            break;
        }

        std::erase(state.pool, *slot);
        if (alternating) state.fight_initiative = Opponent(u.player);
    }

    auto TacticalRules::FinishByUnitCount(GameState& state, bool const truncated) -> void
    {
        int const live0 = state.LiveCount(0);
        int const live1 = state.LiveCount(1);
        state.over = true;
        state.truncated = truncated;
        state.pool.clear();
        if (live0 > live1) state.winner = PlyrIdxT{0};
        else if (live1 > live0) state.winner = PlyrIdxT{1};
        else state.winner.reset();
    }

    auto TacticalRules::CheckTermination(GameState& state) -> bool
    {
        if (state.over) return true;

        int const live0 = state.LiveCount(0);
        int const live1 = state.LiveCount(1);
        if (live0 == 0 || live1 == 0)
        {
            // Both sides gone at once counts as a draw.
            FinishByUnitCount(state, false);
            return true;
        }
        if (state.turn > state.max_turns)
        {
            FinishByUnitCount(state, false);
            return true;
        }
        if (state.steps >= state.max_steps)
        {
            FinishByUnitCount(state, true);
            return true;
        }
        return false;
    }

    auto TacticalRules::Advance(GameState& state) -> StepOutcome
    {
        if (CheckTermination(state)) return StepOutcome::EpisodeEnded;

        std::erase_if(state.pool, [&state](std::size_t const slot) { return !Eligible(state, slot); });
        if (!state.pool.empty())
        {
            PickActingPlayer(state);
            return StepOutcome::Applied;
        }

        StepOutcome outcome = StepOutcome::PhaseEnded;
        do
        {
            state.phase = NextPhase(state.phase);
            if (state.phase == Phase::EndTurn)
            {
                outcome = StepOutcome::TurnEnded;
                if (state.current_player == constants::PlayerCount - 1) ++state.turn;
                state.current_player = static_cast<PlyrIdxT>((state.current_player + 1) % constants::PlayerCount);
                state.flags.assign(state.units.size(), UnitTurnFlags{});
                state.phase = Phase::Move;
                if (CheckTermination(state)) return StepOutcome::EpisodeEnded;
            }
            OpenPhase(state);
        }
        while (state.pool.empty());

        return outcome;
    }

    auto TacticalRules::Enumerate(GameState const& state) const -> std::vector<ActionRequest>
    {
        std::vector<ActionRequest> out;
        if (state.over) return out;

        for (std::size_t const slot : state.pool)
        {
            if (!CanActNow(state, slot)) continue;
            Unit const& u = state.units[slot];
            switch (state.phase)
            {
            case Phase::Move:
            {
                reach::MovementContext const ctx = reach::BuildMovementContext(state, u);
                for (reach::Destination const& d : reach::ReachableHexes(u.pos, u.profile->move, ctx))
                {
                    if (!d.terminal_only) out.push_back(ActionRequest{u.id, ActionKind::Move, d.hex, std::nullopt});
                }
                break;
            }
            case Phase::Shoot:
                for (Unit const& t : state.units)
                {
                    if (Hostile(u, t) && combat::CheckShot(state, u, t.id))
                        out.push_back(ActionRequest{u.id, ActionKind::Shoot, std::nullopt, t.id});
                }
                break;
            case Phase::Charge:
                for (Unit const& t : state.units)
                {
                    if (Hostile(u, t)
                        && hex::Distance(u.pos, t.pos) <= constants::MaxChargeDistance
                        && PickChargeDestination(state, u, t))
                        out.push_back(ActionRequest{u.id, ActionKind::Charge, std::nullopt, t.id});
                }
                break;
            case Phase::Fight:
                for (Unit const& t : state.units)
                {
                    if (Hostile(u, t) && hex::Adjacent(u.pos, t.pos))
                        out.push_back(ActionRequest{u.id, ActionKind::Fight, std::nullopt, t.id});
                }
                break;
            case Phase::EndTurn:
                break;
            }
            out.push_back(ActionRequest{u.id, ActionKind::Pass, std::nullopt, std::nullopt});
        }
        return out;
    }
}
