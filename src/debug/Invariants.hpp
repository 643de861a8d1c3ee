//
// Invariants.hpp
//

#ifndef HEXWAR_INVARIANTS_HPP
#define HEXWAR_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Exception.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <format>
#include <unordered_set>
#include <vector>

namespace hexwar::core::debug
{
    // A second layer of checks run after every applied action. Any failure means
    // the engine itself is broken, so the state dump travels with the exception.
    inline auto CheckInvariants(GameState const& s) -> void
    {
        auto const broken = [&s](std::string msg)
        {
            HXW_THROW_DUMP(error::Code::Invariant, std::move(msg), Inspector::Dump(s));
        };

        if (!s.board) broken("State without a board");
        if (s.flags.size() != s.units.size()) broken("Turn flags out of step with units");

        // 1) Live units: on the board, off the walls, one per hex, hp within profile.
        std::unordered_set<Hex> occupied;
        for (Unit const& u : s.units)
        {
            if (!u.profile) broken(std::format("Unit {} has no profile", u.id));
            if (u.hp < 0 || u.hp > u.profile->max_hp)
                broken(std::format("Unit {} hp {} outside [0,{}]", u.id, u.hp, u.profile->max_hp));
            if (!u.Alive()) continue;

            if (!s.board->InBounds(u.pos))
                broken(std::format("Unit {} off the board at ({},{})", u.id, u.pos.col, u.pos.row));
            if (s.board->IsWall(u.pos))
                broken(std::format("Unit {} inside a wall at ({},{})", u.id, u.pos.col, u.pos.row));
            if (!occupied.insert(u.pos).second)
                broken(std::format("Two live units share ({},{})", u.pos.col, u.pos.row));
        }

        // 2) Pool: unique live units; only Fight admits the player not owning the turn.
        if (s.over && !s.pool.empty()) broken("Activation pool not empty after the episode ended");
        std::unordered_set<std::size_t> seen;
        for (std::size_t const slot : s.pool)
        {
            if (slot >= s.units.size()) broken(std::format("Pool slot {} out of range", slot));
            Unit const& u = s.units[slot];
            if (!u.Alive()) broken(std::format("Dead unit {} left in the pool", u.id));
            if (s.phase != Phase::Fight && u.player != s.current_player)
                broken(std::format("Unit {} of the idle player in the pool", u.id));
            if (!seen.insert(slot).second) broken(std::format("Unit {} twice in the pool", u.id));
        }

        // 3) Phase machine never rests on EndTurn or on an empty pool mid-episode.
        if (!s.over)
        {
            if (s.phase == Phase::EndTurn) broken("State machine resting on EndTurn");
            if (s.pool.empty()) broken("Empty activation pool mid-episode");
            if (s.phase != Phase::Fight && s.acting_player != s.current_player)
                broken(std::format("P{} acting outside the Fight phase of P{}",
                                   static_cast<int>(s.acting_player), static_cast<int>(s.current_player)));
            bool const can_act = std::ranges::any_of(s.pool, [&s](std::size_t const slot)
            {
                return slot < s.units.size() && s.units[slot].player == s.acting_player;
            });
            if (!can_act) broken(std::format("No unit of acting P{} in the pool", static_cast<int>(s.acting_player)));
            if (s.turn < 1 || s.turn > s.max_turns) broken(std::format("Turn {} outside [1,{}]", s.turn, s.max_turns));
        }
    }

    inline auto CheckInvariants(GameImpl const& g) -> void
    {
        CheckInvariants(Inspector::Gather(g));
    }
}
#endif //HEXWAR_INVARIANTS_HPP
