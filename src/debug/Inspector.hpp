//
// Inspector.hpp
//

#ifndef HEXWAR_INSPECTOR_HPP
#define HEXWAR_INSPECTOR_HPP

#include <format>
#include <string>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace hexwar::core::debug
{
    struct Inspector
    {
        static inline auto Gather(GameImpl const& g) -> GameState const&
        {
            return g.state_;
        }

        static inline auto HistorySize(GameImpl const& g) -> std::size_t
        {
            return g.history_.size();
        }

        // Full human-readable state, attached to invariant failures.
        static inline auto Dump(GameState const& s) -> std::string
        {
            std::string out = std::format("turn={} phase={} player=P{} acting=P{} steps={}/{} over={} truncated={} winner={}\n",
                                          s.turn, to_string(s.phase), static_cast<int>(s.current_player),
                                          static_cast<int>(s.acting_player),
                                          s.steps, s.max_steps, s.over, s.truncated,
                                          s.winner ? static_cast<int>(*s.winner) : -1);
            if (s.board)
            {
                out += std::format("board={}x{} walls={}\n", s.board->Cols(), s.board->Rows(), s.board->Walls().size());
            }

            out += "pool=[";
            for (std::size_t i{}; i < s.pool.size(); ++i)
            {
                out += std::format("{}{}", i ? "," : "", s.pool[i]);
            }
            out += "]\n";

            for (std::size_t slot{}; slot < s.units.size(); ++slot)
            {
                Unit const& u = s.units[slot];
                out += std::format("  [{}] id={} P{} {} at ({},{}) hp={}/{}",
                                   slot, u.id, static_cast<int>(u.player),
                                   u.profile ? u.profile->name : std::string{"<no profile>"},
                                   u.pos.col, u.pos.row, u.hp, u.profile ? u.profile->max_hp : 0);
                if (slot < s.flags.size())
                {
                    UnitTurnFlags const& f = s.flags[slot];
                    out += std::format(" flags={}{}{}{}{}",
                                       f.moved ? "M" : "-", f.fled ? "F" : "-", f.shot ? "S" : "-",
                                       f.charged ? "C" : "-", f.fought ? "X" : "-");
                }
                out += "\n";
            }
            return out;
        }

        static inline auto Dump(GameImpl const& g) -> std::string
        {
            return Dump(Gather(g));
        }
    };
}

#endif //HEXWAR_INSPECTOR_HPP
