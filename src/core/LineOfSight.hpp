//
// LineOfSight.hpp
//

#ifndef HEXWAR_LINEOFSIGHT_HPP
#define HEXWAR_LINEOFSIGHT_HPP

#include "Board.hpp"
#include "State.hpp"
#include "Util.hpp"

namespace hexwar::core::los
{
    // Blocked iff an interior hex of Line(from, to) is a wall or a blocker.
    // Endpoints never block, so equal or adjacent hexes always see each other.
    [[nodiscard]]
    auto HasLineOfSight(Hex from, Hex to, Board const& board, util::HexMask const& blockers) -> bool;

    // Live units whose profile blocks sight.
    auto BuildLosBlockers(GameState const& state) -> util::HexMask;
}

#endif //HEXWAR_LINEOFSIGHT_HPP
