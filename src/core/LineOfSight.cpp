//
// LineOfSight.cpp
//

#include "LineOfSight.hpp"

#include "Exception.hpp"
#include "HexGeometry.hpp"

namespace hexwar::core::los
{
    auto HasLineOfSight(Hex const from, Hex const to, Board const& board, util::HexMask const& blockers) -> bool
    {
        if (hex::Distance(from, to) <= 1) return true;

        std::vector<Hex> const line = hex::Line(from, to);
        for (std::size_t i = 1; i + 1 < line.size(); ++i)
        {
            if (board.IsWall(line[i]) || blockers.Test(line[i])) return false;
        }
        return true;
    }

    auto BuildLosBlockers(GameState const& state) -> util::HexMask
    {
        HXW_ASSERT(state.board != nullptr, "LoS blockers without a board");
        util::HexMask mask{*state.board};
        for (Unit const& u : state.units)
        {
            if (u.Alive() && u.profile && u.profile->blocks_los) mask.Set(u.pos);
        }
        return mask;
    }
}
