//
// Board.cpp
//

#include "Board.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"

namespace hexwar::core
{
    Board::Board(int const cols, int const rows, std::span<Hex const> walls) :
        cols_(cols),
        rows_(rows)
    {
        using error::Code;
        if (cols_ <= 0 || rows_ <= 0)
            HXW_THROW(Code::Configuration, std::format("Board dimensions must be positive, got {}x{}", cols_, rows_));

        wall_mask_.assign(CellCount(), 0);
        walls_.reserve(walls.size());

        for (Hex const& w : walls)
        {
            if (!InBounds(w))
                HXW_THROW(Code::Configuration,
                          std::format("Wall ({},{}) outside {}x{} board", w.col, w.row, cols_, rows_));
            if (wall_mask_[Index(w)] != 0) continue;
            wall_mask_[Index(w)] = 1;
            walls_.push_back(w);
        }
        std::ranges::sort(walls_);
    }
}
