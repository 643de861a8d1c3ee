//
// Board.hpp
//

#ifndef HEXWAR_BOARD_HPP
#define HEXWAR_BOARD_HPP

#include <span>
#include <vector>
#include "Types.hpp"

namespace hexwar::core
{
    // Immutable grid geometry. Walls are validated against bounds on construction
    // and nothing can change them afterwards.
    class Board
    {
    public:
        Board() = delete;
        Board(int cols, int rows, std::span<Hex const> walls);

        auto Cols() const noexcept -> int { return cols_; }
        auto Rows() const noexcept -> int { return rows_; }
        auto CellCount() const noexcept -> std::size_t { return static_cast<std::size_t>(cols_) * rows_; }

        auto InBounds(Hex const h) const noexcept -> bool
        {
            return h.col >= 0 && h.row >= 0 && h.col < cols_ && h.row < rows_;
        }

        // Caller guarantees InBounds(h).
        auto Index(Hex const h) const noexcept -> std::size_t
        {
            return static_cast<std::size_t>(h.row) * cols_ + static_cast<std::size_t>(h.col);
        }

        auto IsWall(Hex const h) const noexcept -> bool
        {
            return InBounds(h) && wall_mask_[Index(h)] != 0;
        }

        // Sorted, de-duplicated.
        auto Walls() const noexcept -> std::vector<Hex> const& { return walls_; }

    private:
        int cols_;
        int rows_;
        std::vector<std::uint8_t> wall_mask_;
        std::vector<Hex> walls_;
    };

    using BoardCSP = std::shared_ptr<Board const>;
}

#endif //HEXWAR_BOARD_HPP
