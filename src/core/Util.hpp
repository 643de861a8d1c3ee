//
// Util.hpp
//

#ifndef HEXWAR_UTIL_HPP
#define HEXWAR_UTIL_HPP

#include <algorithm>
#include <vector>
#include "Board.hpp"

namespace hexwar::core::util
{
    // Dense per-cell flag set over one board. Out-of-bounds hexes read as unset
    // and are ignored on write.
    class HexMask
    {
    public:
        HexMask() = default;
        explicit HexMask(Board const& board) :
            board_(&board),
            bits_(board.CellCount(), 0) {}

        auto Set(Hex const h) -> void
        {
            if (board_ && board_->InBounds(h)) bits_[board_->Index(h)] = 1;
        }

        auto Reset(Hex const h) -> void
        {
            if (board_ && board_->InBounds(h)) bits_[board_->Index(h)] = 0;
        }

        [[nodiscard]]
        auto Test(Hex const h) const -> bool
        {
            return board_ && board_->InBounds(h) && bits_[board_->Index(h)] != 0;
        }

        // Returns true if the hex was already set.
        auto TestAndSet(Hex const h) -> bool
        {
            bool const was = Test(h);
            Set(h);
            return was;
        }

        auto Clear() -> void { std::ranges::fill(bits_, std::uint8_t{0}); }

        [[nodiscard]]
        auto Count() const -> std::size_t
        {
            return static_cast<std::size_t>(std::ranges::count(bits_, std::uint8_t{1}));
        }

    private:
        Board const* board_{nullptr};
        std::vector<std::uint8_t> bits_;
    };
}

#endif //HEXWAR_UTIL_HPP
