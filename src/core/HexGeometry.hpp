//
// HexGeometry.hpp
//

#ifndef HEXWAR_HEXGEOMETRY_HPP
#define HEXWAR_HEXGEOMETRY_HPP

#include <array>
#include <vector>
#include "Types.hpp"

// Odd-q offset layout: odd columns are shifted half a hex down.
namespace hexwar::core::hex
{
    struct Cube
    {
        int x{};
        int y{};
        int z{};

        auto operator==(Cube const&) const -> bool = default;
    };

    inline constexpr std::size_t NeighborCount = 6;

    auto ToCube(Hex h) noexcept -> Cube;
    auto FromCube(Cube c) noexcept -> Hex;

    auto Distance(Hex a, Hex b) noexcept -> int;
    auto Adjacent(Hex a, Hex b) noexcept -> bool;

    // Fixed order N, NE, SE, S, SW, NW. May contain out-of-bounds hexes.
    auto Neighbors(Hex h) noexcept -> std::array<Hex, NeighborCount>;

    // Distance(a,b)+1 hexes from a to b inclusive. Exact integer interpolation;
    // Line(b,a) is Line(a,b) reversed.
    auto Line(Hex a, Hex b) -> std::vector<Hex>;
}

#endif //HEXWAR_HEXGEOMETRY_HPP
