//
// HexGeometry.cpp
//

#include "HexGeometry.hpp"

#include <algorithm>
#include <cstdlib>

namespace hexwar::core::hex
{
    namespace
    {
        constexpr std::array<Hex, NeighborCount> EvenColOffsets{{
            {0, -1}, {1, -1}, {1, 0}, {0, 1}, {-1, 0}, {-1, -1}
        }};
        constexpr std::array<Hex, NeighborCount> OddColOffsets{{
            {0, -1}, {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}
        }};

        // den > 0
        auto FloorDiv(std::int64_t const num, std::int64_t const den) -> std::int64_t
        {
            std::int64_t q = num / den;
            if ((num % den) != 0 && num < 0) --q;
            return q;
        }

        // num/den rounded to nearest, halves towards +inf.
        auto RoundHalfUp(std::int64_t const num, std::int64_t const den) -> std::int64_t
        {
            return FloorDiv(2 * num + den, 2 * den);
        }

        auto LineOrdered(Hex const a, Hex const b) -> std::vector<Hex>
        {
            int const n = Distance(a, b);
            std::vector<Hex> out;
            out.reserve(static_cast<std::size_t>(n) + 1);
            if (n == 0)
            {
                out.push_back(a);
                return out;
            }

            Cube const ca = ToCube(a);
            Cube const cb = ToCube(b);

            // Everything is scaled by n so the lerp stays in integers.
            for (int i = 0; i <= n; ++i)
            {
                std::int64_t const sx = std::int64_t{ca.x} * n + std::int64_t{i} * (cb.x - ca.x);
                std::int64_t const sy = std::int64_t{ca.y} * n + std::int64_t{i} * (cb.y - ca.y);
                std::int64_t const sz = std::int64_t{ca.z} * n + std::int64_t{i} * (cb.z - ca.z);

                std::int64_t rx = RoundHalfUp(sx, n);
                std::int64_t ry = RoundHalfUp(sy, n);
                std::int64_t rz = RoundHalfUp(sz, n);

                std::int64_t const dx = std::llabs(rx * n - sx);
                std::int64_t const dy = std::llabs(ry * n - sy);
                std::int64_t const dz = std::llabs(rz * n - sz);

                if (dx > dy && dx > dz) rx = -ry - rz;
                else if (dy > dz) ry = -rx - rz;
                else rz = -rx - ry;

                out.push_back(FromCube(Cube{static_cast<int>(rx), static_cast<int>(ry), static_cast<int>(rz)}));
            }
            return out;
        }
    }

    auto ToCube(Hex const h) noexcept -> Cube
    {
        int const x = h.col;
        int const z = h.row - (h.col - (h.col & 1)) / 2;
        return Cube{x, -x - z, z};
    }

    auto FromCube(Cube const c) noexcept -> Hex
    {
        return Hex{c.x, c.z + (c.x - (c.x & 1)) / 2};
    }

    auto Distance(Hex const a, Hex const b) noexcept -> int
    {
        Cube const ca = ToCube(a);
        Cube const cb = ToCube(b);
        return std::max({std::abs(ca.x - cb.x), std::abs(ca.y - cb.y), std::abs(ca.z - cb.z)});
    }

    auto Adjacent(Hex const a, Hex const b) noexcept -> bool
    {
        return Distance(a, b) == 1;
    }

    auto Neighbors(Hex const h) noexcept -> std::array<Hex, NeighborCount>
    {
        auto const& offsets = (h.col & 1) ? OddColOffsets : EvenColOffsets;
        std::array<Hex, NeighborCount> out{};
        for (std::size_t i{}; i < NeighborCount; ++i)
        {
            out[i] = Hex{h.col + offsets[i].col, h.row + offsets[i].row};
        }
        return out;
    }

    auto Line(Hex const a, Hex const b) -> std::vector<Hex>
    {
        if (b < a)
        {
            std::vector<Hex> out = LineOrdered(b, a);
            std::ranges::reverse(out);
            return out;
        }
        return LineOrdered(a, b);
    }
}
