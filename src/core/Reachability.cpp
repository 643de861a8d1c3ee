//
// Reachability.cpp
//

#include "Reachability.hpp"

#include <utility>
#include "Exception.hpp"
#include "HexGeometry.hpp"

namespace hexwar::core::reach
{
    namespace
    {
        struct Node
        {
            Hex hex;
            int depth;
        };

        auto MarkEnemyAdjacency(util::HexMask& mask, Hex const enemy) -> void
        {
            for (Hex const& n : hex::Neighbors(enemy)) mask.Set(n);
        }
    }

    auto BuildMovementContext(GameState const& state, Unit const& mover) -> MovementContext
    {
        HXW_ASSERT(state.board != nullptr, "Movement context without a board");
        Board const& board = *state.board;

        MovementContext ctx{&board, util::HexMask{board}, util::HexMask{board}};
        for (Unit const& u : state.units)
        {
            if (!u.Alive() || u.id == mover.id) continue;
            ctx.occupied.Set(u.pos);
            if (u.player != mover.player) MarkEnemyAdjacency(ctx.enemy_adjacent, u.pos);
        }
        return ctx;
    }

    auto BuildMovementContext(Board const& board,
                              std::span<Hex const> occupied,
                              std::span<Hex const> enemy_positions) -> MovementContext
    {
        MovementContext ctx{&board, util::HexMask{board}, util::HexMask{board}};
        for (Hex const& h : occupied) ctx.occupied.Set(h);
        for (Hex const& e : enemy_positions)
        {
            ctx.occupied.Set(e);
            MarkEnemyAdjacency(ctx.enemy_adjacent, e);
        }
        return ctx;
    }

    auto ShortestDistance(Hex const start, Hex const end, int const range, MovementContext const& ctx)
        -> std::optional<int>
    {
        HXW_ASSERT(ctx.board != nullptr, "Movement context without a board");
        Board const& board = *ctx.board;

        if (!board.InBounds(start) || !board.InBounds(end)) return std::nullopt;
        if (start == end) return 0;
        if (range <= 0) return std::nullopt;

        util::HexMask visited{board};
        std::vector<Node> queue;
        queue.reserve(64);
        queue.push_back({start, 0});
        visited.Set(start);

        for (std::size_t head{}; head < queue.size(); ++head)
        {
            Node const cur = queue[head];
            if (cur.depth >= range) continue;

            for (Hex const& n : hex::Neighbors(cur.hex))
            {
                if (visited.Test(n)) continue;
                if (!board.InBounds(n)) continue;
                if (board.IsWall(n)) continue;

                bool const is_end = (n == end);
                if (!is_end && ctx.occupied.Test(n)) continue;
                if (!is_end && ctx.enemy_adjacent.Test(n)) continue;

                if (is_end) return cur.depth + 1;

                visited.Set(n);
                queue.push_back({n, cur.depth + 1});
            }
        }
        return std::nullopt;
    }

    auto Reachable(Hex const start, Hex const end, int const range, MovementContext const& ctx) -> bool
    {
        return ShortestDistance(start, end, range, ctx).has_value();
    }

    auto ReachableHexes(Hex const start, int const range, MovementContext const& ctx) -> std::vector<Destination>
    {
        HXW_ASSERT(ctx.board != nullptr, "Movement context without a board");
        Board const& board = *ctx.board;

        std::vector<Destination> out;
        if (!board.InBounds(start) || range <= 0) return out;

        util::HexMask visited{board};
        std::vector<Node> queue;
        queue.reserve(64);
        queue.push_back({start, 0});
        visited.Set(start);

        for (std::size_t head{}; head < queue.size(); ++head)
        {
            Node const cur = queue[head];
            if (cur.depth >= range) continue;

            for (Hex const& n : hex::Neighbors(cur.hex))
            {
                if (visited.Test(n)) continue;
                if (!board.InBounds(n)) continue;
                if (board.IsWall(n)) continue;
                if (ctx.occupied.Test(n)) continue;

                visited.Set(n);
                if (ctx.enemy_adjacent.Test(n))
                {
                    out.push_back({n, cur.depth + 1, true});
                    continue;
                }
                out.push_back({n, cur.depth + 1, false});
                queue.push_back({n, cur.depth + 1});
            }
        }
        return out;
    }
}
