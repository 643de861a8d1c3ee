//
// Reachability.hpp
//

#ifndef HEXWAR_REACHABILITY_HPP
#define HEXWAR_REACHABILITY_HPP

#include <optional>
#include <span>
#include <vector>
#include "Board.hpp"
#include "State.hpp"
#include "Util.hpp"

namespace hexwar::core::reach
{
    // Everything the BFS is allowed to look at. Engine and replay tooling both
    // obtain it from BuildMovementContext so their verdicts cannot drift apart.
    struct MovementContext
    {
        Board const* board{nullptr};
        util::HexMask occupied;        // live units other than the mover
        util::HexMask enemy_adjacent;  // hexes next to a live enemy of the mover
    };

    auto BuildMovementContext(GameState const& state, Unit const& mover) -> MovementContext;

    auto BuildMovementContext(Board const& board,
                              std::span<Hex const> occupied,
                              std::span<Hex const> enemy_positions) -> MovementContext;

    // BFS hop count from start to end, bounded by range. Intermediate hexes must be
    // free of walls, units and enemy adjacency; the end hex is exempt from the last
    // two, the caller owns those terminal rules.
    auto ShortestDistance(Hex start, Hex end, int range, MovementContext const& ctx) -> std::optional<int>;

    auto Reachable(Hex start, Hex end, int range, MovementContext const& ctx) -> bool;

    struct Destination
    {
        Hex hex{};
        int distance{};
        bool terminal_only{false}; // enemy-adjacent: can be entered, not passed through
    };

    // Flood of the same rules; occupied hexes are never reported. Distances match
    // ShortestDistance hex for hex. Order is BFS discovery order.
    auto ReachableHexes(Hex start, int range, MovementContext const& ctx) -> std::vector<Destination>;
}

#endif //HEXWAR_REACHABILITY_HPP
