//
// Reachability.cpp
//

#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "../core/Board.hpp"
#include "../core/Reachability.hpp"

using namespace hexwar::core;

namespace
{
    auto MakeBoard(std::vector<Hex> const& walls = {}) -> Board
    {
        return Board{25, 21, std::span<Hex const>{walls}};
    }

    auto Context(Board const& board, std::vector<Hex> const& occupied = {}, std::vector<Hex> const& enemies = {})
        -> reach::MovementContext
    {
        return reach::BuildMovementContext(board, std::span<Hex const>{occupied}, std::span<Hex const>{enemies});
    }
}

TEST(Reachability, Open_Board_Distance_Equals_Range_Limit)
{
    Board const board = MakeBoard();
    auto const ctx = Context(board);

    EXPECT_EQ(reach::ShortestDistance({9, 12}, {3, 9}, 6, ctx), 6);
    EXPECT_FALSE(reach::ShortestDistance({9, 12}, {3, 9}, 5, ctx).has_value());
    EXPECT_EQ(reach::ShortestDistance({9, 12}, {9, 12}, 0, ctx), 0);
    EXPECT_FALSE(reach::Reachable({9, 12}, {30, 30}, 40, ctx));
}

TEST(Reachability, Walls_Force_A_Detour)
{
    Board const board = MakeBoard({{8, 12}, {8, 13}, {9, 11}});
    auto const ctx = Context(board);

    for (int range = 5; range <= 8; ++range)
        EXPECT_FALSE(reach::Reachable({9, 12}, {3, 9}, range, ctx)) << "range " << range;
    EXPECT_EQ(reach::ShortestDistance({9, 12}, {3, 9}, 9, ctx), 9);
    EXPECT_EQ(reach::ShortestDistance({9, 12}, {3, 9}, 12, ctx), 9);
}

TEST(Reachability, Distant_Enemy_Leaves_Path_Open)
{
    Board const board = MakeBoard();
    auto const ctx = Context(board, {}, {{9, 7}});
    EXPECT_EQ(reach::ShortestDistance({9, 12}, {3, 9}, 6, ctx), 6);
}

TEST(Reachability, Enemy_Zone_Cannot_Be_Passed_Through)
{
    Board const board = MakeBoard();
    auto const ctx = Context(board, {}, {{3, 10}});
    EXPECT_FALSE(reach::ShortestDistance({9, 12}, {3, 9}, 6, ctx).has_value());
}

TEST(Reachability, End_Hex_Is_Exempt_From_Terminal_Rules)
{
    Board const board = MakeBoard();
    auto const open = Context(board, {}, {{9, 7}});
    auto const ctx = Context(board, {{9, 9}}, {{9, 7}});

    // (9,8) touches the enemy; reaching it is the caller's problem.
    EXPECT_EQ(reach::ShortestDistance({9, 12}, {9, 8}, 6, open), 4);
    EXPECT_EQ(reach::ShortestDistance({9, 12}, {9, 8}, 6, ctx), 5);
    // Occupied end hex still reports a distance.
    EXPECT_EQ(reach::ShortestDistance({9, 12}, {9, 9}, 6, ctx), 3);
    // The enemy's own hex counts as occupied for everything else.
    EXPECT_TRUE(ctx.occupied.Test({9, 7}));
}

TEST(Reachability, Reachability_Grows_With_Range)
{
    Board const board = MakeBoard({{4, 4}, {5, 4}, {6, 5}, {3, 7}, {8, 2}});
    auto const ctx = Context(board, {{6, 8}}, {{9, 9}});
    Hex const start{5, 6};

    for (int col = 0; col < 12; ++col)
    {
        for (int row = 0; row < 12; ++row)
        {
            Hex const h{col, row};
            bool prev = false;
            for (int range = 0; range <= 10; ++range)
            {
                bool const now = reach::Reachable(start, h, range, ctx);
                EXPECT_TRUE(!prev || now) << "lost (" << col << "," << row << ") at range " << range;
                prev = now;
            }
        }
    }
}

TEST(Reachability, Flood_Agrees_With_Point_Queries)
{
    Board const board = MakeBoard({{10, 5}, {11, 5}, {12, 5}, {12, 9}, {12, 10}, {12, 11}});
    std::vector<Hex> const friends{{8, 8}, {9, 8}};
    std::vector<Hex> const enemies{{13, 8}, {8, 12}};
    auto const ctx = Context(board, friends, enemies);
    Hex const start{9, 9};
    int const range = 7;

    std::vector<reach::Destination> const flood = reach::ReachableHexes(start, range, ctx);
    ASSERT_FALSE(flood.empty());

    for (reach::Destination const& d : flood)
    {
        EXPECT_FALSE(ctx.occupied.Test(d.hex));
        EXPECT_EQ(reach::ShortestDistance(start, d.hex, range, ctx), d.distance);
        EXPECT_EQ(d.terminal_only, ctx.enemy_adjacent.Test(d.hex));
    }

    for (int col = 0; col < board.Cols(); ++col)
    {
        for (int row = 0; row < board.Rows(); ++row)
        {
            Hex const h{col, row};
            if (h == start || ctx.occupied.Test(h)) continue;
            bool const listed = std::ranges::any_of(flood, [h](reach::Destination const& d) { return d.hex == h; });
            EXPECT_EQ(listed, reach::Reachable(start, h, range, ctx)) << "(" << col << "," << row << ")";
        }
    }
}
