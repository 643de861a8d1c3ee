//
// LineOfSight.cpp
//

#include <gtest/gtest.h>
#include <vector>

#include "../core/Board.hpp"
#include "../core/LineOfSight.hpp"
#include "../core/Util.hpp"

using namespace hexwar::core;

namespace
{
    auto MakeBoard(std::vector<Hex> const& walls) -> Board
    {
        return Board{25, 21, std::span<Hex const>{walls}};
    }
}

TEST(Line_Of_Sight, Clear_Line_Is_Visible)
{
    Board const board = MakeBoard({});
    util::HexMask const none{board};
    EXPECT_TRUE(los::HasLineOfSight({9, 12}, {3, 9}, board, none));
    EXPECT_TRUE(los::HasLineOfSight({5, 10}, {5, 2}, board, none));
}

TEST(Line_Of_Sight, Interior_Wall_Blocks)
{
    Board const board = MakeBoard({{6, 11}});
    util::HexMask const none{board};
    EXPECT_FALSE(los::HasLineOfSight({9, 12}, {3, 9}, board, none));
    EXPECT_FALSE(los::HasLineOfSight({3, 9}, {9, 12}, board, none));
}

TEST(Line_Of_Sight, Blocking_Unit_Blocks_Only_In_Between)
{
    Board const board = MakeBoard({});
    util::HexMask blockers{board};
    blockers.Set({5, 10});
    EXPECT_FALSE(los::HasLineOfSight({9, 12}, {3, 9}, board, blockers));

    // A blocker standing on an endpoint does not hide itself or its target.
    util::HexMask at_end{board};
    at_end.Set({3, 9});
    at_end.Set({9, 12});
    EXPECT_TRUE(los::HasLineOfSight({9, 12}, {3, 9}, board, at_end));
}

TEST(Line_Of_Sight, Adjacent_Hexes_Always_See)
{
    Board const board = MakeBoard({{4, 3}, {5, 3}, {5, 4}, {4, 5}, {3, 4}, {3, 3}});
    util::HexMask blockers{board};
    for (Hex const& n : std::vector<Hex>{{4, 3}, {5, 3}}) blockers.Set(n);

    EXPECT_TRUE(los::HasLineOfSight({4, 4}, {4, 4}, board, blockers));
    EXPECT_TRUE(los::HasLineOfSight({4, 4}, {5, 4}, board, blockers));
    EXPECT_FALSE(los::HasLineOfSight({4, 4}, {4, 1}, board, blockers));
}

TEST(Line_Of_Sight, Symmetric_For_Every_Pair)
{
    Board const board = MakeBoard({{4, 3}, {5, 4}, {2, 6}, {7, 7}});
    util::HexMask blockers{board};
    blockers.Set({6, 2});
    blockers.Set({3, 5});

    for (int c1 = 0; c1 < 10; ++c1)
    for (int r1 = 0; r1 < 9; ++r1)
    for (int c2 = 0; c2 < 10; ++c2)
    for (int r2 = 0; r2 < 9; ++r2)
    {
        Hex const a{c1, r1};
        Hex const b{c2, r2};
        EXPECT_EQ(los::HasLineOfSight(a, b, board, blockers), los::HasLineOfSight(b, a, board, blockers));
    }
}
