// tests/test_data_struct.cpp (doctest)

#include <doctest/doctest.h>

#include "core/DataStruct.hpp"

#include <limits>

TEST_CASE("DataStruct/CellOrderIsXThenY")
{
    CHECK(Cell{ 0, 5 } < Cell{ 1, 0 });
    CHECK(Cell{ 2, 1 } < Cell{ 2, 3 });
    CHECK_FALSE(Cell{ 2, 3 } < Cell{ 2, 3 });
    CHECK(Cell{ 1, 2 } == Cell{ 1, 2 });
    CHECK(Cell{ 1, 2 } != Cell{ 2, 1 });
}

TEST_CASE("DataStruct/WallIsCanonical")
{
    const Wall w1({ 3, 2 }, { 2, 2 });
    const Wall w2({ 2, 2 }, { 3, 2 });

    CHECK(w1 == w2);
    CHECK(w1.a == Cell{ 2, 2 });
    CHECK(w1.b == Cell{ 3, 2 });
    CHECK(WallHash()(w1) == WallHash()(w2));

    WallSet set;
    set.insert(w1);
    CHECK(set.count(Wall({ 2, 2 }, { 3, 2 })) == 1);
    CHECK(set.size() == 1);
}

TEST_CASE("DataStruct/WallRejectsNonAdjacentCells")
{
    CHECK_THROWS_AS(Wall({ 0, 0 }, { 1, 1 }), std::invalid_argument);
    CHECK_THROWS_AS(Wall({ 0, 0 }, { 0, 0 }), std::invalid_argument);
    CHECK_THROWS_AS(Wall({ 0, 0 }, { 2, 0 }), std::invalid_argument);
}

TEST_CASE("DataStruct/FarApartCellsAreNotAdjacent")
{
    const int32_t kMax = std::numeric_limits<int32_t>::max();
    const int32_t kMin = std::numeric_limits<int32_t>::min();

    CHECK(ManhattanDistance({ kMax, 0 }, { -1, 0 }) == 2147483648LL);
    CHECK(ManhattanDistance({ kMin, kMin }, { kMax, kMax }) == 2LL * 4294967295LL);
    CHECK_FALSE(IsAdjacent({ kMax, 0 }, { -1, 0 }));
    CHECK_FALSE(IsAdjacent({ kMin, 0 }, { kMax, 0 }));

    const Maze m{ 2, 2, std::nullopt, {} };
    CHECK_THROWS_AS(m.IsWallBetween({ kMax, 0 }, { -1, 0 }), std::invalid_argument);
    CHECK_THROWS_AS(m.IsWallBetween({ 0, kMin }, { 0, kMax }), std::invalid_argument);
    CHECK_THROWS_AS(Wall({ kMax, kMax }, { kMin, kMin }), std::invalid_argument);
}

TEST_CASE("DataStruct/IsWallBetween")
{
    Maze m{ 2, 2, std::nullopt, {} };
    m.walls.insert(Wall({ 0, 0 }, { 1, 0 }));

    CHECK(m.IsWallBetween({ 0, 0 }, { 1, 0 }));
    CHECK(m.IsWallBetween({ 1, 0 }, { 0, 0 }));
    CHECK_FALSE(m.IsWallBetween({ 0, 0 }, { 0, 1 }));
    CHECK_THROWS_AS(m.IsWallBetween({ 0, 0 }, { 1, 1 }), std::invalid_argument);
}

TEST_CASE("DataStruct/PassagesStayInBounds")
{
    Maze m{ 3, 3, std::nullopt, {} };
    m.walls.insert(Wall({ 1, 1 }, { 2, 1 }));

    CHECK(m.Passages({ 0, 0 }).size() == 2);
    CHECK(m.Passages({ 1, 1 }).size() == 3);
    CHECK(m.Passages({ 2, 2 }).size() == 2);

    for (const Cell& c : m.Passages({ 1, 1 }))
        CHECK(c != Cell{ 2, 1 });
}

TEST_CASE("DataStruct/SortedWalls")
{
    Maze m{ 3, 3, std::nullopt, {} };
    m.walls.insert(Wall({ 2, 1 }, { 2, 2 }));
    m.walls.insert(Wall({ 0, 0 }, { 1, 0 }));
    m.walls.insert(Wall({ 0, 1 }, { 0, 0 }));

    const std::vector<Wall> sorted = m.SortedWalls();
    REQUIRE(sorted.size() == 3);
    CHECK(sorted[0] == Wall({ 0, 0 }, { 0, 1 }));
    CHECK(sorted[1] == Wall({ 0, 0 }, { 1, 0 }));
    CHECK(sorted[2] == Wall({ 2, 1 }, { 2, 2 }));
}

TEST_CASE("DataStruct/MaxWallCount")
{
    CHECK(Maze::MaxWallCount(1, 1) == 0);
    CHECK(Maze::MaxWallCount(1, 5) == 4);
    CHECK(Maze::MaxWallCount(2, 2) == 4);
    CHECK(Maze::MaxWallCount(5, 5) == 40);
    CHECK(Maze::MaxWallCount(10, 3) == 47);
}

TEST_CASE("DataStruct/CellToString")
{
    CHECK(ToString(Cell{ 3, 4 }) == "(3, 4)");
    CHECK(ToString(Cell{ -1, 0 }) == "(-1, 0)");
}
