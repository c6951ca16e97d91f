// tests/test_maze_text.cpp (doctest)

#include <doctest/doctest.h>

#include "core/MazeText.hpp"
#include "core/PathFinder.hpp"

namespace mazesearch_text_test {

Maze ThreeByTwo()
{
    Maze m{ 3, 2, std::nullopt, {} };
    m.walls = { Wall({ 0, 0 }, { 1, 0 }), Wall({ 1, 1 }, { 2, 1 }), Wall({ 2, 0 }, { 2, 1 }) };
    return m;
}

} // namespace mazesearch_text_test

using mazesearch_text_test::ThreeByTwo;

TEST_CASE("MazeText/PlainMaze")
{
    const std::string expected =
        "+---+---+---+\n"
        "|   |       |\n"
        "+   +   +---+\n"
        "|       |   |\n"
        "+---+---+---+\n";

    CHECK(MazeText::Render(ThreeByTwo()) == expected);
}

TEST_CASE("MazeText/PathMarkers")
{
    const Maze m = ThreeByTwo();
    const SearchResult r = PathFinder(m).FindPath({ 0, 0 }, { 2, 0 });
    REQUIRE(r.Found());

    const std::string expected =
        "+---+---+---+\n"
        "| S | *   E |\n"
        "+   +   +---+\n"
        "| *   * |   |\n"
        "+---+---+---+\n";

    CHECK(MazeText::Render(m, r, true) == expected);
    CHECK(MazeText::Render(m, r, false) == expected);
}

TEST_CASE("MazeText/ExploredCellsOnlyWhenAsked")
{
    const Maze m{ 3, 1, std::nullopt, { Wall({ 1, 0 }, { 2, 0 }) } };
    const SearchResult r = PathFinder(m).FindPath({ 0, 0 }, { 2, 0 });
    REQUIRE_FALSE(r.Found());

    CHECK(MazeText::Render(m, r, true) ==
          "+---+---+---+\n"
          "| .   . |   |\n"
          "+---+---+---+\n");

    CHECK(MazeText::Render(m, r, false) ==
          "+---+---+---+\n"
          "|       |   |\n"
          "+---+---+---+\n");
}

TEST_CASE("MazeText/FiveByFiveWithExploration")
{
    Maze m{ 5, 5, std::nullopt, {} };
    m.walls = {
        Wall({ 0, 1 }, { 1, 1 }), Wall({ 1, 1 }, { 2, 1 }), Wall({ 2, 1 }, { 3, 1 }),
        Wall({ 3, 1 }, { 3, 2 }), Wall({ 3, 2 }, { 3, 3 }), Wall({ 1, 3 }, { 2, 3 }),
        Wall({ 2, 3 }, { 3, 3 }),
    };

    const SearchResult r = PathFinder(m).FindPath({ 0, 0 }, { 4, 4 });
    REQUIRE(r.Found());

    const std::string expected =
        "+---+---+---+---+---+\n"
        "| S   .   .   .   . |\n"
        "+   +   +   +   +   +\n"
        "| * | . | . | .   . |\n"
        "+   +   +   +---+   +\n"
        "| *   .   .   .   . |\n"
        "+   +   +   +---+   +\n"
        "| *   . | . |     . |\n"
        "+   +   +   +   +   +\n"
        "| *   *   *   *   E |\n"
        "+---+---+---+---+---+\n";

    CHECK(MazeText::Render(m, r, true) == expected);
}

TEST_CASE("MazeText/SingleCell")
{
    const Maze m{ 1, 1, std::nullopt, {} };
    const SearchResult r = PathFinder(m).FindPath({ 0, 0 }, { 0, 0 });

    // a one-cell path is both start and end; the start marker wins
    CHECK(MazeText::Render(m, r, false) ==
          "+---+\n"
          "| S |\n"
          "+---+\n");
}

TEST_CASE("MazeText/FormatCells")
{
    CHECK(MazeText::FormatCells({}) == "");
    CHECK(MazeText::FormatCells({ { 0, 0 }, { 1, 0 }, { 1, 2 } }) == "(0, 0) (1, 0) (1, 2)");
}
