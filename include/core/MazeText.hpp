#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/PathFinder.hpp"

// ASCII rendering:
//   +---+---+
//   | S   * |
//   +   +---+
// S/E mark the first/last path cell, * the rest of the path, . explored cells.
class MazeText
{
public:
    static std::string Render(const Maze& maze);
    static std::string Render(const Maze& maze, const SearchResult& result, bool showExplored);

    // "(x, y) (x, y) ..."
    static std::string FormatCells(const std::vector<Cell>& cells);
};
