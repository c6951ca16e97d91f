#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

#include <unordered_set>

struct SearchResult
{
    // empty when end is unreachable from start
    std::optional<std::vector<Cell>> path;
    // cells in the order they were finalized
    std::vector<Cell> exploredOrder;

    bool Found() const { return path.has_value(); }

    // edge count of the path, -1 when not found
    int32_t Steps() const
    {
        return path ? static_cast<int32_t>(path->size()) - 1 : -1;
    }

    std::unordered_set<Cell, CellHash> ExploredSet() const
    {
        return { exploredOrder.begin(), exploredOrder.end() };
    }
};

// A* over the passage graph of a maze, Manhattan heuristic, unit edge cost.
// Equal f-scores pop in Cell order (x, then y).
class PathFinder
{
public:
    explicit PathFinder(Maze maze);
    PathFinder(int32_t width, int32_t height, WallSet walls);

    // Throws std::invalid_argument if start or end lies outside the grid.
    SearchResult FindPath(const Cell& start, const Cell& end) const;

    const Maze& maze() const { return maze_; }

private:
    Maze maze_;
};
