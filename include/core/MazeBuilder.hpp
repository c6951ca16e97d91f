#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

#include <random>

// Perfect maze generator: randomized depth-first carving from (0,0).
class MazeBuilder
{
public:
    // Throws std::invalid_argument for non-positive dimensions.
    MazeBuilder(int32_t width, int32_t height, std::optional<int32_t> seed = std::nullopt);

    // Rebuilds from the fully walled grid. With a seed the result is identical on every call.
    const Maze& Build();

    // Queries the last built maze; throws std::invalid_argument for non-adjacent cells.
    bool IsWallBetween(const Cell& a, const Cell& b) const;

    const Maze& maze() const { return maze_; }

    static Maze Generate(int32_t width, int32_t height, std::optional<int32_t> seed = std::nullopt);

private:
    void initWalls_();
    void carve_(const Cell& origin);

    Maze maze_{};
    std::mt19937 rng_;
};
