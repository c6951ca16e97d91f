#include "core/DataStruct.hpp"

static const int kDx[4] = { 1, -1, 0, 0 };
static const int kDy[4] = { 0, 0, 1, -1 };

bool Maze::HasWall(const Cell& a, const Cell& b) const
{
    return walls.count(Wall(a, b)) != 0;
}

bool Maze::IsWallBetween(const Cell& a, const Cell& b) const
{
    if (!IsAdjacent(a, b))
        throw std::invalid_argument("Cells must be adjacent: " + ToString(a) + " and " + ToString(b));

    return HasWall(a, b);
}

std::vector<Cell> Maze::Passages(const Cell& c) const
{
    std::vector<Cell> out;
    out.reserve(4);

    for (int i = 0; i < 4; ++i)
    {
        const Cell n{ c.x + kDx[i], c.y + kDy[i] };
        if (!InBounds(n)) continue;
        if (HasWall(c, n)) continue;
        out.push_back(n);
    }
    return out;
}

std::vector<Wall> Maze::SortedWalls() const
{
    std::vector<Wall> out(walls.begin(), walls.end());
    std::sort(out.begin(), out.end());
    return out;
}

std::string ToString(const Cell& c)
{
    return "(" + std::to_string(c.x) + ", " + std::to_string(c.y) + ")";
}
