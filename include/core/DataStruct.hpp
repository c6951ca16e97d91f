#pragma once
#include "core/Common.hpp"

#include <unordered_set>

struct Cell
{
    int32_t x;
    int32_t y;

    bool operator==(const Cell& other) const
    {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Cell& other) const
    {
        return !(*this == other);
    }

    // x 优先，再比较 y
    bool operator<(const Cell& other) const
    {
        if (x != other.x) return x < other.x;
        return y < other.y;
    }
};

struct CellHash
{
    size_t operator()(const Cell& c) const
    {
        const uint64_t k = (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32)
                         | static_cast<uint32_t>(c.y);
        return std::hash<uint64_t>()(k);
    }
};

// 64-bit so cells at opposite ends of the int32 range do not overflow
inline int64_t ManhattanDistance(const Cell& a, const Cell& b)
{
    return std::abs((int64_t)a.x - b.x) + std::abs((int64_t)a.y - b.y);
}

inline bool IsAdjacent(const Cell& a, const Cell& b)
{
    return ManhattanDistance(a, b) == 1;
}

// Wall between two grid-adjacent cells, stored with a < b.
struct Wall
{
    Cell a;
    Cell b;

    Wall(const Cell& p, const Cell& q)
        : a(q < p ? q : p), b(q < p ? p : q)
    {
        if (!IsAdjacent(p, q))
            throw std::invalid_argument("Cells must be adjacent");
    }

    bool operator==(const Wall& other) const
    {
        return a == other.a && b == other.b;
    }

    bool operator<(const Wall& other) const
    {
        if (a != other.a) return a < other.a;
        return b < other.b;
    }
};

struct WallHash
{
    size_t operator()(const Wall& w) const
    {
        const size_t h1 = CellHash()(w.a);
        const size_t h2 = CellHash()(w.b);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

using WallSet = std::unordered_set<Wall, WallHash>;

struct Maze
{
    int32_t width{};
    int32_t height{};
    std::optional<int32_t> seed{};
    WallSet walls{};

    bool InBounds(int32_t x, int32_t y) const
    {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    bool InBounds(const Cell& c) const { return InBounds(c.x, c.y); }

    // Wall() rejects non-adjacent pairs with a shorter message than IsWallBetween.
    bool HasWall(const Cell& a, const Cell& b) const;

    // Throws std::invalid_argument when a and b are not adjacent.
    bool IsWallBetween(const Cell& a, const Cell& b) const;

    // Traversable in-bounds neighbours of c.
    std::vector<Cell> Passages(const Cell& c) const;

    std::vector<Wall> SortedWalls() const;

    static int64_t MaxWallCount(int32_t width, int32_t height)
    {
        return 2LL * width * height - width - height;
    }
};

std::string ToString(const Cell& c);
