#include "core/MazeBuilder.hpp"

#include <random>
#include <algorithm>
#include <array>

// right, down, left, up
static const int kDx[4] = { 1, 0, -1, 0 };
static const int kDy[4] = { 0, 1, 0, -1 };

MazeBuilder::MazeBuilder(int32_t width, int32_t height, std::optional<int32_t> seed)
{
    if (width <= 0 || height <= 0)
        throw std::invalid_argument(
            "Maze dimensions must be positive, got " + std::to_string(width) + "x" + std::to_string(height));

    maze_.width = width;
    maze_.height = height;
    maze_.seed = seed;

    if (seed)
        rng_.seed(static_cast<uint32_t>(*seed));
    else
        rng_.seed(std::random_device{}());
}

const Maze& MazeBuilder::Build()
{
    if (maze_.seed)
        rng_.seed(static_cast<uint32_t>(*maze_.seed));

    initWalls_();
    carve_({ 0, 0 });
    return maze_;
}

bool MazeBuilder::IsWallBetween(const Cell& a, const Cell& b) const
{
    return maze_.IsWallBetween(a, b);
}

Maze MazeBuilder::Generate(int32_t width, int32_t height, std::optional<int32_t> seed)
{
    MazeBuilder builder(width, height, seed);
    return builder.Build();
}

void MazeBuilder::initWalls_()
{
    const int32_t W = maze_.width;
    const int32_t H = maze_.height;

    maze_.walls.clear();
    maze_.walls.reserve(static_cast<size_t>(Maze::MaxWallCount(W, H)));

    for (int32_t x = 0; x < W; ++x)
    {
        for (int32_t y = 0; y < H; ++y)
        {
            if (x < W - 1) maze_.walls.insert(Wall({ x, y }, { x + 1, y }));
            if (y < H - 1) maze_.walls.insert(Wall({ x, y }, { x, y + 1 }));
        }
    }
}

void MazeBuilder::carve_(const Cell& origin)
{
    const int32_t W = maze_.width;

    struct Frame
    {
        Cell cell;
        std::array<int, 4> dirs;
        int next;
    };

    std::vector<uint8_t> visited((size_t)W * (size_t)maze_.height, 0);
    auto key = [&](const Cell& c) {
        return (size_t)c.y * (size_t)W + (size_t)c.x;
    };

    // 进入格子时标记已访问并打乱方向，与递归版本的顺序一致
    auto enter = [&](const Cell& c) {
        visited[key(c)] = 1;
        Frame f{ c, { 0, 1, 2, 3 }, 0 };
        std::shuffle(f.dirs.begin(), f.dirs.end(), rng_);
        return f;
    };

    std::vector<Frame> st;
    st.reserve(visited.size());
    st.push_back(enter(origin));

    while (!st.empty())
    {
        Frame& top = st.back();
        if (top.next >= 4)
        {
            st.pop_back();
            continue;
        }

        const int dir = top.dirs[top.next++];
        const Cell cur = top.cell;
        const Cell nxt{ cur.x + kDx[dir], cur.y + kDy[dir] };

        if (!maze_.InBounds(nxt)) continue;
        if (visited[key(nxt)]) continue;

        maze_.walls.erase(Wall(cur, nxt));
        st.push_back(enter(nxt));
    }
}
