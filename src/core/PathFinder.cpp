#include "core/PathFinder.hpp"

#include <queue>
#include <unordered_map>

static int Heuristic(const Cell& a, const Cell& b)
{
    // 曼哈顿距离
    return (int)ManhattanDistance(a, b);
}

PathFinder::PathFinder(Maze maze)
    : maze_(std::move(maze))
{
    if (maze_.width <= 0 || maze_.height <= 0)
        throw std::invalid_argument("Maze dimensions must be positive");
}

PathFinder::PathFinder(int32_t width, int32_t height, WallSet walls)
    : PathFinder(Maze{ width, height, std::nullopt, std::move(walls) })
{
}

 //最短路径 使用A* 和 曼哈顿启发算法
SearchResult PathFinder::FindPath(const Cell& start, const Cell& end) const
{
    if (!maze_.InBounds(start))
        throw std::invalid_argument("Start " + ToString(start) + " is outside the maze");
    if (!maze_.InBounds(end))
        throw std::invalid_argument("End " + ToString(end) + " is outside the maze");

    struct Node {
        Cell p;
        int g;
        int f;
    };

    auto cmp = [](const Node& a, const Node& b) {
        if (a.f != b.f) return a.f > b.f;
        return b.p < a.p;
    };

    std::priority_queue<Node, std::vector<Node>, decltype(cmp)> openSet(cmp);
    std::unordered_map<int64_t, Cell> cameFrom;
    std::unordered_map<int64_t, int> costSoFar;
    std::vector<uint8_t> finalized((size_t)maze_.width * (size_t)maze_.height, 0);

    auto key = [&](const Cell& c) {
        return (int64_t)c.y * maze_.width + c.x;
    };

    openSet.push({ start, 0, Heuristic(start, end) });
    costSoFar[key(start)] = 0;

    SearchResult result;

    while (!openSet.empty())
    {
        Node current = openSet.top();
        openSet.pop();

        // 重复入队的旧节点直接跳过
        const int64_t ck = key(current.p);
        if (finalized[(size_t)ck]) continue;
        finalized[(size_t)ck] = 1;

        result.exploredOrder.push_back(current.p);

        if (current.p == end)
        {
            std::vector<Cell> path;
            Cell cur = end;
            while (cur != start)
            {
                path.push_back(cur);
                cur = cameFrom.at(key(cur));
            }
            path.push_back(start);
            std::reverse(path.begin(), path.end());
            result.path = std::move(path);
            break;
        }

        for (const Cell& next : maze_.Passages(current.p))
        {
            const int64_t k = key(next);
            if (finalized[(size_t)k]) continue;

            const int newCost = current.g + 1;
            auto it = costSoFar.find(k);
            if (it == costSoFar.end() || newCost < it->second)
            {
                costSoFar[k] = newCost;
                cameFrom[k] = current.p;
                openSet.push({ next, newCost, newCost + Heuristic(next, end) });
            }
        }
    }

    return result;
}
