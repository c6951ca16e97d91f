#include "core/MazeText.hpp"

std::string MazeText::Render(const Maze& maze)
{
    return Render(maze, SearchResult{}, false);
}

std::string MazeText::Render(const Maze& maze, const SearchResult& result, bool showExplored)
{
    const int32_t W = maze.width;
    const int32_t H = maze.height;

    std::unordered_set<Cell, CellHash> onPath;
    if (result.path)
        onPath.insert(result.path->begin(), result.path->end());

    std::unordered_set<Cell, CellHash> explored;
    if (showExplored)
        explored = result.ExploredSet();

    std::ostringstream oss;

    oss << "+";
    for (int32_t x = 0; x < W; ++x) oss << "---+";
    oss << "\n";

    for (int32_t y = 0; y < H; ++y)
    {
        std::string row = "|";
        std::string bottom = "+";

        for (int32_t x = 0; x < W; ++x)
        {
            const Cell c{ x, y };

            if (onPath.count(c))
            {
                if (c == result.path->front())     row += " S ";
                else if (c == result.path->back()) row += " E ";
                else                               row += " * ";
            }
            else if (explored.count(c))
            {
                row += " . ";
            }
            else
            {
                row += "   ";
            }

            // right side: boundary or interior wall
            if (x == W - 1 || maze.HasWall(c, { x + 1, y })) row += "|";
            else                                              row += " ";

            if (y == H - 1 || maze.HasWall(c, { x, y + 1 })) bottom += "---+";
            else                                               bottom += "   +";
        }

        oss << row << "\n" << bottom << "\n";
    }

    return oss.str();
}

std::string MazeText::FormatCells(const std::vector<Cell>& cells)
{
    std::string out;
    for (size_t i = 0; i < cells.size(); ++i)
    {
        if (i) out += " ";
        out += ToString(cells[i]);
    }
    return out;
}
