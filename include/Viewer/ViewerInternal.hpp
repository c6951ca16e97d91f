#pragma once
#include "core/Common.hpp"
#include "Viewer/core.hpp"

// glad must come before GLFW so GLFW does not pull in the system GL header
#include <glad/glad.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

struct Vertex
{
    float x, y;
    float r, g, b, a;
};

struct Color
{
    float r, g, b, a;
};

// 向顶点数组添加一个矩形
inline void PushRect(std::vector<Vertex>& out,
                     float x0, float y0, float x1, float y1,
                     const Color& c)
{
    out.push_back({x0, y0, c.r, c.g, c.b, c.a});
    out.push_back({x1, y0, c.r, c.g, c.b, c.a});
    out.push_back({x1, y1, c.r, c.g, c.b, c.a});

    out.push_back({x0, y0, c.r, c.g, c.b, c.a});
    out.push_back({x1, y1, c.r, c.g, c.b, c.a});
    out.push_back({x0, y1, c.r, c.g, c.b, c.a});
}

inline void PushRect(std::vector<Vertex>& out, const Rect& rc, const Color& c)
{
    PushRect(out, rc.x0, rc.y0, rc.x1, rc.y1, c);
}

// Maze placement inside the square viewport, in NDC.
// Cell (x, y) covers [startX + x*cell, startX + (x+1)*cell] x [startY - (y+1)*cell, startY - y*cell].
struct MazeGeometry
{
    float cell;
    float startX;
    float startY;
};

inline MazeGeometry ComputeMazeGeometry(int cols, int rows)
{
    const float usable = 1.9f;
    const float cell = usable / (float)std::max(1, std::max(rows, cols));

    MazeGeometry g{};
    g.cell = cell;
    g.startX = -cell * (float)cols * 0.5f;
    g.startY =  cell * (float)rows * 0.5f;
    return g;
}
