#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>
#include <cmath>

namespace
{
    const Color kFloor    { 0.95f, 0.95f, 0.95f, 1.00f };
    const Color kWall     { 0.05f, 0.05f, 0.05f, 1.00f };
    const Color kExplored { 0.20f, 0.55f, 1.00f, 0.45f };
    const Color kPath     { 1.00f, 0.85f, 0.10f, 1.00f };
    const Color kStart    { 0.20f, 0.80f, 0.25f, 1.00f };
    const Color kEnd      { 0.95f, 0.20f, 0.20f, 1.00f };
}

void Viewer::rebuildMeshIfDirty()
{
    const bool fbChanged = (meshBuiltFbW != fbW) || (meshBuiltFbH != fbH);

    if (mazeLoaded && (mazeDirty || fbChanged))
    {
        mazeDirty = false;
        meshBuiltFbW = fbW;
        meshBuiltFbH = fbH;
        rebuildMeshFromMaze();
    }
}

void Viewer::rebuildMeshFromMaze()
{
    const int cols = maze.width;
    const int rows = maze.height;
    if (cols <= 0 || rows <= 0) { vertexCount = 0; return; }

    const MazeGeometry geo = ComputeMazeGeometry(cols, rows);
    const float cell = geo.cell;

    auto cellRect = [&](const Cell& c, float shrink) {
        const float pad = cell * (1.0f - shrink) * 0.5f;
        const float x0 = geo.startX + (float)c.x * cell;
        const float y1 = geo.startY - (float)c.y * cell;
        return Rect{ x0 + pad, y1 - cell + pad, x0 + cell - pad, y1 - pad };
    };

    std::vector<Vertex> verts;
    verts.reserve((size_t)rows * (size_t)cols * 6 * 3 + maze.walls.size() * 6);

    // floor
    PushRect(verts, geo.startX, geo.startY - cell * (float)rows,
             geo.startX + cell * (float)cols, geo.startY, kFloor);

    // explored, in the order the search finalized them
    if (showExplored)
    {
        const size_t n = std::min(anim.exploredShown, result.exploredOrder.size());
        for (size_t i = 0; i < n; ++i)
            PushRect(verts, cellRect(result.exploredOrder[i], 1.0f), kExplored);
    }

    if (result.path)
    {
        const auto& path = *result.path;
        const size_t n = std::min(anim.pathShown, path.size());
        for (size_t i = 0; i < n; ++i)
            PushRect(verts, cellRect(path[i], 0.60f), kPath);
    }

    PushRect(verts, cellRect(start, 0.70f), kStart);
    PushRect(verts, cellRect(end, 0.70f), kEnd);

    // walls sit on the edge shared by their two cells
    const float t = std::max(cell * 0.10f, 0.004f);
    const float h = t * 0.5f;

    for (const Wall& w : maze.walls)
    {
        if (w.a.x != w.b.x)
        {
            // left/right neighbours -> vertical bar
            const float x = geo.startX + (float)w.b.x * cell;
            const float y1 = geo.startY - (float)w.a.y * cell;
            PushRect(verts, x - h, y1 - cell - h, x + h, y1 + h, kWall);
        }
        else
        {
            // up/down neighbours -> horizontal bar
            const float y = geo.startY - (float)w.b.y * cell;
            const float x0 = geo.startX + (float)w.a.x * cell;
            PushRect(verts, x0 - h, y - h, x0 + cell + h, y + h, kWall);
        }
    }

    // border
    const float bx0 = geo.startX;
    const float bx1 = geo.startX + cell * (float)cols;
    const float by0 = geo.startY - cell * (float)rows;
    const float by1 = geo.startY;
    PushRect(verts, bx0 - h, by1 - h, bx1 + h, by1 + h, kWall);
    PushRect(verts, bx0 - h, by0 - h, bx1 + h, by0 + h, kWall);
    PushRect(verts, bx0 - h, by0 - h, bx0 + h, by1 + h, kWall);
    PushRect(verts, bx1 - h, by0 - h, bx1 + h, by1 + h, kWall);

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(verts.size() * sizeof(Vertex)), verts.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    vertexCount = (int)verts.size();
}

bool Viewer::cellAt(double fbX, double fbY, Cell& out) const
{
    if (!mazeLoaded) return false;

    // square viewport on the right, anchored to the bottom edge
    const int sidePx = std::min(fbW, fbH);
    const double vpX0 = (double)(fbW - sidePx);
    const double vpTop = (double)(fbH - sidePx);

    const double lx = (fbX - vpX0) / (double)sidePx * 2.0 - 1.0;
    const double ly = 1.0 - (fbY - vpTop) / (double)sidePx * 2.0;
    if (lx < -1.0 || lx > 1.0 || ly < -1.0 || ly > 1.0) return false;

    const MazeGeometry geo = ComputeMazeGeometry(maze.width, maze.height);
    const int cx = (int)std::floor((lx - geo.startX) / geo.cell);
    const int cy = (int)std::floor((geo.startY - ly) / geo.cell);
    if (!maze.InBounds(cx, cy)) return false;

    out = { cx, cy };
    return true;
}

void Viewer::drawMaze()
{
    rebuildMeshIfDirty();

    if (vertexCount <= 0) return;

    const int sidePx = std::min(fbW, fbH);
    const int vpX = std::max(0, fbW - sidePx);

    glViewport(vpX, 0, sidePx, sidePx);

    glUseProgram(program);
    glBindVertexArray(vao);
    glDrawArrays(GL_TRIANGLES, 0, vertexCount);
    glBindVertexArray(0);
    glUseProgram(0);

    // full viewport again for the panel
    glViewport(0, 0, fbW, fbH);
}
