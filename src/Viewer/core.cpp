#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"
#include "core/MazeBuilder.hpp"
#include "core/PathFinder.hpp"

#include <stdexcept>
#include <algorithm>
#include <cmath>

Viewer& Viewer::getInstance()
{
    static Viewer inst;
    return inst;
}

Viewer::Viewer() = default;

Viewer::~Viewer()
{
    // run() normally shuts down already; shutdownGL() is a no-op then
    shutdownGL();
}

void Viewer::configure(const AppOptions& opt)
{
    mazeW = opt.width;
    mazeH = opt.height;
    uiSeed = opt.seed;
    start = opt.StartOrDefault();
    end = opt.EndOrDefault();
}

namespace
{
    // playback length; the trace takes the first 70%, the path the rest
    constexpr double kAnimMs = 3000.0;
    constexpr double kTraceShare = 0.70;

    size_t Revealed(double progress, size_t total)
    {
        progress = std::min(1.0, std::max(0.0, progress));
        return std::min(total, (size_t)std::floor(progress * (double)total));
    }
}

void Viewer::tickSearchAnim_()
{
    if (!anim.active) return;

    const double ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - anim.t0).count();
    const double t = std::min(1.0, std::max(0.0, ms / kAnimMs));

    const size_t exploredTotal = result.exploredOrder.size();
    const size_t pathTotal = result.path ? result.path->size() : 0;

    const size_t nExplored = Revealed(t / kTraceShare, exploredTotal);
    const size_t nPath = (t < kTraceShare) ? 0
        : Revealed((t - kTraceShare) / (1.0 - kTraceShare), pathTotal);

    if (nExplored != anim.exploredShown || nPath != anim.pathShown)
    {
        anim.exploredShown = nExplored;
        anim.pathShown = nPath;
        mazeDirty = true;
    }

    if (t >= 1.0)
        anim.active = false;
}

void Viewer::run()
{
    initWindowAndGL();

    // 初始生成一个迷宫，避免空白
    buildMaze();

    auto* win = static_cast<GLFWwindow*>(window);
    while (win && !glfwWindowShouldClose(win))
    {
        tickSearchAnim_();

        glClearColor(0.08f, 0.08f, 0.09f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        drawMaze();
        renderUi();

        glfwSwapBuffers(win);
        glfwPollEvents();
    }

    shutdownGL();
}

void Viewer::updateWindowTitle()
{
    if (!window) return;

    std::ostringstream oss;
    oss << "Maze Viewer  |  " << mazeW << "x" << mazeH
        << "  seed=" << (uiSeed ? std::to_string(*uiSeed) : std::string("random"))
        << "  start=" << ToString(start) << " end=" << ToString(end);

    if (pick == Pick::Start)
        oss << "  |  click a cell to set the start";
    else if (pick == Pick::End)
        oss << "  |  click a cell to set the end";
    else if (mazeLoaded && !result.Found())
        oss << "  |  no path";
    else
        oss << "  |  [B]uild [F]ind [S]tart [E]nd [A] explored [D] seed [Q]uit";

    glfwSetWindowTitle(static_cast<GLFWwindow*>(window), oss.str().c_str());
}

void Viewer::buildMaze()
{
    maze = MazeBuilder::Generate(mazeW, mazeH, uiSeed);
    finder.emplace(maze);
    mazeLoaded = true;

    start.x = std::clamp(start.x, 0, mazeW - 1);
    start.y = std::clamp(start.y, 0, mazeH - 1);
    end.x = std::clamp(end.x, 0, mazeW - 1);
    end.y = std::clamp(end.y, 0, mazeH - 1);

    findPath(false);
}

void Viewer::findPath(bool animate)
{
    if (!mazeLoaded || !finder) return;

    result = finder->FindPath(start, end);

    if (!result.Found())
        std::cerr << "No path from " << ToString(start) << " to " << ToString(end) << "\n";

    anim.active = animate;
    anim.t0 = std::chrono::steady_clock::now();
    if (animate)
    {
        anim.exploredShown = 0;
        anim.pathShown = 0;
    }
    else
    {
        anim.exploredShown = result.exploredOrder.size();
        anim.pathShown = result.path ? result.path->size() : 0;
    }

    mazeDirty = true;
    updateWindowTitle();
}

void Viewer::onFramebufferResized(int width, int height)
{
    fbW = std::max(1, width);
    fbH = std::max(1, height);
}
