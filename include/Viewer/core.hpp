#pragma once

#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/PathFinder.hpp"
#include "App/Options.hpp"

enum class UI
{
    None,
    Seed,
    StartX,
    StartY,
    EndX,
    EndY
};

// waiting for a click on the maze to move an endpoint
enum class Pick
{
    None,
    Start,
    End
};

struct Rect
{
    float x0, y0, x1, y1;

    bool Contains(float mx, float my) const
    {
        return mx >= x0 && mx <= x1 && my >= y0 && my <= y1;
    }
};

// Left panel layout in NDC, shared by rendering and hit testing.
struct PanelLayout
{
    Rect panel;
    Rect build;
    Rect seedLabel, seed;
    Rect startLabel, startX, startY;
    Rect endLabel, endX, endY;
    Rect result;
    Rect find, explored, pickStart, pickEnd;
    float labelPix;
};

class Viewer {
public:
    static Viewer& getInstance();

    void configure(const AppOptions& opt);
    void run();
    void onFramebufferResized(int width, int height);

private:
    Viewer();
    ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

private:
    // window/gl
    void initWindowAndGL();
    void shutdownGL();
    void initUiCallbacks();
    void updateWindowTitle();

    // input
    void beginEdit(UI field);
    void applyEdit();
    void handleKey(int key);
    void handleClick(float mx, float my, double fbX, double fbY);
    bool cellAt(double fbX, double fbY, Cell& out) const;

    // render
    void drawMaze();
    void renderUi();
    void rebuildMeshFromMaze();
    void rebuildMeshIfDirty();
    PanelLayout panelLayout() const;

    // work
    void buildMaze();
    void findPath(bool animate);
    void tickSearchAnim_();

    // exploration first, then the path grows from start to end
    struct SearchAnim
    {
        bool active = false;
        std::chrono::steady_clock::time_point t0{};
        size_t exploredShown = 0;
        size_t pathShown = 0;
    } anim;

private:
    // -------- window / gl state --------
    void* window = nullptr; // GLFWwindow*
    int fbW = 900;
    int fbH = 600;

    uint32_t program = 0;
    uint32_t vao = 0;
    uint32_t vbo = 0;
    uint32_t uiVao = 0;
    uint32_t uiVbo = 0;

    int vertexCount = 0;
    int uiVertexCount = 0;

    int meshBuiltFbW = 0;
    int meshBuiltFbH = 0;

    // -------- maze / search state --------
    int32_t mazeW = 15;
    int32_t mazeH = 15;
    Maze maze{};
    std::optional<PathFinder> finder;
    SearchResult result{};
    bool mazeLoaded = false;
    bool mazeDirty = false;

    Cell start{0, 0};
    Cell end{0, 0};

    // -------- UI state --------
    UI uiFocus = UI::None;
    std::string uiEdit;
    std::optional<int32_t> uiSeed;
    Pick pick = Pick::None;
    bool showExplored = true;
};
