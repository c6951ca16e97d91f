#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>
#include <iostream>

void Viewer::beginEdit(UI field)
{
    pick = Pick::None;
    uiFocus = field;

    switch (field)
    {
    case UI::Seed:   uiEdit = uiSeed ? std::to_string(*uiSeed) : std::string(); break;
    case UI::StartX: uiEdit = std::to_string(start.x); break;
    case UI::StartY: uiEdit = std::to_string(start.y); break;
    case UI::EndX:   uiEdit = std::to_string(end.x);   break;
    case UI::EndY:   uiEdit = std::to_string(end.y);   break;
    default:         uiEdit.clear(); break;
    }
    updateWindowTitle();
}

void Viewer::applyEdit()
{
    const UI field = uiFocus;
    const std::string text = uiEdit;
    uiFocus = UI::None;
    uiEdit.clear();

    if (field == UI::Seed)
    {
        // empty or unusable seed -> back to random
        uiSeed.reset();
        if (!text.empty() && text != "-")
        {
            try { uiSeed = ParseInt32(text, "seed"); }
            catch (const std::invalid_argument& e)
            {
                std::cerr << e.what() << ", using a random seed\n";
            }
        }
        buildMaze();
        return;
    }

    if (text.empty() || text == "-")
    {
        updateWindowTitle();
        return;
    }

    int32_t v = 0;
    try { v = ParseInt32(text, "coordinate"); }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << "\n";
        updateWindowTitle();
        return;
    }

    switch (field)
    {
    case UI::StartX: start.x = std::clamp(v, 0, mazeW - 1); break;
    case UI::StartY: start.y = std::clamp(v, 0, mazeH - 1); break;
    case UI::EndX:   end.x   = std::clamp(v, 0, mazeW - 1); break;
    case UI::EndY:   end.y   = std::clamp(v, 0, mazeH - 1); break;
    default: break;
    }

    findPath(true);
}

void Viewer::handleKey(int key)
{
    auto* win = static_cast<GLFWwindow*>(window);

    if (key == GLFW_KEY_ESCAPE)
    {
        if (uiFocus != UI::None)
        {
            uiFocus = UI::None;
            uiEdit.clear();
        }
        else if (pick != Pick::None)
        {
            pick = Pick::None;
        }
        else
        {
            glfwSetWindowShouldClose(win, GLFW_TRUE);
        }
        updateWindowTitle();
        return;
    }

    if (uiFocus != UI::None)
    {
        if (key == GLFW_KEY_BACKSPACE) {
            if (!uiEdit.empty()) uiEdit.pop_back();
        } else if (key == GLFW_KEY_ENTER || key == GLFW_KEY_KP_ENTER) {
            applyEdit();
        }
        return;
    }

    switch (key)
    {
    case GLFW_KEY_B:
    case GLFW_KEY_R:
        pick = Pick::None;
        buildMaze();
        break;
    case GLFW_KEY_F:
    case GLFW_KEY_SPACE:
        pick = Pick::None;
        findPath(true);
        break;
    case GLFW_KEY_S:
        pick = Pick::Start;
        updateWindowTitle();
        break;
    case GLFW_KEY_E:
        pick = Pick::End;
        updateWindowTitle();
        break;
    case GLFW_KEY_A:
        showExplored = !showExplored;
        mazeDirty = true;
        break;
    case GLFW_KEY_D:
        beginEdit(UI::Seed);
        break;
    case GLFW_KEY_Q:
        glfwSetWindowShouldClose(win, GLFW_TRUE);
        break;
    default:
        break;
    }
}

void Viewer::handleClick(float mx, float my, double fbX, double fbY)
{
    Cell clicked{};
    if (pick != Pick::None && cellAt(fbX, fbY, clicked))
    {
        if (pick == Pick::Start) start = clicked;
        else                     end = clicked;
        pick = Pick::None;
        findPath(true);
        return;
    }

    const PanelLayout L = panelLayout();

    // clicking anywhere else commits a pending edit first
    if (uiFocus != UI::None)
    {
        if (L.seed.Contains(mx, my) || L.startX.Contains(mx, my) || L.startY.Contains(mx, my) ||
            L.endX.Contains(mx, my) || L.endY.Contains(mx, my))
        {
            uiFocus = UI::None;
            uiEdit.clear();
        }
        else
        {
            applyEdit();
        }
    }

    if (L.build.Contains(mx, my))     { pick = Pick::None; buildMaze(); return; }
    if (L.seed.Contains(mx, my))      { beginEdit(UI::Seed); return; }
    if (L.startX.Contains(mx, my))    { beginEdit(UI::StartX); return; }
    if (L.startY.Contains(mx, my))    { beginEdit(UI::StartY); return; }
    if (L.endX.Contains(mx, my))      { beginEdit(UI::EndX); return; }
    if (L.endY.Contains(mx, my))      { beginEdit(UI::EndY); return; }
    if (L.find.Contains(mx, my))      { pick = Pick::None; findPath(true); return; }
    if (L.explored.Contains(mx, my))  { showExplored = !showExplored; mazeDirty = true; return; }
    if (L.pickStart.Contains(mx, my)) { pick = Pick::Start; updateWindowTitle(); return; }
    if (L.pickEnd.Contains(mx, my))   { pick = Pick::End; updateWindowTitle(); return; }
}

void Viewer::initUiCallbacks()
{
    GLFWwindow* win = static_cast<GLFWwindow*>(window);
    glfwSetWindowUserPointer(win, this);

    glfwSetCharCallback(win, [](GLFWwindow* w, unsigned int codepoint)
    {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (!self) return;
        if (self->uiFocus == UI::None) return;

        if (codepoint > 127) return;
        const char ch = (char)codepoint;

        if (ch >= '0' && ch <= '9')
        {
            if (self->uiEdit.size() < 11) self->uiEdit.push_back(ch);
            return;
        }

        // 负号只允许出现在开头
        if (ch == '-' && self->uiEdit.empty())
            self->uiEdit.push_back(ch);
    });

    glfwSetKeyCallback(win, [](GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/)
    {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (!self) return;
        if (action != GLFW_PRESS && action != GLFW_REPEAT) return;
        self->handleKey(key);
    });

    glfwSetMouseButtonCallback(win, [](GLFWwindow* w, int button, int action, int /*mods*/)
    {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (!self) return;
        if (button != GLFW_MOUSE_BUTTON_LEFT || action != GLFW_PRESS) return;

        double px = 0, py = 0;
        glfwGetCursorPos(w, &px, &py);

        int winW = 1, winH = 1;
        glfwGetWindowSize(w, &winW, &winH);
        if (winW <= 0) winW = 1;
        if (winH <= 0) winH = 1;

        int fbw = 1, fbh = 1;
        glfwGetFramebufferSize(w, &fbw, &fbh);
        if (fbw <= 0) fbw = 1;
        if (fbh <= 0) fbh = 1;

        // cursor pos is in window coords; HiDPI framebuffers are larger
        const double fpx = px * (double)fbw / (double)winW;
        const double fpy = py * (double)fbh / (double)winH;

        const float mx = (float)((fpx / (double)fbw) * 2.0 - 1.0);
        const float my = (float)(1.0 - (fpy / (double)fbh) * 2.0);

        self->handleClick(mx, my, fpx, fpy);
    });
}
