#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <array>
#include <string_view>
#include <cstdlib>

namespace
{
    const Color kPanel   { 0.12f, 0.12f, 0.12f, 1.0f };
    const Color kBoxFill { 0.18f, 0.18f, 0.18f, 1.0f };
    const Color kBoxEdge { 0.35f, 0.35f, 0.35f, 1.0f };
    const Color kFocus   { 0.95f, 0.85f, 0.20f, 1.0f };
    const Color kText    { 0.92f, 0.92f, 0.92f, 1.0f };
    const Color kInk     { 0.08f, 0.08f, 0.08f, 1.0f };

    const Color kBuildBtn { 0.75f, 0.75f, 0.75f, 1.0f };
    const Color kFindBtn  { 0.20f, 0.55f, 1.00f, 1.0f };
    const Color kShowBtn  { 0.55f, 0.70f, 0.95f, 1.0f };
    const Color kStartBtn { 0.20f, 0.80f, 0.25f, 1.0f };
    const Color kEndBtn   { 0.95f, 0.20f, 0.20f, 1.0f };

    // seven segments, bit 0..6 = A(top) B(ur) C(lr) D(bottom) E(ll) F(ul) G(middle)
    uint8_t SegMask(char ch)
    {
        switch (ch)
        {
        case '0': return 0x3F;
        case '1': return 0x06;
        case '2': return 0x5B;
        case '3': return 0x4F;
        case '4': return 0x66;
        case '5': return 0x6D;
        case '6': return 0x7D;
        case '7': return 0x07;
        case '8': return 0x7F;
        case '9': return 0x6F;
        case '-': return 0x40;
        default:  return 0x00;
        }
    }

    void PushDigit7(std::vector<Vertex>& out, char ch,
                    float x, float y, float w, float h, const Color& c)
    {
        const float t = std::min(w, h) * 0.18f;
        const float x0 = x, x1 = x + w;
        const float y0 = y, y1 = y + h;
        const float ym = y0 + h * 0.5f;

        const std::array<Rect, 7> seg = {{
            { x0 + t, y1 - t, x1 - t, y1 },                      // A
            { x1 - t, ym,     x1,     y1 - t },                  // B
            { x1 - t, y0 + t, x1,     ym },                      // C
            { x0 + t, y0,     x1 - t, y0 + t },                  // D
            { x0,     y0 + t, x0 + t, ym },                      // E
            { x0,     ym,     x0 + t, y1 - t },                  // F
            { x0 + t, y0 + (h - t) * 0.5f, x1 - t, y0 + (h + t) * 0.5f }, // G
        }};

        const uint8_t mask = SegMask(ch);
        for (int i = 0; i < 7; ++i)
            if (mask & (1u << i)) PushRect(out, seg[i], c);
    }

    // 按位均分宽度绘制整数
    void PushInt7(std::vector<Vertex>& out, long v, const Rect& box, const Color& c)
    {
        const std::string s = std::to_string(v);
        const float w = box.x1 - box.x0;
        const float h = box.y1 - box.y0;
        const size_t n = std::max<size_t>(s.size(), 1);

        // keep digits from getting wider than ~0.6 of their height
        const float gap = w * 0.04f;
        float cw = (w - gap * (float)(n - 1)) / (float)n;
        cw = std::min(cw, h * 0.6f);

        float cx = box.x0;
        for (char ch : s)
        {
            PushDigit7(out, ch, cx, box.y0, cw, h, c);
            cx += cw + gap;
        }
    }

    // 5x7 dot font, only the characters the panel uses
    std::array<uint8_t, 7> Glyph5x7(char c)
    {
        if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');

        struct Glyph { char ch; std::array<uint8_t, 7> rows; };
        static const Glyph kGlyphs[] = {
            { '-', {0x00,0x00,0x00,0x1F,0x00,0x00,0x00} },
            { 'A', {0x0E,0x11,0x11,0x1F,0x11,0x11,0x11} },
            { 'B', {0x1E,0x11,0x11,0x1E,0x11,0x11,0x1E} },
            { 'C', {0x0E,0x11,0x10,0x10,0x10,0x11,0x0E} },
            { 'D', {0x1E,0x11,0x11,0x11,0x11,0x11,0x1E} },
            { 'E', {0x1F,0x10,0x10,0x1E,0x10,0x10,0x1F} },
            { 'F', {0x1F,0x10,0x10,0x1E,0x10,0x10,0x10} },
            { 'H', {0x11,0x11,0x11,0x1F,0x11,0x11,0x11} },
            { 'I', {0x1F,0x04,0x04,0x04,0x04,0x04,0x1F} },
            { 'L', {0x10,0x10,0x10,0x10,0x10,0x10,0x1F} },
            { 'M', {0x11,0x1B,0x15,0x15,0x11,0x11,0x11} },
            { 'N', {0x11,0x19,0x15,0x13,0x11,0x11,0x11} },
            { 'O', {0x0E,0x11,0x11,0x11,0x11,0x11,0x0E} },
            { 'P', {0x1E,0x11,0x11,0x1E,0x10,0x10,0x10} },
            { 'R', {0x1E,0x11,0x11,0x1E,0x14,0x12,0x11} },
            { 'S', {0x0F,0x10,0x10,0x0E,0x01,0x01,0x1E} },
            { 'T', {0x1F,0x04,0x04,0x04,0x04,0x04,0x04} },
            { 'U', {0x11,0x11,0x11,0x11,0x11,0x11,0x0E} },
            { 'V', {0x11,0x11,0x11,0x11,0x0A,0x0A,0x04} },
            { 'W', {0x11,0x11,0x11,0x15,0x15,0x15,0x0A} },
            { 'X', {0x11,0x0A,0x04,0x04,0x04,0x0A,0x11} },
            { 'Y', {0x11,0x0A,0x04,0x04,0x04,0x04,0x04} },
        };

        for (const Glyph& g : kGlyphs)
            if (g.ch == c) return g.rows;
        return {0, 0, 0, 0, 0, 0, 0};
    }

    void PushText5x7(std::vector<Vertex>& out, std::string_view text,
                     float x, float y, float pix, const Color& c)
    {
        float cx = x;
        for (char ch : text)
        {
            const auto rows = Glyph5x7(ch);
            for (int row = 0; row < 7; ++row)
            {
                for (int col = 0; col < 5; ++col)
                {
                    if (!(rows[row] & (1u << (4 - col)))) continue;

                    const float x0 = cx + (float)col * pix;
                    const float y0 = y + (float)(6 - row) * pix;
                    PushRect(out, x0, y0, x0 + pix, y0 + pix, c);
                }
            }
            cx += 6.0f * pix;
        }
    }

    float TextWidth5x7(std::string_view text, float pix)
    {
        return (float)text.size() * 6.0f * pix;
    }

    // 在矩形内居中绘制文本
    void DrawLabel(std::vector<Vertex>& out, std::string_view label, const Rect& rc,
                   float pix, const Color& c)
    {
        const float tx = (rc.x0 + rc.x1) * 0.5f - TextWidth5x7(label, pix) * 0.5f;
        const float ty = (rc.y0 + rc.y1) * 0.5f - 3.5f * pix;
        PushText5x7(out, label, tx, ty, pix, c);
    }

    Rect Inset(const Rect& rc, float dx, float dy)
    {
        return { rc.x0 + dx, rc.y0 + dy, rc.x1 - dx, rc.y1 - dy };
    }
}

PanelLayout Viewer::panelLayout() const
{
    PanelLayout L{};

    // panel fills whatever the square maze viewport leaves on the left
    const float sidePx = (float)std::min(fbW, fbH);
    const float splitX = 1.0f - 2.0f * (sidePx / (float)std::max(1, fbW));

    L.panel = { -1.0f, -1.0f, splitX, 1.0f };
    L.labelPix = 0.0080f;

    const float padX = 0.05f;
    const float padY = 0.05f;
    const float gap = 0.02f;
    const float labelH = 7.0f * L.labelPix;

    const float x0 = L.panel.x0 + padX;
    const float x1 = std::max(x0 + 0.01f, L.panel.x1 - padX);
    const float midX = (x0 + x1) * 0.5f;
    const float halfGap = 0.015f;

    // top down: BUILD, SEED, START x/y, END x/y, result
    const float buildH = std::min(0.22f, std::max(0.10f, (x1 - x0) * 0.22f));
    float y = L.panel.y1 - padY;

    L.build = { x0, y - buildH, x1, y };
    y = L.build.y0 - gap;

    auto labelledRow = [&](Rect& label, float boxH) {
        label = { x0, y - labelH, x1, y };
        const float boxTop = label.y0 - 0.012f;
        y = boxTop - boxH - gap;
        return std::make_pair(boxTop - boxH, boxTop);
    };

    auto seedRow = labelledRow(L.seedLabel, 0.14f);
    L.seed = { x0, seedRow.first, x1, seedRow.second };

    auto startRow = labelledRow(L.startLabel, 0.12f);
    L.startX = { x0, startRow.first, midX - halfGap, startRow.second };
    L.startY = { midX + halfGap, startRow.first, x1, startRow.second };

    auto endRow = labelledRow(L.endLabel, 0.12f);
    L.endX = { x0, endRow.first, midX - halfGap, endRow.second };
    L.endY = { midX + halfGap, endRow.first, x1, endRow.second };

    L.result = { x0, y - 0.18f, x1, y };

    // bottom up: SET END, SET START, SHOW/HIDE, FIND
    const float btnH = 0.11f;
    const float btnGap = 0.018f;
    const float bottom = L.panel.y0 + padY;
    auto btnRow = [&](int i) {
        const float b0 = bottom + (float)i * (btnH + btnGap);
        return Rect{ x0, b0, x1, b0 + btnH };
    };

    L.pickEnd = btnRow(0);
    L.pickStart = btnRow(1);
    L.explored = btnRow(2);
    L.find = btnRow(3);

    return L;
}

// 渲染左侧 UI 面板：按钮、输入框与结果展示
void Viewer::renderUi()
{
    const PanelLayout L = panelLayout();

    std::vector<Vertex> ui;
    ui.reserve(6000);

    PushRect(ui, L.panel, kPanel);

    auto drawBox = [&](const Rect& rc, bool focused) {
        PushRect(ui, Inset(rc, -0.005f, -0.005f), focused ? kFocus : kBoxEdge);
        PushRect(ui, rc, kBoxFill);
    };

    // value shown in a box: the pending edit when focused, else the current value
    auto drawNumber = [&](const Rect& rc, UI field, long current) {
        drawBox(rc, uiFocus == field);

        long shown = current;
        if (uiFocus == field)
        {
            if (uiEdit.empty()) return;
            if (uiEdit == "-") { PushInt7(ui, 0, Inset(rc, 0.02f, 0.02f), kText); return; }
            char* stop = nullptr;
            shown = std::strtol(uiEdit.c_str(), &stop, 10);
        }
        PushInt7(ui, shown, Inset(rc, 0.02f, 0.02f), kText);
    };

    PushRect(ui, L.build, kBuildBtn);
    DrawLabel(ui, "BUILD", L.build, 0.0105f, kInk);

    PushText5x7(ui, "SEED", L.seedLabel.x0, L.seedLabel.y0, L.labelPix, kText);
    if (uiSeed || uiFocus == UI::Seed)
    {
        drawNumber(L.seed, UI::Seed, uiSeed.value_or(0));
    }
    else
    {
        drawBox(L.seed, false);
        DrawLabel(ui, "RANDOM", L.seed, 0.0100f, kText);
    }

    PushText5x7(ui, "START", L.startLabel.x0, L.startLabel.y0, L.labelPix, kStartBtn);
    drawNumber(L.startX, UI::StartX, start.x);
    drawNumber(L.startY, UI::StartY, start.y);

    PushText5x7(ui, "END", L.endLabel.x0, L.endLabel.y0, L.labelPix, kEndBtn);
    drawNumber(L.endX, UI::EndX, end.x);
    drawNumber(L.endY, UI::EndY, end.y);

    // result: path length in steps and number of explored cells
    {
        drawBox(L.result, false);

        const float halfH = (L.result.y1 - L.result.y0) * 0.5f;
        const Rect top{ L.result.x0, L.result.y0 + halfH, L.result.x1, L.result.y1 };
        const Rect bot{ L.result.x0, L.result.y0, L.result.x1, L.result.y0 + halfH };
        const float pix = 0.0085f;
        const float numX0 = L.result.x0 + 0.03f + TextWidth5x7("LEN ", pix);

        PushText5x7(ui, "LEN", top.x0 + 0.02f, (top.y0 + top.y1) * 0.5f - 3.5f * pix, pix, kText);
        if (!mazeLoaded || result.Found())
            PushInt7(ui, std::max(0, result.Steps()), Rect{ numX0, top.y0 + 0.015f, top.x1 - 0.02f, top.y1 - 0.015f }, kText);
        else
            PushText5x7(ui, "NONE", numX0, (top.y0 + top.y1) * 0.5f - 3.5f * pix, pix, kEndBtn);

        PushText5x7(ui, "VIS", bot.x0 + 0.02f, (bot.y0 + bot.y1) * 0.5f - 3.5f * pix, pix, kText);
        PushInt7(ui, (long)result.exploredOrder.size(), Rect{ numX0, bot.y0 + 0.015f, bot.x1 - 0.02f, bot.y1 - 0.015f }, kText);
    }

    const float btnPix = 0.0085f;

    PushRect(ui, L.find, kFindBtn);
    DrawLabel(ui, "FIND", L.find, btnPix, kInk);

    PushRect(ui, L.explored, kShowBtn);
    DrawLabel(ui, showExplored ? "HIDE" : "SHOW", L.explored, btnPix, kInk);

    if (pick == Pick::Start) PushRect(ui, Inset(L.pickStart, -0.008f, -0.008f), kFocus);
    PushRect(ui, L.pickStart, kStartBtn);
    DrawLabel(ui, "SET START", L.pickStart, btnPix, kInk);

    if (pick == Pick::End) PushRect(ui, Inset(L.pickEnd, -0.008f, -0.008f), kFocus);
    PushRect(ui, L.pickEnd, kEndBtn);
    DrawLabel(ui, "SET END", L.pickEnd, btnPix, kInk);

    glBindBuffer(GL_ARRAY_BUFFER, uiVbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(ui.size() * sizeof(Vertex)), ui.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    uiVertexCount = (int)ui.size();
    if (uiVertexCount > 0)
    {
        glUseProgram(program);
        glBindVertexArray(uiVao);
        glDrawArrays(GL_TRIANGLES, 0, uiVertexCount);
        glBindVertexArray(0);
        glUseProgram(0);
    }
}
