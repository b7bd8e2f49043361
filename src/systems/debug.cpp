#include "debug.hpp"
#include "../debug_panel.hpp"
#include <raylib.h>
#include <string>

namespace {

constexpr int   PANEL_W   = 240;
constexpr int   MARGIN    = 10;
constexpr int   VALUE_COL = 96;
constexpr int   FONT      = 10;
constexpr Color PANEL_BG  = {16,  18,  26,  220};
constexpr Color EDGE      = {70,  76,  96,  220};
constexpr Color HEADER    = {120, 190, 230, 255};
constexpr Color LABEL     = {170, 174, 186, 255};
constexpr Color VALUE     = {235, 235, 235, 255};
constexpr Color ACCENT    = {250, 200, 80,  255};
constexpr Color TRACK     = {44,  48,  62,  255};
constexpr Color SPAN      = {90,  160, 230, 255};

void draw_row(const DebugPanel::Row& row, int x, int y) {
    const std::string value = row.fn();
    const bool hot = row.highlight && row.highlight();
    DrawText(row.label.c_str(), x, y, FONT, LABEL);
    DrawText(value.c_str(), x + VALUE_COL, y, FONT, hot ? ACCENT : VALUE);
}

// Label on the left, then a track scaled to the remaining width.
void draw_strip(const DebugPanel::Strip& strip, int x, int y, int w, int h) {
    const StripValue v = strip.fn();
    DrawText(strip.label.c_str(), x, y + (h - FONT) / 2, FONT, LABEL);

    const float tx = static_cast<float>(x + VALUE_COL);
    const float tw = static_cast<float>(w - VALUE_COL);
    const float ty = static_cast<float>(y + h / 2 - 3);
    DrawRectangleRec({tx, ty, tw, 6.0f}, TRACK);

    const float a = tx + v.fraction(v.span_lo) * tw;
    const float b = tx + v.fraction(v.span_hi) * tw;
    DrawRectangleRec({a, ty, b - a > 1.0f ? b - a : 1.0f, 6.0f}, SPAN);

    if (v.marker) {
        const float m = tx + v.fraction(*v.marker) * tw;
        DrawLineEx({m, ty - 4.0f}, {m, ty + 10.0f}, 2.0f, ACCENT);
    }
}

} // namespace

void DebugSystem::Update(ecs::World& world) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (IsKeyPressed(KEY_F3)) panel->visible = !panel->visible;
    if (!panel->visible) return;

    const DebugPanel::Metrics m;
    const int x0 = MARGIN, y0 = MARGIN;
    DrawRectangle(x0, y0, PANEL_W, panel->height(m), PANEL_BG);
    DrawRectangleLines(x0, y0, PANEL_W, panel->height(m), EDGE);

    const int left  = x0 + m.pad;
    const int inner = PANEL_W - 2 * m.pad;
    int y = y0 + m.pad;
    DrawText("PADDLE DEBUG  [F3]", left, y, FONT, LABEL);
    y += m.row_h + m.pad;

    for (const auto& sec : panel->sections()) {
        DrawLine(left, y, left + inner, y, EDGE);
        y += m.separator;
        DrawText(sec.title.c_str(), left, y, FONT, HEADER);
        y += m.row_h;

        for (const auto& row : sec.rows) {
            draw_row(row, left + 4, y);
            y += m.row_h;
        }
        for (const auto& strip : sec.strips) {
            draw_strip(strip, left + 4, y, inner - 4, m.strip_h);
            y += m.strip_h;
        }
    }
}
