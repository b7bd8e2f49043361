#include "settings.hpp"
#include "math_util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <string>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static float channel(const json& j) {
    return std::clamp(j.get<float>(), 0.0f, 1.0f);
}

static Color4 parse_color4(const json& j) {
    return {channel(j.at(0)), channel(j.at(1)), channel(j.at(2)), channel(j.at(3))};
}

static float positive(float v, float fallback) {
    return v > 0.0f ? v : fallback;
}

static void parse_window(const json& w, WindowSettings& out) {
    out.width      = std::max(1, w.value("width",      out.width));
    out.height     = std::max(1, w.value("height",     out.height));
    out.target_fps = std::max(0, w.value("target_fps", out.target_fps));
    out.title      = w.value("title", out.title);
}

static void parse_paddle(const json& p, PaddleConfig& cfg, PaddleAppearance& look) {
    cfg.width  = positive(p.value("width",  cfg.width),  cfg.width);
    cfg.height = positive(p.value("height", cfg.height), cfg.height);
    cfg.speed  = positive(p.value("speed",  cfg.speed),  cfg.speed);
    look.y_offset = std::max(0.0f, p.value("y_offset", look.y_offset));
    if (p.contains("color")) look.color = parse_color4(p["color"]);
}

static void parse_motion(const json& m, MotionConfig& cfg) {
    cfg.enable_smoothing = m.value("enable_smoothing", cfg.enable_smoothing);
    cfg.smoothing_rate   = arcade::math::clamp_rate(m.value("smoothing_rate", cfg.smoothing_rate));
}

static void parse_input(const json& i, InputEnables& cfg) {
    cfg.keyboard = i.value("enable_keyboard", cfg.keyboard);
    cfg.mouse    = i.value("enable_mouse",    cfg.mouse);
    cfg.touch    = i.value("enable_touch",    cfg.touch);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SettingsLoader::load_from_string(const std::string& json_str, GameSettings& out) {
    try {
        const json root = json::parse(json_str);
        if (!root.is_object()) return false;

        GameSettings s = out;
        if (root.contains("window")) parse_window(root["window"], s.window);
        if (root.contains("paddle")) parse_paddle(root["paddle"], s.paddle, s.appearance);
        if (root.contains("motion")) parse_motion(root["motion"], s.motion);
        if (root.contains("input"))  parse_input(root["input"], s.input);
        if (root.contains("debug"))  s.debug.overlay = root["debug"].value("overlay", s.debug.overlay);

        // The play field is the window; the paddle never leaves it.
        s.paddle.max_x = static_cast<float>(s.window.width);
        s.paddle.width = std::min(s.paddle.width, s.paddle.max_x);

        out = std::move(s);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool SettingsLoader::load(const std::string& path, GameSettings& out) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, out);
}
