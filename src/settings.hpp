#pragma once
#include "components.hpp"
#include "input_arbiter.hpp"
#include <string>

// ---------------------------------------------------------------------------
// GameSettings — everything the host reads at startup.
// ---------------------------------------------------------------------------

struct WindowSettings {
    int         width      = 800;
    int         height     = 600;
    int         target_fps = 60;
    std::string title      = "Paddle";
};

struct DebugSettings {
    bool overlay = false; // F3 overlay visible at startup
};

struct GameSettings {
    WindowSettings   window;
    PaddleConfig     paddle;
    PaddleAppearance appearance;
    MotionConfig     motion;
    InputEnables     input;
    DebugSettings    debug;
};

// ---------------------------------------------------------------------------
// SettingsLoader — reads a JSON settings file into GameSettings.
//
// Missing keys keep their defaults; numeric values are clamped into range.
// On malformed JSON or a type mismatch the loader returns false and leaves
// `out` untouched. No raylib dependency; compilable in the headless test
// target.
// ---------------------------------------------------------------------------

class SettingsLoader {
public:
    static bool load(const std::string& path, GameSettings& out);

    // Identical to load() but parses from memory. Intended for unit testing.
    static bool load_from_string(const std::string& json, GameSettings& out);
};
