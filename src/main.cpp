#include "pipeline.hpp"
#include "settings.hpp"
#include "modules/core_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/input_module.hpp"
#include "modules/paddle_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

static const char* SETTINGS_PATH = "resources/settings.json";

// Frames longer than this are clamped (window drag, breakpoint) so the
// paddle does not jump across the field on resume.
static constexpr float MAX_FRAME_DT = 0.25f;

int main() {
  GameSettings settings;
  const bool settings_ok = SettingsLoader::load(SETTINGS_PATH, settings);

  InitWindow(settings.window.width, settings.window.height, settings.window.title.c_str());
  SetTargetFPS(settings.window.target_fps);

  if (!settings_ok) {
    TraceLog(LOG_WARNING, "SETTINGS: Could not load '%s', using defaults", SETTINGS_PATH);
  } else {
    TraceLog(LOG_INFO, "SETTINGS: Loaded '%s'", SETTINGS_PATH);
  }

  ecs::World world;
  ecs::Pipeline pipeline;

  // --- Module installation (order matters, see each module's header) ---
  CoreModule::install(world, pipeline, settings);
  InputModule::install(world, pipeline);
  RenderModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  PaddleModule::install(world, pipeline);
  RenderModule::finish(world, pipeline);

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    float dt = GetFrameTime();
    if (dt > MAX_FRAME_DT) dt = MAX_FRAME_DT;

    pipeline.update(world, dt);
    pipeline.render(world);
  }

  CloseWindow();
  return 0;
}
