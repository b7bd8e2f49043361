#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase.
 *
 * There is no fixed-step phase: every Logic system receives the real frame
 * time and is expected to be frame-rate independent.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func)      { logic_.push_back(std::move(func)); }
    void add_render(SystemFunc func)     { render_.push_back(std::move(func)); }

    /**
     * @brief Input gathering followed by gameplay logic, in registration order.
     */
    void update(World& world, float dt) {
        // 1. Input / Pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Gameplay Logic
        for (auto& sys : logic_) sys(world, dt);

        // 3. Sync structural changes before rendering
        world.deferred().flush(world);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> render_;
};

} // namespace ecs
