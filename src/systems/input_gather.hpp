#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputGatherSystem — Pre-Update; polls raylib once per frame and feeds the
// session's InputArbiter with device events.
// ---------------------------------------------------------------------------

class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
