// Velocity in world units per second, integrated by the movement system.
#pragma once

#include "../../math/Vec2.h"

namespace Engine::ECS {

struct Velocity {
    Vec2 value{};
};

}  // namespace Engine::ECS
