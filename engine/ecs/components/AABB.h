// Axis-aligned collision body used for world clamping and proximity sizes.
#pragma once

#include "../../math/Vec2.h"

namespace Engine::ECS {

struct AABB {
    Vec2 halfExtents{8.0f, 8.0f};  // half-size

    // Full edge length along x; bodies here are square.
    float size() const { return halfExtents.x * 2.0f; }
};

}  // namespace Engine::ECS
