// Flat-colored rectangle drawn centered on the entity's Transform.
#pragma once

#include "../../math/Vec2.h"
#include "../../render/Color.h"

namespace Engine::ECS {

struct Renderable {
    Vec2 size{16.0f, 16.0f};
    Color color{200, 200, 200, 255};
    bool visible{true};
};

}  // namespace Engine::ECS
