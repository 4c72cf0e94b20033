// World-space position of an entity's center.
#pragma once

#include "../../math/Vec2.h"

namespace Engine::ECS {

struct Transform {
    Vec2 position{};
};

}  // namespace Engine::ECS
