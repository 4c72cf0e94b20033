#include "MovementSystem.h"

#include <algorithm>

#include "../../engine/ecs/components/AABB.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/ecs/components/Velocity.h"

namespace Sundown {

void MovementSystem::setBounds(const Engine::Vec2& min, const Engine::Vec2& max) {
    boundsMin_ = min;
    boundsMax_ = max;
    clampEnabled_ = true;
}

void MovementSystem::update(Engine::ECS::Registry& registry, float dtSeconds) {
    registry.view<Engine::ECS::Transform, Engine::ECS::Velocity>(
        [dtSeconds, this, &registry](Engine::ECS::Entity e, Engine::ECS::Transform& tf, Engine::ECS::Velocity& vel) {
            tf.position += vel.value * dtSeconds;
            if (!clampEnabled_) return;

            // The whole body stays inside the bounds.
            Engine::Vec2 min = boundsMin_;
            Engine::Vec2 max = boundsMax_;
            if (const auto* box = registry.get<Engine::ECS::AABB>(e)) {
                min += box->halfExtents;
                max -= box->halfExtents;
            }
            tf.position.x = std::clamp(tf.position.x, min.x, std::max(min.x, max.x));
            tf.position.y = std::clamp(tf.position.y, min.y, std::max(min.y, max.y));
        });
}

}  // namespace Sundown
