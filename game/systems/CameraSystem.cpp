#include "CameraSystem.h"

#include <algorithm>

#include "../../engine/ecs/components/Transform.h"

namespace Sundown {

void CameraSystem::update(Engine::Camera2D& camera, const Engine::ECS::Registry& registry, Engine::ECS::Entity target,
                          const WorldSettings& world, int viewportW, int viewportH) const {
    camera.zoom = settings_.zoom > 0.0f ? settings_.zoom : 1.0f;
    if (const auto* tf = registry.get<Engine::ECS::Transform>(target)) {
        const float factor = std::clamp(settings_.followLerp, 0.0f, 1.0f);
        camera.position.x += (tf->position.x - camera.position.x) * factor;
        camera.position.y += (tf->position.y - camera.position.y) * factor;
    }
    clampToWorld(camera, world, viewportW, viewportH);
}

void CameraSystem::snapTo(Engine::Camera2D& camera, const Engine::ECS::Registry& registry, Engine::ECS::Entity target,
                          const WorldSettings& world, int viewportW, int viewportH) const {
    camera.zoom = settings_.zoom > 0.0f ? settings_.zoom : 1.0f;
    if (const auto* tf = registry.get<Engine::ECS::Transform>(target)) {
        camera.position = tf->position;
    }
    clampToWorld(camera, world, viewportW, viewportH);
}

void CameraSystem::clampToWorld(Engine::Camera2D& camera, const WorldSettings& world, int viewportW,
                                int viewportH) const {
    const float halfW = static_cast<float>(viewportW) * 0.5f / camera.zoom;
    const float halfH = static_cast<float>(viewportH) * 0.5f / camera.zoom;
    // A world narrower than the view stays centered on that axis.
    if (world.width <= halfW * 2.0f) {
        camera.position.x = world.width * 0.5f;
    } else {
        camera.position.x = std::clamp(camera.position.x, halfW, world.width - halfW);
    }
    if (world.height <= halfH * 2.0f) {
        camera.position.y = world.height * 0.5f;
    } else {
        camera.position.y = std::clamp(camera.position.y, halfH, world.height - halfH);
    }
}

}  // namespace Sundown
