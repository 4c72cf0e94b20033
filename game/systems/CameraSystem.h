// Smooth camera follow clamped to the world rectangle.
#pragma once

#include "../../engine/ecs/Registry.h"
#include "../../engine/render/Camera2D.h"
#include "../GameConfig.h"

namespace Sundown {

class CameraSystem {
public:
    explicit CameraSystem(const CameraSettings& settings = {}) : settings_(settings) {}

    // Moves followLerp of the remaining distance toward the target each frame.
    void update(Engine::Camera2D& camera, const Engine::ECS::Registry& registry, Engine::ECS::Entity target,
                const WorldSettings& world, int viewportW, int viewportH) const;

    // Jumps straight to the target; used on spawn and restart.
    void snapTo(Engine::Camera2D& camera, const Engine::ECS::Registry& registry, Engine::ECS::Entity target,
                const WorldSettings& world, int viewportW, int viewportH) const;

    void setSettings(const CameraSettings& settings) { settings_ = settings; }

private:
    void clampToWorld(Engine::Camera2D& camera, const WorldSettings& world, int viewportW, int viewportH) const;

    CameraSettings settings_;
};

}  // namespace Sundown
