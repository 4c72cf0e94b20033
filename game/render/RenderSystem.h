// Game-layer render system: world, entities, health bars and the building HUD.
#pragma once

#include "../../engine/ecs/Registry.h"
#include "../../engine/render/Camera2D.h"
#include "../../engine/render/RenderDevice.h"
#include "../GameConfig.h"

namespace Sundown {

class RenderSystem {
public:
    RenderSystem(Engine::RenderDevice& device, const GameConfig& config) : device_(device), config_(config) {}

    void draw(const Engine::ECS::Registry& registry, Engine::ECS::Entity player, const Engine::Camera2D& camera,
              int viewportW, int viewportH);

private:
    void drawWorld(const Engine::Camera2D& camera, int viewportW, int viewportH);
    void drawBuildings(const Engine::ECS::Registry& registry, const Engine::Camera2D& camera, int viewportW,
                       int viewportH);
    void drawEnemies(const Engine::ECS::Registry& registry, const Engine::Camera2D& camera, int viewportW,
                     int viewportH);
    void drawPlayer(const Engine::ECS::Registry& registry, Engine::ECS::Entity player, const Engine::Camera2D& camera,
                    int viewportW, int viewportH);
    void drawHealthBar(const Engine::Vec2& anchor, float fraction, const Engine::Color& fill);
    void drawSelectionHud(const Engine::ECS::Registry& registry, Engine::ECS::Entity player, int viewportW,
                          int viewportH);
    void drawGameOver(int viewportW, int viewportH);

    Engine::RenderDevice& device_;
    const GameConfig& config_;
};

}  // namespace Sundown
