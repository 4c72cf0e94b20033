// Construction progress while the player stands on site, and healing from finished buildings.
#pragma once

#include "../../engine/ecs/Registry.h"
#include "../../engine/ecs/components/Health.h"
#include "../../engine/math/Vec2.h"
#include "../GameConfig.h"
#include "../GameEvents.h"
#include "../components/Building.h"

namespace Sundown {

class BuildingSystem {
public:
    BuildingSystem(const GameConfig& config, GameEventSink& events) : config_(config), events_(events) {}

    Engine::ECS::Entity createBuilding(Engine::ECS::Registry& registry, BuildingType type,
                                       const Engine::Vec2& position) const;

    // Entering the site records the start time and current health; leaving freezes health.
    // While on site health = start + span * clamp(entryProgress + elapsed / buildTime, 0, 1),
    // so progress carries over between visits and never goes backwards.
    // Returns true on the tick construction completes.
    static bool advanceConstruction(Building& building, Engine::ECS::Health& health, double nowMs,
                                    bool playerProximity, const ConstructionSettings& construction);

    // Squared-distance overlap against (buildingSize + playerSize) / 2.
    static bool isPlayerColliding(const Engine::Vec2& buildingPos, float buildingSize, const Engine::Vec2& playerPos,
                                  float playerSize);

    // Heals healPerSecond * dt when the building is finished and the player overlaps it.
    // Returns the amount healed.
    static float healIfEligible(const Building& building, const Engine::Vec2& buildingPos,
                                Engine::ECS::Health& playerHealth, const Engine::Vec2& playerPos, float playerSize,
                                float healPerSecond, float dt);

    void update(Engine::ECS::Registry& registry, Engine::ECS::Entity player, double nowMs, float dt);

private:
    const GameConfig& config_;
    GameEventSink& events_;
};

}  // namespace Sundown
