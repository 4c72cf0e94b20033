#include "BuildingSystem.h"

#include <algorithm>
#include <vector>

#include "../../engine/ecs/components/AABB.h"
#include "../../engine/ecs/components/Renderable.h"
#include "../../engine/ecs/components/Tags.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/gameplay/Combat.h"
#include "../../engine/render/Color.h"
#include "../components/PlayerState.h"

namespace Sundown {

Engine::ECS::Entity BuildingSystem::createBuilding(Engine::ECS::Registry& registry, BuildingType type,
                                                   const Engine::Vec2& position) const {
    const BuildingDefinition& def = config_.building(type);
    const auto& c = config_.construction;
    auto e = registry.create();
    registry.emplace<Engine::ECS::Transform>(e, Engine::ECS::Transform{position});
    const float half = def.size * 0.5f;
    registry.emplace<Engine::ECS::AABB>(e, Engine::ECS::AABB{Engine::Vec2{half, half}});
    registry.emplace<Engine::ECS::Health>(e, Engine::ECS::Health{c.startHealth, c.maxHealth});
    registry.emplace<Engine::ECS::BuildingTag>(e, Engine::ECS::BuildingTag{});
    registry.emplace<Engine::ECS::Renderable>(
        e, Engine::ECS::Renderable{Engine::Vec2{def.size, def.size}, Engine::Color::fromHex(def.color), true});

    Building b{};
    b.type = type;
    b.buildTimeMs = def.buildTimeMs;
    b.size = def.size;
    b.healthAtEntry = c.startHealth;
    registry.emplace<Building>(e, b);
    return e;
}

bool BuildingSystem::advanceConstruction(Building& building, Engine::ECS::Health& health, double nowMs,
                                         bool playerProximity, const ConstructionSettings& construction) {
    if (building.built) {
        return false;
    }
    if (playerProximity && !building.playerBuilding) {
        building.playerBuilding = true;
        building.buildStartMs = nowMs;
        building.healthAtEntry = health.current;
    } else if (!playerProximity && building.playerBuilding) {
        building.playerBuilding = false;
        return false;
    }
    if (!building.playerBuilding) {
        return false;
    }

    const float span = construction.maxHealth - construction.startHealth;
    double entryProgress = 0.0;
    if (span > 0.0f) {
        entryProgress = std::clamp(static_cast<double>((building.healthAtEntry - construction.startHealth) / span),
                                   0.0, 1.0);
    }
    double progress = 1.0;
    if (building.buildTimeMs > 0.0) {
        progress = std::clamp(entryProgress + (nowMs - building.buildStartMs) / building.buildTimeMs, 0.0, 1.0);
    }
    health.current = construction.startHealth + span * static_cast<float>(progress);

    if (progress >= 1.0) {
        building.built = true;
        building.playerBuilding = false;
        health.current = health.max;
        return true;
    }
    return false;
}

bool BuildingSystem::isPlayerColliding(const Engine::Vec2& buildingPos, float buildingSize,
                                       const Engine::Vec2& playerPos, float playerSize) {
    return Engine::withinReach(buildingPos, playerPos, (buildingSize + playerSize) * 0.5f);
}

float BuildingSystem::healIfEligible(const Building& building, const Engine::Vec2& buildingPos,
                                     Engine::ECS::Health& playerHealth, const Engine::Vec2& playerPos,
                                     float playerSize, float healPerSecond, float dt) {
    if (!building.built || dt <= 0.0f) {
        return 0.0f;
    }
    if (!isPlayerColliding(buildingPos, building.size, playerPos, playerSize)) {
        return 0.0f;
    }
    return Engine::Gameplay::applyHeal(playerHealth, healPerSecond * dt);
}

void BuildingSystem::update(Engine::ECS::Registry& registry, Engine::ECS::Entity player, double nowMs, float dt) {
    const auto* playerTf = registry.get<Engine::ECS::Transform>(player);
    auto* playerHp = registry.get<Engine::ECS::Health>(player);
    const auto* state = registry.get<PlayerState>(player);
    const bool present = registry.valid(player) && playerTf && playerHp && state && playerHp->alive();

    std::vector<std::pair<Engine::ECS::Entity, BuildingType>> completed;
    registry.view<Engine::ECS::Transform, Engine::ECS::Health, Building>(
        [&](Engine::ECS::Entity e, const Engine::ECS::Transform& tf, Engine::ECS::Health& hp, Building& b) {
            const bool proximity =
                present && isPlayerColliding(tf.position, b.size, playerTf->position, state->size);
            if (advanceConstruction(b, hp, nowMs, proximity, config_.construction)) {
                completed.emplace_back(e, b.type);
            }
            if (present) {
                healIfEligible(b, tf.position, *playerHp, playerTf->position, state->size,
                               config_.construction.healPerSecond, dt);
            }
        });
    for (const auto& [e, type] : completed) {
        events_.onBuildingCompleted(e, type);
    }
}

}  // namespace Sundown
