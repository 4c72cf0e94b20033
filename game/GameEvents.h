// Notifications the simulation emits to its host (HUD, audio, logging).
#pragma once

#include <cstddef>

#include "../engine/ecs/Entity.h"
#include "../engine/math/Vec2.h"
#include "GameConfig.h"

namespace Sundown {

class GameEventSink {
public:
    virtual ~GameEventSink() = default;

    virtual void onBuildingSelectionChanged(std::size_t index, BuildingType type) = 0;
    virtual void onBuildingPlacementRequested(BuildingType type) = 0;
    virtual void onBuildingPlaced(Engine::ECS::Entity building, BuildingType type) = 0;
    // Every candidate spot was occupied; the building was placed overlapping another.
    virtual void onPlacementDegraded(BuildingType type, const Engine::Vec2& position) = 0;
    virtual void onBuildingCompleted(Engine::ECS::Entity building, BuildingType type) = 0;
    virtual void onEnemySpawned(Engine::ECS::Entity enemy) = 0;
    virtual void onEnemyKilled(Engine::ECS::Entity enemy) = 0;
    // Fires once per life.
    virtual void onPlayerDied() = 0;
};

class NullGameEventSink final : public GameEventSink {
public:
    void onBuildingSelectionChanged(std::size_t, BuildingType) override {}
    void onBuildingPlacementRequested(BuildingType) override {}
    void onBuildingPlaced(Engine::ECS::Entity, BuildingType) override {}
    void onPlacementDegraded(BuildingType, const Engine::Vec2&) override {}
    void onBuildingCompleted(Engine::ECS::Entity, BuildingType) override {}
    void onEnemySpawned(Engine::ECS::Entity) override {}
    void onEnemyKilled(Engine::ECS::Entity) override {}
    void onPlayerDied() override {}
};

}  // namespace Sundown
