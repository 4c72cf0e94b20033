// Per-frame orchestration of the player, enemies, combat, spawning and buildings.
#pragma once

#include <cstddef>
#include <cstdint>

#include "../engine/core/Clock.h"
#include "../engine/ecs/Registry.h"
#include "../engine/input/ActionState.h"
#include "DeferredEvent.h"
#include "GameConfig.h"
#include "GameEvents.h"
#include "systems/BuildingPlacer.h"
#include "systems/BuildingSystem.h"
#include "systems/CombatSystem.h"
#include "systems/EnemyAISystem.h"
#include "systems/MovementSystem.h"
#include "systems/PlayerSystem.h"
#include "systems/SpawnSystem.h"

namespace Sundown {

class Simulation {
public:
    // The config is copied and never changes afterwards. `clock` and `events` must outlive
    // the simulation. The player is spawned immediately.
    Simulation(GameConfig config, const Engine::Clock& clock, GameEventSink& events, std::uint32_t seed = 0);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // One frame: a single clock snapshot, due deferred events, player input, chase,
    // movement, combat, spawning, then construction and healing.
    void tick(const Engine::ActionState& actions, float dtSeconds);

    // Clears every entity and pending event, respawns the player at the world center and
    // restarts the spawn timer.
    void reset();

    // Places the selected building type in front of the player. Returns kInvalidEntity
    // when the player is dead.
    Engine::ECS::Entity placeSelectedBuilding();
    void cycleBuildingSelection(int direction);

    Engine::ECS::Entity spawnEnemy(EnemyTypeId type, const Engine::Vec2& position);
    Engine::ECS::Entity placeBuilding(BuildingType type, const Engine::Vec2& position);

    Engine::ECS::Registry& registry() { return registry_; }
    const Engine::ECS::Registry& registry() const { return registry_; }
    const GameConfig& config() const { return config_; }
    const PlayerSystem& playerSystem() const { return players_; }

    Engine::ECS::Entity player() const { return player_; }
    bool playerAlive() const;
    int aliveEnemyCount() const;
    std::size_t pendingDeferred() const { return deferred_.size(); }
    double lastTickMs() const { return nowMs_; }
    // Bumps on every reset; entity ids restart from scratch, so hosts compare this instead.
    unsigned resetCount() const { return resets_; }

private:
    void spawnPlayer(double nowMs);
    void runDeferred(double nowMs);
    void removeEntity(Engine::ECS::Entity e);
    void applyPlayerInput(const Engine::ActionState& actions, double nowMs);

    const GameConfig config_;
    const Engine::Clock& clock_;
    GameEventSink& events_;

    Engine::ECS::Registry registry_;
    DeferredEvents deferred_;

    PlayerSystem players_;
    EnemyAISystem enemies_;
    CombatSystem combat_;
    SpawnSystem spawner_;
    BuildingSystem buildings_;
    BuildingPlacer placer_;
    MovementSystem movement_;

    Engine::ECS::Entity player_{Engine::ECS::kInvalidEntity};
    Engine::ActionState previous_{};
    double nowMs_{0.0};
    unsigned resets_{0};
};

}  // namespace Sundown
