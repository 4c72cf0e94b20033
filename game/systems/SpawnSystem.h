// Time- and count-gated enemy spawning on a ring around the player.
#pragma once

#include <cstdint>
#include <random>

#include "../../engine/ecs/Registry.h"
#include "../../engine/math/Vec2.h"
#include "../GameConfig.h"
#include "../GameEvents.h"

namespace Sundown {

class SpawnSystem {
public:
    SpawnSystem(const GameConfig& config, GameEventSink& events, std::uint32_t seed);

    // playerAlive && activeEnemyCount < maxEnemies && interval elapsed since the last spawn.
    bool shouldSpawn(double nowMs, int activeEnemyCount, bool playerAlive) const;

    // Spawns one enemy when shouldSpawn allows it. Returns the new entity or kInvalidEntity.
    Engine::ECS::Entity maybeSpawn(Engine::ECS::Registry& registry, Engine::ECS::Entity player, double nowMs,
                                   int activeEnemyCount);

    // Random angle, configured distance from `center`, clamped inside the spawn margin.
    Engine::Vec2 pickSpawnPosition(const Engine::Vec2& center);

    // Builds an enemy of `type` at `position` chasing `target` and emits onEnemySpawned.
    Engine::ECS::Entity spawnEnemy(Engine::ECS::Registry& registry, EnemyTypeId type, const Engine::Vec2& position,
                                   Engine::ECS::Entity target);

    void reset(double nowMs) { lastSpawnMs_ = nowMs; }
    double lastSpawnMs() const { return lastSpawnMs_; }

private:
    const GameConfig& config_;
    GameEventSink& events_;
    std::mt19937 rng_;
    double lastSpawnMs_{0.0};
};

}  // namespace Sundown
