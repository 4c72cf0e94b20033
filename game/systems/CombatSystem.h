// Turns proximity into damage: enemy contact hits on the player and player swings on enemies.
#pragma once

#include "../../engine/ecs/Registry.h"
#include "../DeferredEvent.h"
#include "../GameConfig.h"
#include "EnemyAISystem.h"
#include "PlayerSystem.h"

namespace Sundown {

struct CombatReport {
    int enemyHitsOnPlayer{0};
    int swingHits{0};
    int kills{0};
};

class CombatSystem {
public:
    CombatSystem(const GameConfig& config, PlayerSystem& players, EnemyAISystem& enemies)
        : config_(config), players_(players), enemies_(enemies) {}

    // Enemies within (hitbox + playerSize) / 2 whose cooldown allows it damage the player.
    // While a swing is active, each alive enemy overlapping the attack box takes the attack
    // damage at most once per swing.
    CombatReport update(Engine::ECS::Registry& registry, Engine::ECS::Entity player, double nowMs,
                        DeferredEvents& deferred);

private:
    const GameConfig& config_;
    PlayerSystem& players_;
    EnemyAISystem& enemies_;
};

}  // namespace Sundown
