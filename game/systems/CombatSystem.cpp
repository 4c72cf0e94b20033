#include "CombatSystem.h"

#include <vector>

#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Tags.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/ecs/components/Velocity.h"
#include "../components/EnemyState.h"
#include "../components/PlayerState.h"

namespace Sundown {

CombatReport CombatSystem::update(Engine::ECS::Registry& registry, Engine::ECS::Entity player, double nowMs,
                                  DeferredEvents& deferred) {
    CombatReport report{};
    if (!registry.valid(player)) {
        return report;
    }
    auto* state = registry.get<PlayerState>(player);
    auto* playerTf = registry.get<Engine::ECS::Transform>(player);
    auto* playerHp = registry.get<Engine::ECS::Health>(player);
    auto* playerVel = registry.get<Engine::ECS::Velocity>(player);
    if (!state || !playerTf || !playerHp || !playerVel) {
        return report;
    }

    // Enemy -> player. Stops as soon as the player is down.
    registry.view<Engine::ECS::Transform, Engine::ECS::Health, EnemyState>(
        [&](Engine::ECS::Entity, const Engine::ECS::Transform& tf, const Engine::ECS::Health& hp, EnemyState& enemy) {
            if (!hp.alive() || !playerHp->alive()) return;
            const float reach = (enemy.hitboxSize + state->size) * 0.5f;
            if (!Engine::withinReach(tf.position, playerTf->position, reach)) return;
            if (!enemy.canAttack(nowMs)) return;
            players_.takeDamage(*state, *playerHp, *playerVel, enemy.damage);
            enemy.recordAttack(nowMs);
            ++report.enemyHitsOnPlayer;
        });

    // Player swing -> enemies.
    if (!state->attackActive || !playerHp->alive()) {
        return report;
    }
    const auto& attack = config_.player.attack;
    const Engine::Vec2 center = players_.attackCenter(*playerTf, *state);
    std::vector<Engine::ECS::Entity> struck;
    registry.view<Engine::ECS::Transform, Engine::ECS::Health, EnemyState>(
        [&](Engine::ECS::Entity e, const Engine::ECS::Transform& tf, const Engine::ECS::Health& hp,
            const EnemyState& enemy) {
            if (!hp.alive() || state->hasHitEnemy(e)) return;
            const float reach = (attack.size + enemy.hitboxSize) * 0.5f;
            if (Engine::withinReach(center, tf.position, reach)) {
                struck.push_back(e);
            }
        });
    for (auto e : struck) {
        state->markEnemyHit(e);
        ++report.swingHits;
        if (enemies_.takeDamage(registry, e, attack.damage, nowMs, deferred)) {
            ++report.kills;
        }
    }
    return report;
}

}  // namespace Sundown
