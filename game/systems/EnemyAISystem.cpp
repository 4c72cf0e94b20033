#include "EnemyAISystem.h"

#include <cmath>

#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Renderable.h"
#include "../../engine/ecs/components/Tags.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/ecs/components/Velocity.h"
#include "../../engine/gameplay/Combat.h"
#include "../components/Dying.h"
#include "../components/EnemyState.h"

namespace Sundown {

Engine::Vec2 EnemyAISystem::chaseVelocity(const Engine::Vec2& from, const Engine::Vec2& to, float speed,
                                          float attackRange) {
    const Engine::Vec2 delta = to - from;
    const float d2 = delta.lengthSquared();
    if (d2 <= attackRange * attackRange || d2 <= 0.0f) {
        return Engine::Vec2{0.0f, 0.0f};
    }
    const float len = std::sqrt(d2);
    return delta * (speed / len);
}

void EnemyAISystem::update(Engine::ECS::Registry& registry) {
    registry.view<Engine::ECS::Transform, Engine::ECS::Velocity, Engine::ECS::Health, EnemyState>(
        [&registry](Engine::ECS::Entity, const Engine::ECS::Transform& tf, Engine::ECS::Velocity& vel,
                    const Engine::ECS::Health& hp, const EnemyState& enemy) {
            if (!hp.alive()) {
                vel.value = Engine::Vec2{0.0f, 0.0f};
                return;
            }
            const Engine::ECS::Transform* targetTf = nullptr;
            if (registry.valid(enemy.target)) {
                const auto* targetHp = registry.get<Engine::ECS::Health>(enemy.target);
                if (targetHp && targetHp->alive()) {
                    targetTf = registry.get<Engine::ECS::Transform>(enemy.target);
                }
            }
            if (!targetTf) {
                vel.value = Engine::Vec2{0.0f, 0.0f};
                return;
            }
            vel.value = chaseVelocity(tf.position, targetTf->position, enemy.speed, enemy.attackRange);
        });
}

bool EnemyAISystem::takeDamage(Engine::ECS::Registry& registry, Engine::ECS::Entity enemy, float amount,
                               double nowMs, DeferredEvents& deferred) {
    auto* hp = registry.get<Engine::ECS::Health>(enemy);
    if (!hp || !registry.has<Engine::ECS::EnemyTag>(enemy)) {
        return false;
    }
    const float dealt = Engine::Gameplay::applyDamage(*hp, amount);
    if (dealt <= 0.0f || hp->alive()) {
        return false;
    }
    if (auto* vel = registry.get<Engine::ECS::Velocity>(enemy)) {
        vel->value = Engine::Vec2{0.0f, 0.0f};
    }
    if (auto* rend = registry.get<Engine::ECS::Renderable>(enemy)) {
        rend->visible = false;
    }
    const double removeAt = nowMs + kEnemyRemovalDelayMs;
    registry.emplace<Dying>(enemy, Dying{removeAt});
    deferred.schedule(removeAt, enemy, DeferredEvent{DeferredKind::RemoveEntity, 0});
    events_.onEnemyKilled(enemy);
    return true;
}

}  // namespace Sundown
