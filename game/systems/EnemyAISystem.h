// Straight-line chase toward the target plus enemy damage and death handling.
#pragma once

#include "../../engine/ecs/Registry.h"
#include "../../engine/math/Vec2.h"
#include "../DeferredEvent.h"
#include "../GameEvents.h"

namespace Sundown {

// Dead enemies stay in the registry this long before removal.
constexpr double kEnemyRemovalDelayMs = 100.0;

class EnemyAISystem {
public:
    explicit EnemyAISystem(GameEventSink& events) : events_(events) {}

    // Zero inside attackRange (squared test), otherwise `speed` along the normalized
    // displacement. The square root is only taken when moving.
    static Engine::Vec2 chaseVelocity(const Engine::Vec2& from, const Engine::Vec2& to, float speed,
                                      float attackRange);

    // Alive enemies chase their target; a missing or dead target leaves them idle.
    void update(Engine::ECS::Registry& registry);

    // Returns true on the killing blow: the enemy stops, is hidden, and its removal is
    // scheduled kEnemyRemovalDelayMs later.
    bool takeDamage(Engine::ECS::Registry& registry, Engine::ECS::Entity enemy, float amount, double nowMs,
                    DeferredEvents& deferred);

private:
    GameEventSink& events_;
};

}  // namespace Sundown
