// Chase and attack-cooldown state for hostile units.
#pragma once

#include <limits>

#include "../../engine/ecs/Entity.h"
#include "../GameConfig.h"

namespace Sundown {

struct EnemyState {
    EnemyTypeId type{EnemyTypeId::Dog};
    float speed{50.0f};
    float damage{5.0f};
    float attackRange{10.0f};
    double attackCooldownMs{1000.0};
    float hitboxSize{26.0f};
    double lastAttackMs{-std::numeric_limits<double>::infinity()};  // never attacked
    Engine::ECS::Entity target{Engine::ECS::kInvalidEntity};     // non-owning

    bool canAttack(double nowMs) const { return nowMs - lastAttackMs >= attackCooldownMs; }
    void recordAttack(double nowMs) { lastAttackMs = nowMs; }
};

}  // namespace Sundown
