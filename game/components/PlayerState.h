// Player-only state layered on top of the shared actor components.
#pragma once

#include <cstddef>
#include <unordered_set>

#include "../../engine/ecs/Entity.h"
#include "../../engine/math/Vec2.h"

namespace Sundown {

struct PlayerState {
    float speed{100.0f};
    float size{32.0f};
    Engine::Vec2 facing{1.0f, 0.0f};  // last resolved movement direction

    double lastAutoAttackMs{0.0};
    bool attackActive{false};
    Engine::Vec2 swingDir{1.0f, 0.0f};  // facing captured when the swing started
    unsigned swingId{0};               // bumps per swing so stale expiries are ignored
    std::unordered_set<Engine::ECS::Entity> hitThisSwing;

    std::size_t selectedBuildingIndex{0};
    bool deathReported{false};

    bool hasHitEnemy(Engine::ECS::Entity e) const { return hitThisSwing.count(e) > 0; }
    void markEnemyHit(Engine::ECS::Entity e) { hitThisSwing.insert(e); }

    void endSwing() {
        attackActive = false;
        hitThisSwing.clear();
    }
};

}  // namespace Sundown
