#include "PlayerSystem.h"

#include "../../engine/ecs/components/AABB.h"
#include "../../engine/ecs/components/Renderable.h"
#include "../../engine/ecs/components/Tags.h"
#include "../../engine/gameplay/Combat.h"
#include "../../engine/render/Color.h"

namespace Sundown {

Engine::ECS::Entity PlayerSystem::spawn(Engine::ECS::Registry& registry, const Engine::Vec2& position,
                                        double nowMs) const {
    const auto& p = config_.player;
    auto e = registry.create();
    registry.emplace<Engine::ECS::Transform>(e, Engine::ECS::Transform{position});
    registry.emplace<Engine::ECS::Velocity>(e, Engine::ECS::Velocity{});
    const float half = p.size * 0.5f;
    registry.emplace<Engine::ECS::AABB>(e, Engine::ECS::AABB{Engine::Vec2{half, half}});
    registry.emplace<Engine::ECS::Health>(e, Engine::ECS::Health{p.maxHealth, p.maxHealth});
    registry.emplace<Engine::ECS::PlayerTag>(e, Engine::ECS::PlayerTag{});
    const float visual = p.size * p.scale;
    registry.emplace<Engine::ECS::Renderable>(
        e, Engine::ECS::Renderable{Engine::Vec2{visual, visual}, Engine::Color::fromHex(p.color), true});

    PlayerState state{};
    state.speed = p.speed;
    state.size = p.size;
    state.lastAutoAttackMs = nowMs;
    registry.emplace<PlayerState>(e, std::move(state));
    return e;
}

void PlayerSystem::applyMovementInput(PlayerState& state, Engine::ECS::Velocity& velocity,
                                      const Engine::ActionState& actions) {
    velocity.value = Engine::Vec2{0.0f, 0.0f};
    if (actions.moveUp) {
        velocity.value.y = -state.speed;
        state.facing = Engine::Vec2{0.0f, -1.0f};
    }
    if (actions.moveDown) {
        velocity.value.y = state.speed;
        state.facing = Engine::Vec2{0.0f, 1.0f};
    }
    if (actions.moveLeft) {
        velocity.value.x = -state.speed;
        state.facing = Engine::Vec2{-1.0f, 0.0f};
    }
    if (actions.moveRight) {
        velocity.value.x = state.speed;
        state.facing = Engine::Vec2{1.0f, 0.0f};
    }
}

float PlayerSystem::takeDamage(PlayerState& state, Engine::ECS::Health& health, Engine::ECS::Velocity& velocity,
                               float amount) {
    const float dealt = Engine::Gameplay::applyDamage(health, amount);
    if (dealt > 0.0f && !health.alive() && !state.deathReported) {
        state.deathReported = true;
        velocity.value = Engine::Vec2{0.0f, 0.0f};
        state.endSwing();
        events_.onPlayerDied();
    }
    return dealt;
}

float PlayerSystem::heal(Engine::ECS::Health& health, float amount) {
    return Engine::Gameplay::applyHeal(health, amount);
}

bool PlayerSystem::tickAutoAttack(Engine::ECS::Entity player, PlayerState& state, const Engine::ECS::Health& health,
                                  double nowMs, DeferredEvents& deferred) const {
    const auto& attack = config_.player.attack;
    if (!health.alive() || nowMs - state.lastAutoAttackMs < attack.intervalMs) {
        return false;
    }
    state.lastAutoAttackMs = nowMs;
    state.hitThisSwing.clear();
    state.attackActive = true;
    state.swingDir = state.facing;
    ++state.swingId;
    deferred.schedule(nowMs + attack.visualDurationMs, player, DeferredEvent{DeferredKind::EndSwing, state.swingId});
    return true;
}

Engine::Vec2 PlayerSystem::attackCenter(const Engine::ECS::Transform& transform, const PlayerState& state) const {
    return transform.position + state.swingDir * config_.player.attack.range;
}

void PlayerSystem::cycleBuildingSelection(PlayerState& state, int direction) {
    if (direction == 0) return;
    const auto count = static_cast<long long>(kBuildingTypeCount);
    long long next = static_cast<long long>(state.selectedBuildingIndex) + direction;
    next = ((next % count) + count) % count;
    state.selectedBuildingIndex = static_cast<std::size_t>(next);
    events_.onBuildingSelectionChanged(state.selectedBuildingIndex, selectedType(state));
}

BuildingType PlayerSystem::selectedType(const PlayerState& state) {
    return kBuildingOrder[state.selectedBuildingIndex % kBuildingTypeCount];
}

}  // namespace Sundown
