// Player rules: movement input, damage and death, auto-attack timing, building selection.
#pragma once

#include <cstddef>

#include "../../engine/ecs/Registry.h"
#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/ecs/components/Velocity.h"
#include "../../engine/input/ActionState.h"
#include "../../engine/math/Vec2.h"
#include "../DeferredEvent.h"
#include "../GameConfig.h"
#include "../GameEvents.h"
#include "../components/PlayerState.h"

namespace Sundown {

class PlayerSystem {
public:
    PlayerSystem(const GameConfig& config, GameEventSink& events) : config_(config), events_(events) {}

    // Creates the player entity at `position` with full health. The first swing comes one
    // interval after `nowMs`.
    Engine::ECS::Entity spawn(Engine::ECS::Registry& registry, const Engine::Vec2& position, double nowMs) const;

    // Directions are checked up, down, left, right; each pressed one sets its axis and
    // overwrites the facing. Unpressed axes are zero.
    static void applyMovementInput(PlayerState& state, Engine::ECS::Velocity& velocity,
                                   const Engine::ActionState& actions);

    // Returns the damage applied. On the lethal hit the player stops, the swing is
    // cancelled and onPlayerDied fires once.
    float takeDamage(PlayerState& state, Engine::ECS::Health& health, Engine::ECS::Velocity& velocity,
                     float amount);
    static float heal(Engine::ECS::Health& health, float amount);

    // Starts a swing when the interval has elapsed and schedules its expiry. Returns true
    // if a swing started.
    bool tickAutoAttack(Engine::ECS::Entity player, PlayerState& state, const Engine::ECS::Health& health,
                        double nowMs, DeferredEvents& deferred) const;

    // Center of the attack hitbox for the current swing.
    Engine::Vec2 attackCenter(const Engine::ECS::Transform& transform, const PlayerState& state) const;

    // Wraps in both directions and emits onBuildingSelectionChanged.
    void cycleBuildingSelection(PlayerState& state, int direction);
    static BuildingType selectedType(const PlayerState& state);

private:
    const GameConfig& config_;
    GameEventSink& events_;
};

}  // namespace Sundown
