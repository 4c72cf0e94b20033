// Player damage, healing, movement, auto-attack and building selection.
#include <algorithm>
#include <cassert>

#include "../engine/ecs/Registry.h"
#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Transform.h"
#include "../engine/ecs/components/Velocity.h"
#include "../game/DeferredEvent.h"
#include "../game/GameConfig.h"
#include "../game/components/PlayerState.h"
#include "../game/systems/PlayerSystem.h"
#include "RecordingSink.h"

using namespace Sundown;

int main() {
    const GameConfig config{};
    {
        // Damage never drives health below zero.
        RecordingSink sink;
        PlayerSystem players(config, sink);
        const float starts[] = {100.0f, 50.0f, 7.5f, 1.0f};
        const float hits[] = {0.0f, 5.0f, 7.5f, 20.0f, 250.0f};
        for (float h : starts) {
            for (float d : hits) {
                PlayerState state{};
                Engine::ECS::Health hp{h, 100.0f};
                Engine::ECS::Velocity vel{};
                players.takeDamage(state, hp, vel, d);
                assert(hp.current == std::max(0.0f, h - d));
                assert(hp.current >= 0.0f);
            }
        }
    }
    {
        // Lethal hit: stops the player, cancels the swing, reports death exactly once.
        RecordingSink sink;
        PlayerSystem players(config, sink);
        PlayerState state{};
        state.attackActive = true;
        state.markEnemyHit(7);
        Engine::ECS::Health hp{10.0f, 100.0f};
        Engine::ECS::Velocity vel{Engine::Vec2{100.0f, 0.0f}};
        assert(players.takeDamage(state, hp, vel, 15.0f) == 10.0f);
        assert(!hp.alive());
        assert(vel.value == Engine::Vec2(0.0f, 0.0f));
        assert(!state.attackActive);
        assert(state.hitThisSwing.empty());
        assert(sink.playerDeaths == 1);
        assert(players.takeDamage(state, hp, vel, 15.0f) == 0.0f);
        assert(sink.playerDeaths == 1);
        // Dead players cannot be healed.
        assert(PlayerSystem::heal(hp, 50.0f) == 0.0f);
        assert(hp.current == 0.0f);
    }
    {
        // Healing is capped at max; negative amounts are ignored.
        Engine::ECS::Health hp{60.0f, 100.0f};
        for (int i = 0; i < 10; ++i) {
            PlayerSystem::heal(hp, 17.0f);
            assert(hp.current <= hp.max);
        }
        assert(hp.current == 100.0f);
        hp.current = 40.0f;
        assert(PlayerSystem::heal(hp, -5.0f) == 0.0f);
        assert(hp.current == 40.0f);
    }
    {
        // Movement: later directions overwrite facing; idle zeroes velocity.
        PlayerState state{};
        Engine::ECS::Velocity vel{};
        Engine::ActionState act{};
        act.moveUp = true;
        act.moveLeft = true;
        PlayerSystem::applyMovementInput(state, vel, act);
        assert(vel.value == Engine::Vec2(-100.0f, -100.0f));
        assert(state.facing == Engine::Vec2(-1.0f, 0.0f));

        act = Engine::ActionState{};
        act.moveUp = true;
        act.moveDown = true;
        PlayerSystem::applyMovementInput(state, vel, act);
        assert(vel.value == Engine::Vec2(0.0f, 100.0f));
        assert(state.facing == Engine::Vec2(0.0f, 1.0f));

        PlayerSystem::applyMovementInput(state, vel, Engine::ActionState{});
        assert(vel.value == Engine::Vec2(0.0f, 0.0f));
        // Facing survives standing still.
        assert(state.facing == Engine::Vec2(0.0f, 1.0f));
    }
    {
        // Auto-attack waits one interval after spawn, then schedules its expiry.
        RecordingSink sink;
        PlayerSystem players(config, sink);
        Engine::ECS::Registry registry;
        DeferredEvents deferred;
        auto player = players.spawn(registry, Engine::Vec2{500.0f, 500.0f}, 0.0);
        auto& state = *registry.get<PlayerState>(player);
        const auto& hp = *registry.get<Engine::ECS::Health>(player);
        assert(hp.current == config.player.maxHealth);

        assert(!players.tickAutoAttack(player, state, hp, 1999.0, deferred));
        assert(!state.attackActive);
        state.facing = Engine::Vec2{0.0f, -1.0f};
        assert(players.tickAutoAttack(player, state, hp, 2000.0, deferred));
        assert(state.attackActive);
        assert(state.lastAutoAttackMs == 2000.0);
        assert(deferred.size() == 1);
        assert(deferred.nextDueMs() == 2300.0);

        const auto center = players.attackCenter(*registry.get<Engine::ECS::Transform>(player), state);
        assert(center == Engine::Vec2(500.0f, 440.0f));
        // Turning mid-swing does not move the hitbox direction.
        state.facing = Engine::Vec2{1.0f, 0.0f};
        assert(players.attackCenter(*registry.get<Engine::ECS::Transform>(player), state) == center);

        // Nothing new until the next interval.
        assert(!players.tickAutoAttack(player, state, hp, 3999.0, deferred));
        assert(players.tickAutoAttack(player, state, hp, 4000.0, deferred));
        assert(state.swingId == 2);
    }
    {
        // Hit set is an idempotent membership test.
        PlayerState state{};
        assert(!state.hasHitEnemy(3));
        state.markEnemyHit(3);
        state.markEnemyHit(3);
        assert(state.hasHitEnemy(3));
        assert(state.hitThisSwing.size() == 1);
        state.endSwing();
        assert(!state.hasHitEnemy(3));
    }
    {
        // Selection wraps in both directions and notifies each change.
        RecordingSink sink;
        PlayerSystem players(config, sink);
        PlayerState state{};
        players.cycleBuildingSelection(state, -1);
        assert(state.selectedBuildingIndex == 3);
        assert(PlayerSystem::selectedType(state) == BuildingType::Turret);
        players.cycleBuildingSelection(state, +1);
        assert(state.selectedBuildingIndex == 0);
        players.cycleBuildingSelection(state, +1);
        assert(state.selectedBuildingIndex == 1);
        assert(sink.selections.size() == 3);
        assert(sink.selections.back() == 1);
    }
    return 0;
}
