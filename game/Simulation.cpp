#include "Simulation.h"

#include <string>
#include <utility>

#include "../engine/core/Logger.h"
#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Tags.h"
#include "../engine/ecs/components/Transform.h"
#include "../engine/ecs/components/Velocity.h"
#include "components/Dying.h"
#include "components/PlayerState.h"

namespace Sundown {

namespace {
bool pressed(bool now, bool before) { return now && !before; }
}  // namespace

Simulation::Simulation(GameConfig config, const Engine::Clock& clock, GameEventSink& events, std::uint32_t seed)
    : config_(std::move(config)),
      clock_(clock),
      events_(events),
      players_(config_, events_),
      enemies_(events_),
      combat_(config_, players_, enemies_),
      spawner_(config_, events_, seed),
      buildings_(config_, events_),
      placer_(config_) {
    movement_.setBounds(Engine::Vec2{0.0f, 0.0f}, Engine::Vec2{config_.world.width, config_.world.height});
    nowMs_ = clock_.nowMs();
    spawnPlayer(nowMs_);
    spawner_.reset(nowMs_);
}

void Simulation::spawnPlayer(double nowMs) {
    player_ = players_.spawn(registry_, config_.world.center(), nowMs);
}

void Simulation::reset() {
    registry_.clear();
    deferred_.clear();
    previous_ = Engine::ActionState{};
    nowMs_ = clock_.nowMs();
    spawnPlayer(nowMs_);
    spawner_.reset(nowMs_);
    ++resets_;
    Engine::logInfo("Simulation reset.");
}

bool Simulation::playerAlive() const {
    const auto* hp = registry_.get<Engine::ECS::Health>(player_);
    return registry_.valid(player_) && hp && hp->alive();
}

int Simulation::aliveEnemyCount() const {
    int count = 0;
    registry_.view<Engine::ECS::EnemyTag, Engine::ECS::Health>(
        [&count](Engine::ECS::Entity, const Engine::ECS::EnemyTag&, const Engine::ECS::Health& hp) {
            if (hp.alive()) ++count;
        });
    return count;
}

void Simulation::removeEntity(Engine::ECS::Entity e) {
    registry_.destroy(e);
    // Ids are recycled; a stale entry would shield the next entity given this id.
    if (auto* state = registry_.get<PlayerState>(player_)) {
        state->hitThisSwing.erase(e);
    }
}

void Simulation::runDeferred(double nowMs) {
    deferred_.runDue(nowMs, [this](Engine::ECS::Entity e, DeferredEvent& evt) {
        if (!registry_.valid(e)) {
            return;
        }
        switch (evt.kind) {
            case DeferredKind::EndSwing:
                if (auto* state = registry_.get<PlayerState>(e)) {
                    if (state->swingId == evt.swingId) {
                        state->endSwing();
                    }
                }
                break;
            case DeferredKind::RemoveEntity:
                if (registry_.has<Dying>(e)) {
                    removeEntity(e);
                }
                break;
        }
    });
}

void Simulation::applyPlayerInput(const Engine::ActionState& actions, double nowMs) {
    auto* state = registry_.get<PlayerState>(player_);
    auto* vel = registry_.get<Engine::ECS::Velocity>(player_);
    auto* hp = registry_.get<Engine::ECS::Health>(player_);
    if (!state || !vel || !hp) {
        return;
    }
    if (!hp->alive()) {
        vel->value = Engine::Vec2{0.0f, 0.0f};
        return;
    }

    PlayerSystem::applyMovementInput(*state, *vel, actions);
    if (pressed(actions.selectPrev, previous_.selectPrev)) {
        players_.cycleBuildingSelection(*state, -1);
    }
    if (pressed(actions.selectNext, previous_.selectNext)) {
        players_.cycleBuildingSelection(*state, +1);
    }
    if (pressed(actions.confirmPlacement, previous_.confirmPlacement)) {
        placeSelectedBuilding();
    }
    players_.tickAutoAttack(player_, *state, *hp, nowMs, deferred_);
}

void Simulation::tick(const Engine::ActionState& actions, float dtSeconds) {
    if (pressed(actions.restart, previous_.restart)) {
        reset();
        previous_ = actions;
        return;
    }

    nowMs_ = clock_.nowMs();
    runDeferred(nowMs_);

    applyPlayerInput(actions, nowMs_);
    previous_ = actions;

    enemies_.update(registry_);
    movement_.update(registry_, dtSeconds);
    combat_.update(registry_, player_, nowMs_, deferred_);
    spawner_.maybeSpawn(registry_, player_, nowMs_, aliveEnemyCount());
    buildings_.update(registry_, player_, nowMs_, dtSeconds);
}

void Simulation::cycleBuildingSelection(int direction) {
    if (auto* state = registry_.get<PlayerState>(player_)) {
        players_.cycleBuildingSelection(*state, direction);
    }
}

Engine::ECS::Entity Simulation::placeSelectedBuilding() {
    const auto* state = registry_.get<PlayerState>(player_);
    const auto* tf = registry_.get<Engine::ECS::Transform>(player_);
    if (!state || !tf || !playerAlive()) {
        return Engine::ECS::kInvalidEntity;
    }
    const BuildingType type = PlayerSystem::selectedType(*state);
    events_.onBuildingPlacementRequested(type);

    const PlacementResult result =
        placer_.resolvePlacement(tf->position, state->facing, type, BuildingPlacer::collectFootprints(registry_));
    if (result.degraded) {
        Engine::logWarn(std::string("No free spot for ") + config_.building(type).name + "; placing at (" +
                        std::to_string(result.position.x) + ", " + std::to_string(result.position.y) +
                        ") over an existing building.");
        events_.onPlacementDegraded(type, result.position);
    }
    return placeBuilding(type, result.position);
}

Engine::ECS::Entity Simulation::placeBuilding(BuildingType type, const Engine::Vec2& position) {
    auto e = buildings_.createBuilding(registry_, type, position);
    events_.onBuildingPlaced(e, type);
    return e;
}

Engine::ECS::Entity Simulation::spawnEnemy(EnemyTypeId type, const Engine::Vec2& position) {
    return spawner_.spawnEnemy(registry_, type, position, player_);
}

}  // namespace Sundown
