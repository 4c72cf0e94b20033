// End-to-end frame scenarios plus a short headless run of the full application.
#include <cassert>
#include <cmath>
#include <memory>

#include "../engine/core/Application.h"
#include "../engine/core/Clock.h"
#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Tags.h"
#include "../engine/ecs/components/Transform.h"
#include "../engine/ecs/components/Velocity.h"
#include "../engine/platform/NullWindow.h"
#include "../game/Game.h"
#include "../game/Simulation.h"
#include "../game/components/Building.h"
#include "../game/components/PlayerState.h"
#include "RecordingSink.h"

using namespace Sundown;

namespace {
constexpr float kDt = 1.0f / 60.0f;

void runFrames(Simulation& sim, Engine::ManualClock& clock, int frames, const Engine::ActionState& actions = {}) {
    for (int i = 0; i < frames; ++i) {
        clock.advance(1000.0 / 60.0);
        sim.tick(actions, kDt);
    }
}
}  // namespace

int main() {
    {
        // Fresh session: player centered with full health, nothing else alive.
        const GameConfig config{};
        Engine::ManualClock clock(0.0);
        RecordingSink sink;
        Simulation sim(config, clock, sink, 1);
        const auto* tf = sim.registry().get<Engine::ECS::Transform>(sim.player());
        assert(tf->position == config.world.center());
        assert(sim.playerAlive());
        assert(sim.aliveEnemyCount() == 0);
        assert(sim.registry().alive() == 1);
    }
    {
        // Enemies arrive on the spawn interval.
        const GameConfig config{};
        Engine::ManualClock clock(0.0);
        RecordingSink sink;
        Simulation sim(config, clock, sink, 1);
        runFrames(sim, clock, 59);
        assert(sink.spawned == 0);
        runFrames(sim, clock, 2);
        assert(sink.spawned == 1);
        assert(sim.aliveEnemyCount() == 1);
        runFrames(sim, clock, 60);
        assert(sink.spawned == 2);
    }
    {
        // Held buttons fire once; movement is applied every frame and clamped to the world.
        GameConfig config{};
        config.spawn.maxEnemies = 0;
        Engine::ManualClock clock(0.0);
        RecordingSink sink;
        Simulation sim(config, clock, sink, 1);

        Engine::ActionState act{};
        act.selectNext = true;
        runFrames(sim, clock, 3, act);
        assert(sink.selections.size() == 1);
        act.selectNext = false;
        runFrames(sim, clock, 1, act);
        act.selectPrev = true;
        runFrames(sim, clock, 1, act);
        runFrames(sim, clock, 1, act);
        assert(sink.selections.size() == 2);
        assert(sim.registry().get<PlayerState>(sim.player())->selectedBuildingIndex == 0);

        Engine::ActionState left{};
        left.moveLeft = true;
        runFrames(sim, clock, 60 * 30, left);
        const auto* tf = sim.registry().get<Engine::ECS::Transform>(sim.player());
        assert(tf->position.x == config.player.size * 0.5f);
        assert(sim.registry().get<PlayerState>(sim.player())->facing == Engine::Vec2(-1.0f, 0.0f));
    }
    {
        // Placing, building by standing on the site, then healing there.
        GameConfig config{};
        config.spawn.maxEnemies = 0;
        Engine::ManualClock clock(0.0);
        RecordingSink sink;
        Simulation sim(config, clock, sink, 1);

        Engine::ActionState confirm{};
        confirm.confirmPlacement = true;
        runFrames(sim, clock, 5, confirm);
        assert(sink.placed == 1);
        assert(sim.registry().count<Building>() == 1);

        const auto playerPos = sim.registry().get<Engine::ECS::Transform>(sim.player())->position;
        auto site = sim.placeBuilding(BuildingType::Food, playerPos);
        runFrames(sim, clock, 60);
        assert(!sim.registry().get<Building>(site)->built);
        runFrames(sim, clock, 62);
        assert(sim.registry().get<Building>(site)->built);
        assert(sink.completed == 1);

        auto* hp = sim.registry().get<Engine::ECS::Health>(sim.player());
        hp->current = 20.0f;
        runFrames(sim, clock, 30);
        assert(std::abs(hp->current - 45.0f) < 0.01f);
        runFrames(sim, clock, 120);
        assert(hp->current == hp->max);
    }
    {
        // Death freezes the player; restart brings a fresh session back.
        const GameConfig config{};
        Engine::ManualClock clock(0.0);
        RecordingSink sink;
        Simulation sim(config, clock, sink, 1);
        runFrames(sim, clock, 130);
        assert(sim.aliveEnemyCount() > 0);

        auto* hp = sim.registry().get<Engine::ECS::Health>(sim.player());
        auto* state = sim.registry().get<PlayerState>(sim.player());
        auto* vel = sim.registry().get<Engine::ECS::Velocity>(sim.player());
        hp->current = 0.0f;
        Engine::ActionState act{};
        act.moveUp = true;
        act.confirmPlacement = true;
        const int spawnedBefore = sink.spawned;
        runFrames(sim, clock, 120, act);
        assert(vel->value == Engine::Vec2(0.0f, 0.0f));
        assert(sink.placed == 0);
        assert(!state->attackActive);
        assert(sink.spawned == spawnedBefore);
        assert(sim.placeSelectedBuilding() == Engine::ECS::kInvalidEntity);

        Engine::ActionState restart{};
        restart.restart = true;
        runFrames(sim, clock, 3, restart);
        assert(sim.resetCount() == 1);
        assert(sim.playerAlive());
        assert(sim.aliveEnemyCount() == 0);
        assert(sim.registry().alive() == 1);
        assert(sim.registry().get<Engine::ECS::Health>(sim.player())->current == config.player.maxHealth);
    }
    {
        // Headless application run: fixed 1/60 s frames drive the simulation clock.
        Sundown::GameRoot game(3, "missing-data-dir");
        Engine::WindowConfig wc{};
        wc.headlessFrames = 120;
        Engine::Application app(game, std::make_unique<Engine::NullWindow>(), wc);
        assert(app.initialize());
        assert(app.headless());
        app.run();
        assert(static_cast<Engine::NullWindow&>(app.window()).framesRun() == 120);
        assert(game.simulation() != nullptr);
        assert(std::abs(game.simulation()->lastTickMs() - 2000.0) < 1.0);
        assert(game.simulation()->registry().count<Engine::ECS::EnemyTag>() >= 1);
    }
    return 0;
}
