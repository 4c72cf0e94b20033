// Time-ordered deferred events: ordering, due-only draining, and simulation expiry/removal.
#include <cassert>
#include <string>
#include <vector>

#include "../engine/core/Clock.h"
#include "../engine/core/DeferredQueue.h"
#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Transform.h"
#include "../game/Simulation.h"
#include "../game/components/Dying.h"
#include "../game/components/PlayerState.h"
#include "RecordingSink.h"

using namespace Sundown;

int main() {
    {
        // Earliest first; equal due times keep scheduling order.
        Engine::DeferredQueue<std::string> q;
        q.schedule(300.0, 1, "c");
        q.schedule(100.0, 2, "a");
        q.schedule(300.0, 3, "d");
        q.schedule(200.0, 4, "b");
        assert(q.size() == 4);
        assert(q.nextDueMs() == 100.0);

        std::vector<std::string> order;
        auto collect = [&order](Engine::ECS::Entity, std::string& s) { order.push_back(s); };
        assert(q.runDue(99.0, collect) == 0);
        assert(q.runDue(200.0, collect) == 2);
        assert(q.runDue(1000.0, collect) == 2);
        assert((order == std::vector<std::string>{"a", "b", "c", "d"}));
        assert(q.empty());
    }
    {
        Engine::DeferredQueue<int> q;
        q.schedule(10.0, 1, 1);
        q.schedule(20.0, 1, 2);
        q.clear();
        assert(q.empty());
        assert(q.runDue(100.0, [](Engine::ECS::Entity, int&) { assert(false); }) == 0);
    }
    {
        // Swing expires after its visual window; a dead enemy lingers for 100 ms then goes.
        GameConfig config{};
        config.spawn.maxEnemies = 0;
        Engine::ManualClock clock(0.0);
        RecordingSink sink;
        Simulation sim(config, clock, sink, 1);
        auto& registry = sim.registry();
        const auto playerPos = registry.get<Engine::ECS::Transform>(sim.player())->position;

        clock.set(1990.0);
        sim.tick(Engine::ActionState{}, 0.0f);
        // Placed exactly where the swing will land; dt 0 keeps everyone in place.
        auto enemy = sim.spawnEnemy(EnemyTypeId::Dog, playerPos + Engine::Vec2{60.0f, 0.0f});

        clock.set(2000.0);
        sim.tick(Engine::ActionState{}, 0.0f);
        auto* state = registry.get<PlayerState>(sim.player());
        assert(state->attackActive);
        assert(sink.killed == 1);
        assert(registry.has<Dying>(enemy));
        assert(sim.aliveEnemyCount() == 0);
        assert(sim.pendingDeferred() == 2);

        clock.set(2099.0);
        sim.tick(Engine::ActionState{}, 0.0f);
        assert(registry.valid(enemy));

        clock.set(2100.0);
        sim.tick(Engine::ActionState{}, 0.0f);
        assert(!registry.valid(enemy));
        // Removal also forgets the enemy in the hit set, since its id can be reused.
        assert(!state->hasHitEnemy(enemy));
        assert(state->attackActive);

        clock.set(2299.0);
        sim.tick(Engine::ActionState{}, 0.0f);
        assert(state->attackActive);
        clock.set(2300.0);
        sim.tick(Engine::ActionState{}, 0.0f);
        assert(!state->attackActive);
        assert(sim.pendingDeferred() == 0);
    }
    {
        // Reset drops pending events, so nothing fires against the new entities.
        GameConfig config{};
        config.spawn.maxEnemies = 0;
        Engine::ManualClock clock(0.0);
        RecordingSink sink;
        Simulation sim(config, clock, sink, 1);
        clock.set(2000.0);
        sim.tick(Engine::ActionState{}, 0.0f);
        assert(sim.pendingDeferred() == 1);
        sim.reset();
        assert(sim.pendingDeferred() == 0);
        assert(!sim.registry().get<PlayerState>(sim.player())->attackActive);
    }
    return 0;
}
