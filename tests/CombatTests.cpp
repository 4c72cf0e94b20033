// Contact damage on the player and one hit per enemy per swing.
#include <cassert>

#include "../engine/ecs/Registry.h"
#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Transform.h"
#include "../engine/gameplay/Combat.h"
#include "../game/DeferredEvent.h"
#include "../game/GameConfig.h"
#include "../game/components/EnemyState.h"
#include "../game/components/PlayerState.h"
#include "../game/systems/CombatSystem.h"
#include "../game/systems/EnemyAISystem.h"
#include "../game/systems/PlayerSystem.h"
#include "../game/systems/SpawnSystem.h"
#include "RecordingSink.h"

using namespace Sundown;

namespace {
struct Arena {
    GameConfig config{};
    RecordingSink sink;
    Engine::ECS::Registry registry;
    DeferredEvents deferred;
    PlayerSystem players{config, sink};
    EnemyAISystem enemies{sink};
    CombatSystem combat{config, players, enemies};
    SpawnSystem spawner{config, sink, 3};
    Engine::ECS::Entity player{players.spawn(registry, Engine::Vec2{500.0f, 500.0f}, 0.0)};

    Engine::ECS::Entity enemyAt(float dx, float dy, float health = 10.0f) {
        auto e = spawner.spawnEnemy(registry, EnemyTypeId::Dog, Engine::Vec2{500.0f + dx, 500.0f + dy}, player);
        registry.get<Engine::ECS::Health>(e)->current = health;
        registry.get<Engine::ECS::Health>(e)->max = health;
        return e;
    }
    float playerHealth() { return registry.get<Engine::ECS::Health>(player)->current; }
    float health(Engine::ECS::Entity e) { return registry.get<Engine::ECS::Health>(e)->current; }
    PlayerState& state() { return *registry.get<PlayerState>(player); }
    bool swing(double nowMs) {
        return players.tickAutoAttack(player, state(), *registry.get<Engine::ECS::Health>(player), nowMs, deferred);
    }
};
}  // namespace

int main() {
    {
        // Raw health arithmetic ignores non-positive amounts and dead targets.
        Engine::ECS::Health hp{10.0f, 10.0f};
        assert(Engine::Gameplay::applyDamage(hp, -3.0f) == 0.0f);
        assert(hp.current == 10.0f);
        assert(Engine::Gameplay::applyDamage(hp, 25.0f) == 10.0f);
        assert(hp.current == 0.0f);
        assert(Engine::Gameplay::applyDamage(hp, 5.0f) == 0.0f);
        assert(Engine::Gameplay::applyHeal(hp, 5.0f) == 0.0f);
    }
    {
        // Contact reach is (26 + 32) / 2 = 29 and the bite repeats once per cooldown.
        Arena a;
        auto close = a.enemyAt(-20.0f, 0.0f);
        auto away = a.enemyAt(-30.0f, 0.0f);
        a.combat.update(a.registry, a.player, 0.0, a.deferred);
        assert(a.playerHealth() == 95.0f);
        a.combat.update(a.registry, a.player, 500.0, a.deferred);
        assert(a.playerHealth() == 95.0f);
        auto report = a.combat.update(a.registry, a.player, 1000.0, a.deferred);
        assert(report.enemyHitsOnPlayer == 1);
        assert(a.playerHealth() == 90.0f);
        assert(a.registry.get<EnemyState>(close)->lastAttackMs == 1000.0);
        assert(a.registry.get<EnemyState>(away)->canAttack(1000.0));

        // Dead enemies do not bite.
        a.registry.get<Engine::ECS::Health>(close)->current = 0.0f;
        a.combat.update(a.registry, a.player, 5000.0, a.deferred);
        assert(a.playerHealth() == 90.0f);
    }
    {
        // One swing damages each overlapping enemy exactly once, however many frames it lasts.
        Arena a;
        auto tough = a.enemyAt(60.0f, 0.0f, 100.0f);
        auto edge = a.enemyAt(60.0f, 28.0f, 100.0f);
        auto outside = a.enemyAt(60.0f, 31.0f, 100.0f);
        assert(a.swing(2000.0));
        auto report = a.combat.update(a.registry, a.player, 2000.0, a.deferred);
        assert(report.swingHits == 2);
        assert(a.health(tough) == 80.0f);
        assert(a.health(edge) == 80.0f);
        assert(a.health(outside) == 100.0f);
        for (double t = 2016.0; t < 2300.0; t += 16.0) {
            report = a.combat.update(a.registry, a.player, t, a.deferred);
            assert(report.swingHits == 0);
        }
        assert(a.health(tough) == 80.0f);
        assert(a.state().hasHitEnemy(tough));

        // The next swing may hit the same enemy again.
        a.state().endSwing();
        a.combat.update(a.registry, a.player, 2400.0, a.deferred);
        assert(a.health(tough) == 80.0f);
        assert(a.swing(4000.0));
        a.combat.update(a.registry, a.player, 4000.0, a.deferred);
        assert(a.health(tough) == 60.0f);
    }
    {
        // A lethal swing kills, hides and queues the enemy for removal.
        Arena a;
        auto weak = a.enemyAt(60.0f, 0.0f);
        assert(a.swing(2000.0));
        auto report = a.combat.update(a.registry, a.player, 2000.0, a.deferred);
        assert(report.kills == 1);
        assert(a.sink.killed == 1);
        assert(a.health(weak) == 0.0f);
        assert(a.deferred.size() == 2);  // swing expiry + removal
    }
    {
        // Dying mid-swing cancels the swing before it can land.
        Arena a;
        auto biter = a.enemyAt(-20.0f, 0.0f);
        auto target = a.enemyAt(60.0f, 0.0f);
        a.registry.get<Engine::ECS::Health>(a.player)->current = 5.0f;
        assert(a.swing(2000.0));
        a.combat.update(a.registry, a.player, 2000.0, a.deferred);
        assert(a.playerHealth() == 0.0f);
        assert(a.sink.playerDeaths == 1);
        assert(!a.state().attackActive);
        assert(a.health(target) == 10.0f);
        assert(a.health(biter) == 10.0f);

        // No more bites once the player is down.
        a.combat.update(a.registry, a.player, 3000.0, a.deferred);
        assert(a.sink.playerDeaths == 1);
    }
    return 0;
}
