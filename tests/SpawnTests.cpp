// Spawn gating by interval, population cap and player state; ring placement inside the world.
#include <cassert>
#include <cmath>

#include "../engine/ecs/Registry.h"
#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Tags.h"
#include "../engine/ecs/components/Transform.h"
#include "../game/GameConfig.h"
#include "../game/components/EnemyState.h"
#include "../game/systems/PlayerSystem.h"
#include "../game/systems/SpawnSystem.h"
#include "RecordingSink.h"

using namespace Sundown;

int main() {
    {
        // Interval, cap and player-alive gates.
        const GameConfig config{};
        RecordingSink sink;
        SpawnSystem spawner(config, sink, 11);
        spawner.reset(0.0);
        assert(!spawner.shouldSpawn(999.0, 0, true));
        assert(spawner.shouldSpawn(1000.0, 0, true));
        assert(!spawner.shouldSpawn(1000.0, 0, false));
        assert(!spawner.shouldSpawn(5000.0, config.spawn.maxEnemies, true));
        assert(spawner.shouldSpawn(5000.0, config.spawn.maxEnemies - 1, true));
    }
    {
        // With a cap of one, a living enemy blocks the next spawn no matter how long we wait.
        GameConfig config{};
        config.spawn.maxEnemies = 1;
        RecordingSink sink;
        Engine::ECS::Registry registry;
        PlayerSystem players(config, sink);
        SpawnSystem spawner(config, sink, 11);
        auto player = players.spawn(registry, config.world.center(), 0.0);
        spawner.reset(0.0);

        auto first = spawner.maybeSpawn(registry, player, 1000.0, 0);
        assert(first != Engine::ECS::kInvalidEntity);
        assert(spawner.lastSpawnMs() == 1000.0);
        assert(sink.spawned == 1);
        assert(registry.get<EnemyState>(first)->target == player);
        assert(registry.has<Engine::ECS::EnemyTag>(first));

        assert(spawner.maybeSpawn(registry, player, 2500.0, 1) == Engine::ECS::kInvalidEntity);
        assert(spawner.maybeSpawn(registry, player, 60000.0, 1) == Engine::ECS::kInvalidEntity);
        assert(sink.spawned == 1);

        // Once the enemy is gone the gate opens again.
        assert(spawner.maybeSpawn(registry, player, 60000.0, 0) != Engine::ECS::kInvalidEntity);

        // No spawns for a dead player.
        registry.get<Engine::ECS::Health>(player)->current = 0.0f;
        assert(spawner.maybeSpawn(registry, player, 90000.0, 0) == Engine::ECS::kInvalidEntity);
    }
    {
        // Spawns land on the 400 px ring around a centered player.
        const GameConfig config{};
        RecordingSink sink;
        SpawnSystem spawner(config, sink, 5);
        const auto center = config.world.center();
        for (int i = 0; i < 200; ++i) {
            const auto p = spawner.pickSpawnPosition(center);
            const float d = (p - center).length();
            assert(std::abs(d - config.spawn.distance) < 0.05f);
        }
    }
    {
        // Near a corner the ring is clamped inside the 50 px margin.
        const GameConfig config{};
        RecordingSink sink;
        SpawnSystem spawner(config, sink, 9);
        const Engine::Vec2 corners[] = {Engine::Vec2{10.0f, 10.0f}, Engine::Vec2{1990.0f, 1990.0f},
                                        Engine::Vec2{0.0f, 2000.0f}, Engine::Vec2{2000.0f, 0.0f}};
        for (const auto& c : corners) {
            for (int i = 0; i < 100; ++i) {
                const auto p = spawner.pickSpawnPosition(c);
                assert(p.x >= 50.0f && p.x <= 1950.0f);
                assert(p.y >= 50.0f && p.y <= 1950.0f);
            }
        }
    }
    {
        // Same seed, same sequence.
        const GameConfig config{};
        RecordingSink sink;
        SpawnSystem a(config, sink, 42);
        SpawnSystem b(config, sink, 42);
        for (int i = 0; i < 10; ++i) {
            assert(a.pickSpawnPosition(config.world.center()) == b.pickSpawnPosition(config.world.center()));
        }
    }
    return 0;
}
