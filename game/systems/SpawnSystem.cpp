#include "SpawnSystem.h"

#include <algorithm>
#include <cmath>

#include "../../engine/ecs/components/AABB.h"
#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Renderable.h"
#include "../../engine/ecs/components/Tags.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/ecs/components/Velocity.h"
#include "../../engine/render/Color.h"
#include "../components/EnemyState.h"

namespace Sundown {

namespace {
constexpr float kTwoPi = 6.28318530718f;
}

SpawnSystem::SpawnSystem(const GameConfig& config, GameEventSink& events, std::uint32_t seed)
    : config_(config), events_(events), rng_(seed) {}

bool SpawnSystem::shouldSpawn(double nowMs, int activeEnemyCount, bool playerAlive) const {
    return playerAlive && activeEnemyCount < config_.spawn.maxEnemies &&
           nowMs - lastSpawnMs_ >= config_.spawn.intervalMs;
}

Engine::ECS::Entity SpawnSystem::maybeSpawn(Engine::ECS::Registry& registry, Engine::ECS::Entity player, double nowMs,
                                            int activeEnemyCount) {
    const auto* playerTf = registry.get<Engine::ECS::Transform>(player);
    const auto* playerHp = registry.get<Engine::ECS::Health>(player);
    const bool playerAlive = registry.valid(player) && playerTf && playerHp && playerHp->alive();
    if (!shouldSpawn(nowMs, activeEnemyCount, playerAlive)) {
        return Engine::ECS::kInvalidEntity;
    }
    lastSpawnMs_ = nowMs;
    const Engine::Vec2 pos = pickSpawnPosition(playerTf->position);
    return spawnEnemy(registry, config_.spawn.type, pos, player);
}

Engine::Vec2 SpawnSystem::pickSpawnPosition(const Engine::Vec2& center) {
    std::uniform_real_distribution<float> angleDist(0.0f, kTwoPi);
    const float ang = angleDist(rng_);
    const float dist = config_.spawn.distance;
    Engine::Vec2 pos{center.x + std::cos(ang) * dist, center.y + std::sin(ang) * dist};

    const float margin = config_.spawn.margin;
    const float maxX = std::max(margin, config_.world.width - margin);
    const float maxY = std::max(margin, config_.world.height - margin);
    pos.x = std::clamp(pos.x, margin, maxX);
    pos.y = std::clamp(pos.y, margin, maxY);
    return pos;
}

Engine::ECS::Entity SpawnSystem::spawnEnemy(Engine::ECS::Registry& registry, EnemyTypeId type,
                                            const Engine::Vec2& position, Engine::ECS::Entity target) {
    const EnemyDefinition& def = config_.enemy(type);
    auto e = registry.create();
    registry.emplace<Engine::ECS::Transform>(e, Engine::ECS::Transform{position});
    registry.emplace<Engine::ECS::Velocity>(e, Engine::ECS::Velocity{});
    const float half = def.hitboxSize * 0.5f;
    registry.emplace<Engine::ECS::AABB>(e, Engine::ECS::AABB{Engine::Vec2{half, half}});
    registry.emplace<Engine::ECS::Health>(e, Engine::ECS::Health{def.health, def.health});
    registry.emplace<Engine::ECS::EnemyTag>(e, Engine::ECS::EnemyTag{});
    const float visual = def.visualSize * def.scale;
    registry.emplace<Engine::ECS::Renderable>(
        e, Engine::ECS::Renderable{Engine::Vec2{visual, visual}, Engine::Color::fromHex(def.color), true});

    EnemyState state{};
    state.type = type;
    state.speed = def.speed;
    state.damage = def.damage;
    state.attackRange = def.attackRange;
    state.attackCooldownMs = def.attackCooldownMs;
    state.hitboxSize = def.hitboxSize;
    state.target = target;
    registry.emplace<EnemyState>(e, state);

    events_.onEnemySpawned(e);
    return e;
}

}  // namespace Sundown
