#include "BuildingPlacer.h"

#include <algorithm>
#include <array>
#include <cmath>

#include "../../engine/ecs/components/Transform.h"
#include "../components/Building.h"

namespace Sundown {

Engine::Vec2 BuildingPlacer::snapToGrid(const Engine::Vec2& p) const {
    const float grid = config_.placement.gridSize;
    if (grid <= 0.0f) return p;
    return Engine::Vec2{std::round(p.x / grid) * grid, std::round(p.y / grid) * grid};
}

Engine::Vec2 BuildingPlacer::clampToWorld(const Engine::Vec2& p, float size) const {
    const float half = size * 0.5f;
    // A footprint wider than the world pins to the center on that axis.
    const float minX = std::min(half, config_.world.width * 0.5f);
    const float minY = std::min(half, config_.world.height * 0.5f);
    const float maxX = std::max(minX, config_.world.width - half);
    const float maxY = std::max(minY, config_.world.height - half);
    return Engine::Vec2{std::clamp(p.x, minX, maxX), std::clamp(p.y, minY, maxY)};
}

bool BuildingPlacer::overlapsAny(const Engine::Vec2& p, float size, const std::vector<Footprint>& existing) {
    for (const auto& other : existing) {
        const float reach = (size + other.size) * 0.5f;
        if (Engine::distanceSquared(p, other.center) < reach * reach) {
            return true;
        }
    }
    return false;
}

PlacementResult BuildingPlacer::resolvePlacement(const Engine::Vec2& playerPos, const Engine::Vec2& facing,
                                                 BuildingType type, const std::vector<Footprint>& existing) const {
    const float size = config_.building(type).size;
    const Engine::Vec2 raw = playerPos + facing * config_.placement.minDistanceFromPlayer;
    const Engine::Vec2 candidate = clampToWorld(snapToGrid(raw), size);
    if (!overlapsAny(candidate, size, existing)) {
        return PlacementResult{candidate, false};
    }

    const float grid = config_.placement.gridSize;
    const std::array<Engine::Vec2, 4> offsets{Engine::Vec2{grid, 0.0f}, Engine::Vec2{-grid, 0.0f},
                                              Engine::Vec2{0.0f, grid}, Engine::Vec2{0.0f, -grid}};
    for (const auto& off : offsets) {
        const Engine::Vec2 alt = clampToWorld(candidate + off, size);
        if (!overlapsAny(alt, size, existing)) {
            return PlacementResult{alt, false};
        }
    }
    return PlacementResult{candidate, true};
}

std::vector<Footprint> BuildingPlacer::collectFootprints(const Engine::ECS::Registry& registry) {
    std::vector<Footprint> out;
    registry.view<Engine::ECS::Transform, Building>(
        [&out](Engine::ECS::Entity, const Engine::ECS::Transform& tf, const Building& b) {
            out.push_back(Footprint{tf.position, b.size});
        });
    return out;
}

}  // namespace Sundown
