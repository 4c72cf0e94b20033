// Picks a grid-snapped, in-world spot for a new building in front of the player.
#pragma once

#include <vector>

#include "../../engine/ecs/Registry.h"
#include "../../engine/math/Vec2.h"
#include "../GameConfig.h"

namespace Sundown {

struct Footprint {
    Engine::Vec2 center{};
    float size{64.0f};
};

struct PlacementResult {
    Engine::Vec2 position{};
    bool degraded{false};  // every candidate overlapped; position is the first candidate
};

class BuildingPlacer {
public:
    explicit BuildingPlacer(const GameConfig& config) : config_(config) {}

    // Candidate = player + facing * minDistance, snapped to the grid and clamped so the
    // footprint stays in the world. On overlap, tries one grid step +x, -x, +y, -y in
    // that order before falling back to the occupied candidate.
    PlacementResult resolvePlacement(const Engine::Vec2& playerPos, const Engine::Vec2& facing, BuildingType type,
                                     const std::vector<Footprint>& existing) const;

    Engine::Vec2 snapToGrid(const Engine::Vec2& p) const;
    Engine::Vec2 clampToWorld(const Engine::Vec2& p, float size) const;

    static std::vector<Footprint> collectFootprints(const Engine::ECS::Registry& registry);

private:
    static bool overlapsAny(const Engine::Vec2& p, float size, const std::vector<Footprint>& existing);

    const GameConfig& config_;
};

}  // namespace Sundown
