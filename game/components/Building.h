// Construction state for a placed structure. Health lives in Engine::ECS::Health.
#pragma once

#include "../GameConfig.h"

namespace Sundown {

struct Building {
    BuildingType type{BuildingType::Power};
    double buildTimeMs{3000.0};
    float size{64.0f};
    bool built{false};
    bool playerBuilding{false};  // player is on site this tick
    double buildStartMs{0.0};
    float healthAtEntry{10.0f};
};

}  // namespace Sundown
