// Core health arithmetic shared across engine and game layers.
#pragma once

#include <algorithm>

#include "../ecs/components/Health.h"

namespace Engine::Gameplay {

// Lowers health, clamped at zero. Non-positive amounts and dead targets are ignored.
// Returns the damage actually applied.
inline float applyDamage(ECS::Health& target, float amount) {
    if (!target.alive() || amount <= 0.0f) {
        return 0.0f;
    }
    const float dealt = std::min(amount, target.current);
    target.current -= dealt;
    if (target.current < 0.0f) {
        target.current = 0.0f;
    }
    return dealt;
}

// Raises health, clamped at max. Dead targets stay dead; non-positive amounts are ignored.
// Returns the healing actually applied.
inline float applyHeal(ECS::Health& target, float amount) {
    if (!target.alive() || amount <= 0.0f) {
        return 0.0f;
    }
    const float healed = std::min(amount, target.max - target.current);
    if (healed <= 0.0f) {
        return 0.0f;
    }
    target.current += healed;
    return healed;
}

}  // namespace Engine::Gameplay
