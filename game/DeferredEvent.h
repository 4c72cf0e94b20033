// One-shot effects the simulation schedules for a later tick.
#pragma once

#include "../engine/core/DeferredQueue.h"

namespace Sundown {

enum class DeferredKind {
    EndSwing,      // clear the player's attack once its visual window is over
    RemoveEntity,  // purge a dead enemy after its death delay
};

struct DeferredEvent {
    DeferredKind kind{DeferredKind::RemoveEntity};
    unsigned swingId{0};  // EndSwing only
};

using DeferredEvents = Engine::DeferredQueue<DeferredEvent>;

}  // namespace Sundown
