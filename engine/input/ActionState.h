// Logical actions derived from raw InputState; what the simulation consumes each tick.
#pragma once

namespace Engine {

struct ActionState {
    bool moveUp{false};
    bool moveDown{false};
    bool moveLeft{false};
    bool moveRight{false};
    bool selectPrev{false};
    bool selectNext{false};
    bool confirmPlacement{false};
    bool restart{false};
};

}  // namespace Engine
