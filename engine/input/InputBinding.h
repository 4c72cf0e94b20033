// Data-driven input binding definitions.
#pragma once

#include <string>
#include <vector>

namespace Engine {

using KeyList = std::vector<std::string>;

struct InputBindings {
    KeyList moveUp;
    KeyList moveDown;
    KeyList moveLeft;
    KeyList moveRight;
    KeyList selectPrev;
    KeyList selectNext;
    KeyList confirmPlacement;
    KeyList restart;

    // WASD moves; arrows cycle and confirm the building selection; R restarts.
    static InputBindings defaults() {
        InputBindings b;
        b.moveUp = {"w"};
        b.moveDown = {"s"};
        b.moveLeft = {"a"};
        b.moveRight = {"d"};
        b.selectPrev = {"left"};
        b.selectNext = {"right"};
        b.confirmPlacement = {"up"};
        b.restart = {"r"};
        return b;
    }
};

}  // namespace Engine
