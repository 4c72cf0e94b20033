// Per-frame keyboard snapshot.
#pragma once

#include <array>

namespace Engine {

// Physical keys the platform layer reports. Game actions never read these directly;
// ActionMapper resolves them through data-driven bindings.
enum class InputKey {
    W = 0,
    A,
    S,
    D,
    Up,
    Down,
    Left,
    Right,
    Space,
    Enter,
    R,
    Escape,
    Count
};

class InputState {
public:
    void setKeyDown(InputKey key, bool down) {
        if (key == InputKey::Count) return;
        keys_[static_cast<int>(key)] = down;
    }
    bool isDown(InputKey key) const {
        if (key == InputKey::Count) return false;
        return keys_[static_cast<int>(key)];
    }

    // Used when the window loses focus so no key stays stuck down.
    void releaseAll() { keys_.fill(false); }

private:
    std::array<bool, static_cast<int>(InputKey::Count)> keys_{};
};

}  // namespace Engine
