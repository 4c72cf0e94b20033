#include "ActionMapper.h"

#include <algorithm>
#include <cctype>

namespace Engine {

InputKey toInputKey(const std::string& name) {
    auto lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.rfind("key:", 0) == 0) {
        lower = lower.substr(4);
    }
    if (lower == "w") return InputKey::W;
    if (lower == "a") return InputKey::A;
    if (lower == "s") return InputKey::S;
    if (lower == "d") return InputKey::D;
    if (lower == "up" || lower == "arrow_up") return InputKey::Up;
    if (lower == "down" || lower == "arrow_down") return InputKey::Down;
    if (lower == "left" || lower == "arrow_left") return InputKey::Left;
    if (lower == "right" || lower == "arrow_right") return InputKey::Right;
    if (lower == "space") return InputKey::Space;
    if (lower == "enter" || lower == "return") return InputKey::Enter;
    if (lower == "r") return InputKey::R;
    if (lower == "escape" || lower == "esc") return InputKey::Escape;
    return InputKey::Count;
}

bool ActionMapper::anyDown(const KeyList& keys, const InputState& input) const {
    for (const auto& key : keys) {
        InputKey mapped = toInputKey(key);
        if (mapped != InputKey::Count && input.isDown(mapped)) {
            return true;
        }
    }
    return false;
}

ActionState ActionMapper::sample(const InputState& input) const {
    ActionState act{};
    act.moveUp = anyDown(bindings_.moveUp, input);
    act.moveDown = anyDown(bindings_.moveDown, input);
    act.moveLeft = anyDown(bindings_.moveLeft, input);
    act.moveRight = anyDown(bindings_.moveRight, input);
    act.selectPrev = anyDown(bindings_.selectPrev, input);
    act.selectNext = anyDown(bindings_.selectNext, input);
    act.confirmPlacement = anyDown(bindings_.confirmPlacement, input);
    act.restart = anyDown(bindings_.restart, input);
    return act;
}

}  // namespace Engine
