// Maps InputState to the logical ActionState through bindings.
#pragma once

#include <string>
#include <utility>

#include "ActionState.h"
#include "InputBinding.h"
#include "InputState.h"

namespace Engine {

// Resolves a binding name ("w", "arrow_up", "space", ...) to a physical key.
// Unknown names map to InputKey::Count.
InputKey toInputKey(const std::string& name);

class ActionMapper {
public:
    explicit ActionMapper(InputBindings bindings = InputBindings::defaults()) : bindings_(std::move(bindings)) {}

    ActionState sample(const InputState& input) const;
    const InputBindings& bindings() const { return bindings_; }

private:
    bool anyDown(const KeyList& keys, const InputState& input) const;

    InputBindings bindings_;
};

}  // namespace Engine
