// Engine-level application lifecycle interface (engine-agnostic).
#pragma once

namespace Engine {

class Application;
struct TimeStep;
class InputState;

class ApplicationListener {
public:
    virtual ~ApplicationListener() = default;

    // Returning false aborts startup before the first frame.
    virtual bool onInitialize(Application& app) = 0;
    // Called once per frame with that frame's raw input snapshot.
    virtual void onUpdate(const TimeStep& step, const InputState& input) = 0;
    // Called once, only if onInitialize was reached.
    virtual void onShutdown() = 0;
};

}  // namespace Engine
