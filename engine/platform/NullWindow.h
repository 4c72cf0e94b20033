// Headless window: runs a fixed number of frames, then requests shutdown.
#pragma once

#include "Window.h"

namespace Engine {

class NullWindow final : public Window {
public:
    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<class RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, class InputState& input) override;
    void swapBuffers() override;
    bool isOpen() const override { return isOpen_; }
    bool realtime() const override { return false; }

    int framesRun() const { return framesRun_; }

private:
    bool isOpen_{false};
    int frameBudget_{0};
    int framesRun_{0};
};

}  // namespace Engine
