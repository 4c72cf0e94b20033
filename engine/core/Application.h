// Owns the window and render device and drives the per-frame listener callbacks.
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "ApplicationListener.h"
#include "Time.h"
#include "../input/InputState.h"
#include "../platform/Window.h"
#include "../render/RenderDevice.h"

namespace Engine {

class Application {
public:
    // Realtime frames longer than this are shortened so a stall (window drag, debugger
    // break) does not move bodies across the map in one step.
    static constexpr double kMaxFrameDeltaSeconds = 0.25;
    static constexpr double kTargetFrameSeconds = 1.0 / 60.0;

    Application(ApplicationListener& listener, WindowPtr window, WindowConfig config = {});
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Opens the window, creates the renderer and hands control to the listener once.
    bool initialize();
    // Runs until the window closes or someone calls requestQuit.
    void run();
    void requestQuit(const std::string& reason);

    Window& window() { return *window_; }
    RenderDevice& renderer() { return *renderDevice_; }
    const WindowConfig& config() const { return config_; }
    const TimeStep& timeStep() const { return timeStep_; }
    bool running() const { return running_; }
    // Headless windows step a fixed frame time instead of reading the wall clock.
    bool headless() const { return window_ && !window_->realtime(); }

private:
    double nextDelta(bool realtime);

    ApplicationListener& listener_;
    WindowPtr window_;
    WindowConfig config_;
    RenderDevicePtr renderDevice_;
    InputState input_{};
    TimeStep timeStep_{};
    std::chrono::steady_clock::time_point lastFrame_{};
    bool running_{false};
    bool initialized_{false};
};

}  // namespace Engine
