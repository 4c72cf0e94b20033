#include "Application.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <utility>

#include "Logger.h"

namespace Engine {

Application::Application(ApplicationListener& listener, WindowPtr window, WindowConfig config)
    : listener_(listener), window_(std::move(window)), config_(std::move(config)) {}

Application::~Application() {
    if (initialized_) {
        listener_.onShutdown();
    }
}

bool Application::initialize() {
    if (!window_) {
        logError("Application requires a Window instance.");
        return false;
    }
    if (!window_->initialize(config_)) {
        logError("Failed to initialize window.");
        return false;
    }

    renderDevice_ = window_->createRenderDevice();
    if (!renderDevice_) {
        logError("Failed to create render device.");
        return false;
    }

    initialized_ = true;
    running_ = listener_.onInitialize(*this);
    if (!running_) {
        logError("Listener rejected startup.");
    }
    return running_;
}

double Application::nextDelta(bool realtime) {
    if (!realtime) {
        return kTargetFrameSeconds;
    }
    const auto now = std::chrono::steady_clock::now();
    const std::chrono::duration<double> dt = now - lastFrame_;
    lastFrame_ = now;
    if (dt.count() > kMaxFrameDeltaSeconds) {
        logDebug("Long frame clamped: " + std::to_string(dt.count()) + "s");
    }
    return std::clamp(dt.count(), 0.0, kMaxFrameDeltaSeconds);
}

void Application::run() {
    const bool realtime = window_->realtime();
    lastFrame_ = std::chrono::steady_clock::now();

    while (running_ && window_->isOpen()) {
        timeStep_.deltaSeconds = nextDelta(realtime);
        timeStep_.elapsedSeconds += timeStep_.deltaSeconds;

        window_->pollEvents(*this, input_);
        if (!running_) {
            break;
        }
        listener_.onUpdate(timeStep_, input_);
        ++timeStep_.frameIndex;
        window_->swapBuffers();
        renderDevice_->present();

        if (realtime && timeStep_.deltaSeconds < kTargetFrameSeconds) {
            std::this_thread::sleep_for(
                std::chrono::duration<double>(kTargetFrameSeconds - timeStep_.deltaSeconds));
        }
    }

    logInfo("Application loop exited after " + std::to_string(timeStep_.frameIndex) + " frames, " +
            std::to_string(timeStep_.elapsedSeconds) + "s simulated.");
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    running_ = false;
    logInfo("Shutdown requested: " + reason);
}

}  // namespace Engine
