#include "NullWindow.h"

#include <string>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../render/NullRenderDevice.h"

namespace Engine {

bool NullWindow::initialize(const WindowConfig& config) {
    if (config.headlessFrames <= 0) {
        logError("NullWindow needs a positive frame budget.");
        return false;
    }
    isOpen_ = true;
    frameBudget_ = config.headlessFrames;
    framesRun_ = 0;
    logInfo("NullWindow active; running " + std::to_string(frameBudget_) + " headless frames for " +
            config.title);
    return true;
}

std::unique_ptr<RenderDevice> NullWindow::createRenderDevice() {
    return std::make_unique<NullRenderDevice>();
}

void NullWindow::pollEvents(Application& app, InputState& /*input*/) {
    if (!isOpen_) {
        return;
    }
    if (framesRun_ >= frameBudget_) {
        isOpen_ = false;
        app.requestQuit("NullWindow frame budget exhausted.");
        return;
    }
    ++framesRun_;
}

void NullWindow::swapBuffers() {
    // Nothing to do for the null backend.
}

}  // namespace Engine
