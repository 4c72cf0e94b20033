#include "FrameStats.h"

#include <cmath>

#include "Logger.h"

namespace Engine {

bool FrameStats::frame(double nowMs) {
    if (!started_) {
        reset(nowMs);
        return false;
    }
    ++frames_;
    const double elapsed = nowMs - windowStartMs_;
    if (elapsed <= windowMs_) {
        return false;
    }
    fps_ = static_cast<double>(frames_) * 1000.0 / elapsed;
    windowStartMs_ = nowMs;
    frames_ = 0;
    return true;
}

void FrameStats::reset(double nowMs) {
    started_ = true;
    windowStartMs_ = nowMs;
    frames_ = 0;
    fps_ = 0.0;
}

void FrameStats::report(const std::string& extra) const {
    std::string line = "Performance: FPS=" + std::to_string(static_cast<int>(std::lround(fps_)));
    if (!extra.empty()) {
        line += ", " + extra;
    }
    logInfo(line);
}

}  // namespace Engine
