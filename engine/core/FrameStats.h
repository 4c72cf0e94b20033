// Rolling frames-per-second counter that reports once per window.
#pragma once

#include <string>

namespace Engine {

class FrameStats {
public:
    explicit FrameStats(double windowMs = 1000.0) : windowMs_(windowMs) {}

    // Counts one frame. Returns true when a new FPS sample was produced.
    bool frame(double nowMs);

    double fps() const { return fps_; }
    void reset(double nowMs);

    // Logs the latest sample plus an optional suffix ("Enemies: 12").
    void report(const std::string& extra) const;

private:
    double windowMs_{1000.0};
    double windowStartMs_{0.0};
    bool started_{false};
    int frames_{0};
    double fps_{0.0};
};

}  // namespace Engine
