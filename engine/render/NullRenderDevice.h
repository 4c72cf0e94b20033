// No-op renderer used by NullWindow or headless runs. Counts draw calls for tests.
#pragma once

#include <cstddef>

#include "RenderDevice.h"

namespace Engine {

class NullRenderDevice final : public RenderDevice {
public:
    void clear(const Color& /*color*/) override { drawCalls_ = 0; }
    void drawFilledRect(const Vec2& /*topLeft*/, const Vec2& /*size*/, const Color& /*color*/) override {
        ++drawCalls_;
    }
    void present() override {}

    std::size_t drawCalls() const { return drawCalls_; }

private:
    std::size_t drawCalls_{0};
};

}  // namespace Engine
