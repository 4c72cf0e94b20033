#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/platform/NullWindow.h"
#include "../engine/platform/SDLWindow.h"
#include "../game/Game.h"

namespace {
bool isNumber(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}
}  // namespace

// Usage: sundown [--headless [frames]] [--seed N] [--data DIR]
int main(int argc, char** argv) {
    bool headless = false;
    Engine::WindowConfig config{};
    std::uint32_t seed = 0;
    std::string dataDir = "data";

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--headless") {
            headless = true;
            if (i + 1 < argc && isNumber(argv[i + 1])) {
                config.headlessFrames = std::atoi(argv[++i]);
            }
        } else if (arg == "--seed" && i + 1 < argc && isNumber(argv[i + 1])) {
            seed = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--data" && i + 1 < argc) {
            dataDir = argv[++i];
        } else {
            Engine::logError("Unknown argument: " + arg);
            Engine::logInfo("Usage: sundown [--headless [frames]] [--seed N] [--data DIR]");
            return 2;
        }
    }

    Sundown::GameRoot game(seed, dataDir);
    Engine::WindowPtr window;
    if (headless) {
        window = std::make_unique<Engine::NullWindow>();
    } else {
        SDL_SetMainReady();
        window = std::make_unique<Engine::SDLWindow>();
    }

    Engine::Application app(game, std::move(window), config);
    if (!app.initialize()) {
        return 1;
    }

    app.run();
    return 0;
}
