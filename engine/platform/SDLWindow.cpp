#include "SDLWindow.h"

#include <SDL.h>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../input/InputState.h"
#include "SDLRenderDevice.h"

namespace Engine {

namespace {
InputKey mapKey(SDL_Keycode sym) {
    switch (sym) {
        case SDLK_w: return InputKey::W;
        case SDLK_a: return InputKey::A;
        case SDLK_s: return InputKey::S;
        case SDLK_d: return InputKey::D;
        case SDLK_UP: return InputKey::Up;
        case SDLK_DOWN: return InputKey::Down;
        case SDLK_LEFT: return InputKey::Left;
        case SDLK_RIGHT: return InputKey::Right;
        case SDLK_SPACE: return InputKey::Space;
        case SDLK_RETURN:
        case SDLK_KP_ENTER: return InputKey::Enter;
        case SDLK_r: return InputKey::R;
        case SDLK_ESCAPE: return InputKey::Escape;
        default: return InputKey::Count;
    }
}
}  // namespace

SDLWindow::SDLWindow() = default;

SDLWindow::~SDLWindow() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
    }
    if (window_) {
        SDL_DestroyWindow(window_);
    }
    if (sdlInitialized_) {
        SDL_Quit();
    }
}

bool SDLWindow::initialize(const WindowConfig& config) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0) {
        logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }
    sdlInitialized_ = true;

    Uint32 windowFlags = SDL_WINDOW_SHOWN;
    window_ = SDL_CreateWindow(config.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               config.width, config.height, windowFlags);
    if (!window_) {
        logError(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }

    const auto rendererFlags = config.vsync ? SDL_RENDERER_PRESENTVSYNC : 0;
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | rendererFlags);
    if (!renderer_) {
        logError(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }

    isOpen_ = true;
    logInfo("SDLWindow initialized.");
    return true;
}

std::unique_ptr<RenderDevice> SDLWindow::createRenderDevice() {
    if (!renderer_) {
        return nullptr;
    }
    return std::make_unique<SDLRenderDevice>(renderer_);
}

void SDLWindow::pollEvents(Application& app, InputState& input) {
    SDL_Event evt;
    while (SDL_PollEvent(&evt)) {
        switch (evt.type) {
            case SDL_QUIT:
                isOpen_ = false;
                app.requestQuit("Window close requested.");
                break;
            case SDL_KEYDOWN:
                if (evt.key.keysym.sym == SDLK_ESCAPE) {
                    isOpen_ = false;
                    app.requestQuit("Escape pressed.");
                    break;
                }
                input.setKeyDown(mapKey(evt.key.keysym.sym), true);
                break;
            case SDL_KEYUP:
                input.setKeyDown(mapKey(evt.key.keysym.sym), false);
                break;
            case SDL_WINDOWEVENT:
                if (evt.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
                    input.releaseAll();
                }
                break;
            default:
                break;
        }
    }
}

void SDLWindow::swapBuffers() {
    // Present is driven by RenderDevice::present; no-op here to avoid double clear/present.
}

}  // namespace Engine
