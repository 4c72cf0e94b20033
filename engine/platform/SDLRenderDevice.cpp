#include "SDLRenderDevice.h"

#include <SDL.h>

namespace Engine {

SDLRenderDevice::SDLRenderDevice(SDL_Renderer* renderer) : renderer_(renderer) {
    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
}

SDL_Rect SDLRenderDevice::toRect(const Vec2& topLeft, const Vec2& size) const {
    SDL_Rect rect{};
    rect.x = static_cast<int>(topLeft.x);
    rect.y = static_cast<int>(topLeft.y);
    rect.w = static_cast<int>(size.x);
    rect.h = static_cast<int>(size.y);
    return rect;
}

void SDLRenderDevice::setColor(const Color& color) {
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
}

void SDLRenderDevice::clear(const Color& color) {
    setColor(color);
    SDL_RenderClear(renderer_);
}

void SDLRenderDevice::drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) {
    if (size.x <= 0.0f || size.y <= 0.0f) {
        return;
    }
    SDL_Rect rect = toRect(topLeft, size);
    setColor(color);
    SDL_RenderFillRect(renderer_, &rect);
}

void SDLRenderDevice::drawRectOutline(const Vec2& topLeft, const Vec2& size, const Color& color) {
    SDL_Rect rect = toRect(topLeft, size);
    setColor(color);
    SDL_RenderDrawRect(renderer_, &rect);
}

void SDLRenderDevice::present() { SDL_RenderPresent(renderer_); }

}  // namespace Engine
