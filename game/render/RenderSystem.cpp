#include "RenderSystem.h"

#include <algorithm>
#include <cstddef>

#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Renderable.h"
#include "../../engine/ecs/components/Tags.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/render/CameraUtil.h"
#include "../../engine/render/Color.h"
#include "../components/Building.h"
#include "../components/PlayerState.h"

namespace Sundown {

namespace {
const Engine::Color kBarBackground{0, 0, 0, 255};
const Engine::Color kBarHealthy{0, 255, 0, 255};
const Engine::Color kBarHurt{255, 0, 0, 255};

unsigned char alphaByte(float a) { return static_cast<unsigned char>(std::clamp(a, 0.0f, 1.0f) * 255.0f); }
}  // namespace

void RenderSystem::draw(const Engine::ECS::Registry& registry, Engine::ECS::Entity player,
                        const Engine::Camera2D& camera, int viewportW, int viewportH) {
    device_.clear(Engine::Color{0, 0, 0, 255});
    drawWorld(camera, viewportW, viewportH);
    drawBuildings(registry, camera, viewportW, viewportH);
    drawEnemies(registry, camera, viewportW, viewportH);
    drawPlayer(registry, player, camera, viewportW, viewportH);
    drawSelectionHud(registry, player, viewportW, viewportH);

    const auto* hp = registry.get<Engine::ECS::Health>(player);
    if (hp && !hp->alive()) {
        drawGameOver(viewportW, viewportH);
    }
}

void RenderSystem::drawWorld(const Engine::Camera2D& camera, int viewportW, int viewportH) {
    const float vw = static_cast<float>(viewportW);
    const float vh = static_cast<float>(viewportH);
    const Engine::Vec2 topLeft = Engine::worldToScreen(Engine::Vec2{0.0f, 0.0f}, camera, vw, vh);
    const Engine::Vec2 size{config_.world.width * camera.zoom, config_.world.height * camera.zoom};
    device_.drawFilledRect(topLeft, size, Engine::Color::fromHex(config_.world.backgroundColor));
}

void RenderSystem::drawHealthBar(const Engine::Vec2& anchor, float fraction, const Engine::Color& fill) {
    const auto& bar = config_.player.healthBar;
    const Engine::Vec2 topLeft{anchor.x - bar.width * 0.5f, anchor.y + bar.offsetY};
    device_.drawFilledRect(topLeft, Engine::Vec2{bar.width, bar.height}, kBarBackground);
    const float w = bar.width * std::clamp(fraction, 0.0f, 1.0f);
    device_.drawFilledRect(topLeft, Engine::Vec2{w, bar.height}, fill);
}

void RenderSystem::drawBuildings(const Engine::ECS::Registry& registry, const Engine::Camera2D& camera,
                                 int viewportW, int viewportH) {
    const float vw = static_cast<float>(viewportW);
    const float vh = static_cast<float>(viewportH);
    registry.view<Engine::ECS::Transform, Engine::ECS::Renderable, Engine::ECS::Health, Building>(
        [&](Engine::ECS::Entity, const Engine::ECS::Transform& tf, const Engine::ECS::Renderable& rend,
            const Engine::ECS::Health& hp, const Building& b) {
            if (!rend.visible) return;
            const Engine::Vec2 center = Engine::worldToScreen(tf.position, camera, vw, vh);
            const Engine::Vec2 size = rend.size * camera.zoom;
            const Engine::Vec2 topLeft{center.x - size.x * 0.5f, center.y - size.y * 0.5f};
            // Sites under construction are translucent and fill in as they progress.
            const unsigned char alpha = b.built ? 255 : alphaByte(0.3f + 0.5f * hp.fraction());
            device_.drawFilledRect(topLeft, size, rend.color.withAlpha(alpha));
            if (b.built) {
                device_.drawRectOutline(topLeft, size, Engine::Color{255, 255, 255, 200});
            }
            if (hp.current < hp.max) {
                drawHealthBar(center, hp.fraction(), kBarHealthy);
            }
        });
}

void RenderSystem::drawEnemies(const Engine::ECS::Registry& registry, const Engine::Camera2D& camera, int viewportW,
                               int viewportH) {
    const float vw = static_cast<float>(viewportW);
    const float vh = static_cast<float>(viewportH);
    registry.view<Engine::ECS::Transform, Engine::ECS::Renderable, Engine::ECS::EnemyTag>(
        [&](Engine::ECS::Entity, const Engine::ECS::Transform& tf, const Engine::ECS::Renderable& rend,
            const Engine::ECS::EnemyTag&) {
            if (!rend.visible) return;
            const Engine::Vec2 center = Engine::worldToScreen(tf.position, camera, vw, vh);
            const Engine::Vec2 size = rend.size * camera.zoom;
            device_.drawFilledRect(Engine::Vec2{center.x - size.x * 0.5f, center.y - size.y * 0.5f}, size,
                                   rend.color);
        });
}

void RenderSystem::drawPlayer(const Engine::ECS::Registry& registry, Engine::ECS::Entity player,
                              const Engine::Camera2D& camera, int viewportW, int viewportH) {
    const auto* tf = registry.get<Engine::ECS::Transform>(player);
    const auto* rend = registry.get<Engine::ECS::Renderable>(player);
    const auto* hp = registry.get<Engine::ECS::Health>(player);
    const auto* state = registry.get<PlayerState>(player);
    if (!tf || !rend || !hp || !state) return;

    const float vw = static_cast<float>(viewportW);
    const float vh = static_cast<float>(viewportH);
    const Engine::Vec2 center = Engine::worldToScreen(tf->position, camera, vw, vh);
    const Engine::Vec2 size = rend->size * camera.zoom;
    const Engine::Color body = hp->alive() ? rend->color : rend->color.withAlpha(120);
    device_.drawFilledRect(Engine::Vec2{center.x - size.x * 0.5f, center.y - size.y * 0.5f}, size, body);

    if (state->attackActive) {
        const auto& attack = config_.player.attack;
        const Engine::Vec2 hit = tf->position + state->swingDir * attack.range;
        const Engine::Vec2 hitScreen = Engine::worldToScreen(hit, camera, vw, vh);
        const float s = attack.size * camera.zoom;
        device_.drawFilledRect(Engine::Vec2{hitScreen.x - s * 0.5f, hitScreen.y - s * 0.5f}, Engine::Vec2{s, s},
                               Engine::Color::fromHex(attack.color, 200));
    }

    drawHealthBar(center, hp->fraction(), hp->fraction() > 0.5f ? kBarHealthy : kBarHurt);
}

void RenderSystem::drawSelectionHud(const Engine::ECS::Registry& registry, Engine::ECS::Entity player, int viewportW,
                                    int viewportH) {
    const auto* state = registry.get<PlayerState>(player);
    const std::size_t selected = state ? state->selectedBuildingIndex : 0;
    const auto& hud = config_.hud;

    const float count = static_cast<float>(kBuildingTypeCount);
    const float rowWidth = hud.iconSpacing * (count - 1.0f);
    const float startX = static_cast<float>(viewportW) * 0.5f - rowWidth * 0.5f;
    const float y = static_cast<float>(viewportH) * hud.iconYFraction;
    for (std::size_t i = 0; i < kBuildingTypeCount; ++i) {
        const auto& def = config_.building(kBuildingOrder[i]);
        const float alpha = i == selected ? hud.selectedAlpha : hud.unselectedAlpha;
        const Engine::Vec2 center{startX + hud.iconSpacing * static_cast<float>(i), y};
        const Engine::Vec2 topLeft{center.x - hud.iconSize * 0.5f, center.y - hud.iconSize * 0.5f};
        device_.drawFilledRect(topLeft, Engine::Vec2{hud.iconSize, hud.iconSize},
                               Engine::Color::fromHex(def.color, alphaByte(alpha)));
        if (i == selected) {
            device_.drawRectOutline(topLeft, Engine::Vec2{hud.iconSize, hud.iconSize}, Engine::Color{255, 255, 255, 255});
        }
    }
}

void RenderSystem::drawGameOver(int viewportW, int viewportH) {
    const Engine::Vec2 full{static_cast<float>(viewportW), static_cast<float>(viewportH)};
    device_.drawFilledRect(Engine::Vec2{0.0f, 0.0f}, full, Engine::Color{0, 0, 0, 160});
    const Engine::Vec2 band{full.x * 0.5f, 48.0f};
    device_.drawFilledRect(Engine::Vec2{(full.x - band.x) * 0.5f, (full.y - band.y) * 0.5f}, band,
                           Engine::Color{180, 30, 30, 220});
}

}  // namespace Sundown
