// Game layer bootstrap implementing engine callbacks.
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "../engine/core/ApplicationListener.h"
#include "../engine/core/Clock.h"
#include "../engine/core/FrameStats.h"
#include "../engine/input/ActionMapper.h"
#include "../engine/render/Camera2D.h"
#include "../engine/render/RenderDevice.h"
#include "GameConfig.h"
#include "GameEvents.h"
#include "Simulation.h"
#include "render/RenderSystem.h"
#include "systems/CameraSystem.h"

namespace Sundown {

class GameRoot final : public Engine::ApplicationListener, public GameEventSink {
public:
    explicit GameRoot(std::uint32_t seed = 0, std::string dataDir = "data");

    bool onInitialize(Engine::Application& app) override;
    void onUpdate(const Engine::TimeStep& step, const Engine::InputState& input) override;
    void onShutdown() override;

    void onBuildingSelectionChanged(std::size_t index, BuildingType type) override;
    void onBuildingPlacementRequested(BuildingType type) override;
    void onBuildingPlaced(Engine::ECS::Entity building, BuildingType type) override;
    void onPlacementDegraded(BuildingType type, const Engine::Vec2& position) override;
    void onBuildingCompleted(Engine::ECS::Entity building, BuildingType type) override;
    void onEnemySpawned(Engine::ECS::Entity enemy) override;
    void onEnemyKilled(Engine::ECS::Entity enemy) override;
    void onPlayerDied() override;

    const Simulation* simulation() const { return sim_.get(); }
    int enemiesKilled() const { return enemiesKilled_; }
    int buildingsCompleted() const { return buildingsCompleted_; }

private:
    void loadData();
    void logEvent(const std::string& msg) const;

    std::uint32_t seed_{0};
    std::string dataDir_;
    Engine::Application* app_{nullptr};
    Engine::RenderDevice* render_{nullptr};

    GameConfig config_{};
    Engine::ActionMapper actionMapper_{};
    std::unique_ptr<Engine::Clock> clock_;
    Engine::ManualClock* manualClock_{nullptr};  // set in headless runs; owned by clock_
    std::unique_ptr<Simulation> sim_;
    std::unique_ptr<RenderSystem> renderSystem_;
    CameraSystem cameraSystem_{};
    Engine::Camera2D camera_{};
    Engine::FrameStats frameStats_{};
    int viewportWidth_{1280};
    int viewportHeight_{720};

    int enemiesSpawned_{0};
    int enemiesKilled_{0};
    int buildingsPlaced_{0};
    int buildingsCompleted_{0};
};

}  // namespace Sundown
