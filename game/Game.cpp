#include "Game.h"

#include <utility>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/input/InputLoader.h"

namespace Sundown {

GameRoot::GameRoot(std::uint32_t seed, std::string dataDir) : seed_(seed), dataDir_(std::move(dataDir)) {}

void GameRoot::loadData() {
    const std::string gameplayPath = dataDir_ + "/gameplay.json";
    if (!loadGameConfig(gameplayPath, config_)) {
        Engine::logWarn("Continuing with built-in gameplay defaults.");
    }

    const std::string bindingsPath = dataDir_ + "/input_bindings.json";
    if (auto bindings = Engine::InputLoader::loadFromFile(bindingsPath)) {
        actionMapper_ = Engine::ActionMapper{std::move(*bindings)};
        Engine::logInfo("Loaded input bindings from " + bindingsPath);
    } else {
        Engine::logWarn("Using default input bindings (could not load " + bindingsPath + ")");
    }
}

bool GameRoot::onInitialize(Engine::Application& app) {
    app_ = &app;
    render_ = &app.renderer();
    viewportWidth_ = app.config().width;
    viewportHeight_ = app.config().height;

    loadData();
    Engine::Logger::setMinLevel(config_.debug.consoleLogs ? Engine::LogLevel::Info : Engine::LogLevel::Warning);

    // Headless frames advance a fixed step, so simulated time follows the frame count.
    if (app.headless()) {
        auto manual = std::make_unique<Engine::ManualClock>(0.0);
        manualClock_ = manual.get();
        clock_ = std::move(manual);
    } else {
        clock_ = std::make_unique<Engine::SteadyClock>();
    }

    sim_ = std::make_unique<Simulation>(config_, *clock_, *this, seed_);
    renderSystem_ = std::make_unique<RenderSystem>(*render_, sim_->config());
    cameraSystem_.setSettings(sim_->config().camera);
    cameraSystem_.snapTo(camera_, sim_->registry(), sim_->player(), sim_->config().world, viewportWidth_,
                         viewportHeight_);
    frameStats_.reset(clock_->nowMs());

    Engine::logInfo("Sundown ready. World " + std::to_string(static_cast<int>(config_.world.width)) + "x" +
                    std::to_string(static_cast<int>(config_.world.height)) + ", seed " + std::to_string(seed_) +
                    (app.headless() ? " (headless)" : ""));
    return true;
}

void GameRoot::onUpdate(const Engine::TimeStep& step, const Engine::InputState& input) {
    if (!sim_) return;
    if (manualClock_) {
        manualClock_->set(step.elapsedSeconds * 1000.0);
    }

    const Engine::ActionState actions = actionMapper_.sample(input);
    const unsigned resetsBefore = sim_->resetCount();
    sim_->tick(actions, static_cast<float>(step.deltaSeconds));

    const auto& cfg = sim_->config();
    if (sim_->resetCount() != resetsBefore) {
        cameraSystem_.snapTo(camera_, sim_->registry(), sim_->player(), cfg.world, viewportWidth_, viewportHeight_);
    } else {
        cameraSystem_.update(camera_, sim_->registry(), sim_->player(), cfg.world, viewportWidth_, viewportHeight_);
    }
    renderSystem_->draw(sim_->registry(), sim_->player(), camera_, viewportWidth_, viewportHeight_);

    if (cfg.debug.performanceMonitor && frameStats_.frame(clock_->nowMs())) {
        frameStats_.report("Enemies: " + std::to_string(sim_->aliveEnemyCount()) +
                           ", Entities: " + std::to_string(sim_->registry().alive()));
    }
}

void GameRoot::onShutdown() {
    Engine::logInfo("Session summary: spawned " + std::to_string(enemiesSpawned_) + " enemies, killed " +
                    std::to_string(enemiesKilled_) + ", placed " + std::to_string(buildingsPlaced_) +
                    " buildings, completed " + std::to_string(buildingsCompleted_) + ".");
    renderSystem_.reset();
    sim_.reset();
}

void GameRoot::logEvent(const std::string& msg) const {
    if (config_.debug.consoleLogs) {
        Engine::logInfo(msg);
    }
}

void GameRoot::onBuildingSelectionChanged(std::size_t index, BuildingType type) {
    logEvent("Selected building " + std::to_string(index) + ": " + config_.building(type).name);
}

void GameRoot::onBuildingPlacementRequested(BuildingType type) {
    logEvent(std::string("Placement requested: ") + toString(type));
}

void GameRoot::onBuildingPlaced(Engine::ECS::Entity building, BuildingType type) {
    ++buildingsPlaced_;
    logEvent("Placed " + config_.building(type).name + " (entity " + std::to_string(building) + ")");
}

void GameRoot::onPlacementDegraded(BuildingType type, const Engine::Vec2& position) {
    Engine::logWarn(std::string("Placement degraded for ") + toString(type) + " at (" +
                    std::to_string(position.x) + ", " + std::to_string(position.y) + ")");
}

void GameRoot::onBuildingCompleted(Engine::ECS::Entity building, BuildingType type) {
    ++buildingsCompleted_;
    logEvent(config_.building(type).name + " completed (entity " + std::to_string(building) + ")");
}

void GameRoot::onEnemySpawned(Engine::ECS::Entity enemy) {
    ++enemiesSpawned_;
    Engine::logDebug("Enemy spawned: " + std::to_string(enemy));
}

void GameRoot::onEnemyKilled(Engine::ECS::Entity enemy) {
    ++enemiesKilled_;
    Engine::logDebug("Enemy killed: " + std::to_string(enemy));
}

void GameRoot::onPlayerDied() {
    Engine::logInfo("Player died. Press R to restart.");
}

}  // namespace Sundown
