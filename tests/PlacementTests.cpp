// Grid snapping, occupancy fallback and world clamping for new buildings.
#include <cassert>
#include <string>
#include <vector>

#include "../engine/core/Clock.h"
#include "../engine/core/Logger.h"
#include "../engine/ecs/components/Transform.h"
#include "../game/GameConfig.h"
#include "../game/Simulation.h"
#include "../game/systems/BuildingPlacer.h"
#include "RecordingSink.h"

using namespace Sundown;

int main() {
    const GameConfig config{};
    const BuildingPlacer placer(config);
    {
        // 80 px ahead, snapped to the 32 px grid.
        auto r = placer.resolvePlacement(Engine::Vec2{1000.0f, 1000.0f}, Engine::Vec2{1.0f, 0.0f}, BuildingType::Power,
                                         {});
        assert(!r.degraded);
        assert(r.position == Engine::Vec2(1088.0f, 992.0f));
    }
    {
        // Occupied candidate: alternatives are tried +x, -x, +y, -y.
        const Engine::Vec2 player{1000.0f, 1000.0f};
        const Engine::Vec2 facing{1.0f, 0.0f};
        std::vector<Footprint> left{Footprint{Engine::Vec2{1028.0f, 992.0f}, 64.0f}};
        auto r = placer.resolvePlacement(player, facing, BuildingType::Water, left);
        assert(!r.degraded);
        assert(r.position == Engine::Vec2(1120.0f, 992.0f));

        std::vector<Footprint> right{Footprint{Engine::Vec2{1148.0f, 992.0f}, 64.0f}};
        r = placer.resolvePlacement(player, facing, BuildingType::Water, right);
        assert(r.position == Engine::Vec2(1056.0f, 992.0f));

        std::vector<Footprint> both{left[0], right[0]};
        r = placer.resolvePlacement(player, facing, BuildingType::Water, both);
        assert(r.position == Engine::Vec2(1088.0f, 1024.0f));

        // Everything blocked: keep the first candidate and report it.
        std::vector<Footprint> onTop{Footprint{Engine::Vec2{1088.0f, 992.0f}, 64.0f}};
        r = placer.resolvePlacement(player, facing, BuildingType::Water, onTop);
        assert(r.degraded);
        assert(r.position == Engine::Vec2(1088.0f, 992.0f));
    }
    {
        // Never outside the world, wherever the player stands and faces.
        const Engine::Vec2 facings[] = {Engine::Vec2{1.0f, 0.0f}, Engine::Vec2{-1.0f, 0.0f}, Engine::Vec2{0.0f, 1.0f},
                                        Engine::Vec2{0.0f, -1.0f}};
        std::vector<Footprint> existing;
        for (float x = -100.0f; x <= 2100.0f; x += 97.0f) {
            for (float y = -100.0f; y <= 2100.0f; y += 131.0f) {
                for (const auto& f : facings) {
                    auto r = placer.resolvePlacement(Engine::Vec2{x, y}, f, BuildingType::Turret, existing);
                    assert(r.position.x >= 32.0f && r.position.x <= 1968.0f);
                    assert(r.position.y >= 32.0f && r.position.y <= 1968.0f);
                    if (existing.size() < 40) existing.push_back(Footprint{r.position, 64.0f});
                }
            }
        }
        auto r = placer.resolvePlacement(Engine::Vec2{1990.0f, 1000.0f}, Engine::Vec2{1.0f, 0.0f}, BuildingType::Food,
                                         {});
        assert(r.position == Engine::Vec2(1968.0f, 992.0f));
    }
    {
        // Through the simulation: the second build on the same spot degrades with a warning.
        GameConfig cfg{};
        cfg.spawn.maxEnemies = 0;
        Engine::ManualClock clock(0.0);
        RecordingSink sink;
        Simulation sim(cfg, clock, sink, 1);

        int warnings = 0;
        Engine::Logger::setSink([&warnings](Engine::LogLevel level, std::string_view) {
            if (level == Engine::LogLevel::Warning) ++warnings;
        });
        auto first = sim.placeSelectedBuilding();
        auto second = sim.placeSelectedBuilding();
        Engine::Logger::setSink({});

        assert(first != Engine::ECS::kInvalidEntity && second != Engine::ECS::kInvalidEntity);
        assert(sink.placementRequests == 2);
        assert(sink.placed == 2);
        assert(sink.degraded == 1);
        assert(warnings == 1);
        assert(sim.registry().get<Engine::ECS::Transform>(first)->position ==
               sim.registry().get<Engine::ECS::Transform>(second)->position);
    }
    return 0;
}
