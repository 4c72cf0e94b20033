// Immutable gameplay tuning: per-type tables plus world, camera and spawn settings.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "../engine/math/Vec2.h"

namespace Sundown {

enum class EnemyTypeId { Dog };

enum class BuildingType { Power, Water, Food, Turret };

constexpr std::size_t kEnemyTypeCount = 1;
constexpr std::size_t kBuildingTypeCount = 4;

constexpr std::array<BuildingType, kBuildingTypeCount> kBuildingOrder{
    BuildingType::Power, BuildingType::Water, BuildingType::Food, BuildingType::Turret};

// Config keys ("DOG", "POWER", ...). Lookups are case-insensitive.
const char* toString(EnemyTypeId type);
const char* toString(BuildingType type);
std::optional<EnemyTypeId> parseEnemyType(const std::string& name);
std::optional<BuildingType> parseBuildingType(const std::string& name);

struct AttackSettings {
    float damage{20.0f};
    float range{60.0f};  // distance from the player's center to the hitbox center
    float size{32.0f};   // square hitbox edge
    double intervalMs{2000.0};
    double visualDurationMs{300.0};
    std::uint32_t color{0xffffff};
};

struct HealthBarSettings {
    float width{60.0f};
    float height{8.0f};
    float offsetY{-40.0f};
};

struct PlayerSettings {
    float speed{100.0f};
    float size{32.0f};  // collision box edge
    float scale{2.0f};  // visual multiplier over size
    float maxHealth{100.0f};
    std::uint32_t color{0xf5e6c8};
    HealthBarSettings healthBar{};
    AttackSettings attack{};
};

struct WorldSettings {
    float width{2000.0f};
    float height{2000.0f};
    std::uint32_t backgroundColor{0x63ab3f};

    Engine::Vec2 center() const { return Engine::Vec2{width * 0.5f, height * 0.5f}; }
};

struct CameraSettings {
    float zoom{1.0f};
    float followLerp{0.1f};  // fraction of the remaining distance closed per frame
};

struct EnemyDefinition {
    std::string name{"dog"};
    float speed{50.0f};
    float damage{5.0f};
    float attackRange{10.0f};
    double attackCooldownMs{1000.0};
    float health{10.0f};
    float visualSize{24.0f};
    float scale{1.5f};
    std::uint32_t color{0x8B4513};
    float hitboxSize{26.0f};
};

struct SpawnSettings {
    int maxEnemies{100};
    float distance{400.0f};
    double intervalMs{1000.0};
    float margin{50.0f};  // keep-out band along every world edge
    EnemyTypeId type{EnemyTypeId::Dog};
};

struct BuildingDefinition {
    std::string name;
    double buildTimeMs{3000.0};
    float size{64.0f};
    std::uint32_t color{0xffffff};
    int cost{0};
};

struct ConstructionSettings {
    float startHealth{10.0f};
    float maxHealth{100.0f};
    float healPerSecond{50.0f};
};

struct PlacementSettings {
    float gridSize{32.0f};
    float minDistanceFromPlayer{80.0f};
};

struct HudSettings {
    float iconSize{48.0f};
    float iconSpacing{60.0f};
    float iconYFraction{0.9f};  // of viewport height
    float selectedAlpha{1.0f};
    float unselectedAlpha{0.6f};
};

struct DebugSettings {
    bool consoleLogs{true};
    bool performanceMonitor{false};
};

struct GameConfig {
    PlayerSettings player{};
    WorldSettings world{};
    CameraSettings camera{};
    std::array<EnemyDefinition, kEnemyTypeCount> enemies{};
    SpawnSettings spawn{};
    std::array<BuildingDefinition, kBuildingTypeCount> buildings{
        BuildingDefinition{"Power Station", 3000.0, 64.0f, 0xff6b35, 100},
        BuildingDefinition{"Water Tower", 2500.0, 64.0f, 0x3498db, 80},
        BuildingDefinition{"Food Storage", 2000.0, 64.0f, 0xf39c12, 60},
        BuildingDefinition{"Defense Turret", 4000.0, 64.0f, 0xe74c3c, 150},
    };
    ConstructionSettings construction{};
    PlacementSettings placement{};
    HudSettings hud{};
    DebugSettings debug{};

    const EnemyDefinition& enemy(EnemyTypeId type) const { return enemies[static_cast<std::size_t>(type)]; }
    const BuildingDefinition& building(BuildingType type) const {
        return buildings[static_cast<std::size_t>(type)];
    }
};

// Overlays values found in a gameplay JSON file onto `config`. Keys that are absent keep
// their current values. Returns false (leaving `config` untouched) when the file cannot
// be opened or parsed.
bool loadGameConfig(const std::string& path, GameConfig& config);
bool loadGameConfigFromString(const std::string& text, GameConfig& config);

}  // namespace Sundown
