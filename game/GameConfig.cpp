#include "GameConfig.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "../engine/core/Logger.h"

namespace Sundown {

using nlohmann::json;

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Accepts 0xRRGGBB as a number, or "#RRGGBB" / "0xRRGGBB" as a string.
std::uint32_t readColor(const json& j, const char* key, std::uint32_t fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j[key];
    if (v.is_number_unsigned() || v.is_number_integer()) {
        return v.get<std::uint32_t>() & 0xFFFFFFu;
    }
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        if (!s.empty() && s[0] == '#') {
            s = s.substr(1);
        } else if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) {
            s = s.substr(2);
        }
        try {
            return static_cast<std::uint32_t>(std::stoul(s, nullptr, 16)) & 0xFFFFFFu;
        } catch (const std::exception&) {
            Engine::logWarn(std::string("Invalid color for '") + key + "': " + v.get<std::string>());
        }
    }
    return fallback;
}

void readPlayer(const json& j, PlayerSettings& p) {
    p.speed = j.value("speed", p.speed);
    p.size = j.value("size", p.size);
    p.scale = j.value("scale", p.scale);
    p.maxHealth = j.value("maxHealth", p.maxHealth);
    p.color = readColor(j, "color", p.color);
    if (j.contains("healthBar") && j["healthBar"].is_object()) {
        const auto& hb = j["healthBar"];
        p.healthBar.width = hb.value("width", p.healthBar.width);
        p.healthBar.height = hb.value("height", p.healthBar.height);
        p.healthBar.offsetY = hb.value("offsetY", p.healthBar.offsetY);
    }
    if (j.contains("attack") && j["attack"].is_object()) {
        const auto& a = j["attack"];
        p.attack.damage = a.value("damage", p.attack.damage);
        p.attack.range = a.value("range", p.attack.range);
        p.attack.size = a.value("size", p.attack.size);
        p.attack.intervalMs = a.value("intervalMs", p.attack.intervalMs);
        p.attack.visualDurationMs = a.value("visualDurationMs", p.attack.visualDurationMs);
        p.attack.color = readColor(a, "color", p.attack.color);
    }
}

void readEnemies(const json& j, GameConfig& cfg) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto type = parseEnemyType(it.key());
        if (!type) {
            Engine::logWarn("Unknown enemy type in gameplay config: " + it.key());
            continue;
        }
        if (!it.value().is_object()) continue;
        const auto& e = it.value();
        auto& def = cfg.enemies[static_cast<std::size_t>(*type)];
        def.name = e.value("name", def.name);
        def.speed = e.value("speed", def.speed);
        def.damage = e.value("damage", def.damage);
        def.attackRange = e.value("attackRange", def.attackRange);
        def.attackCooldownMs = e.value("attackCooldownMs", def.attackCooldownMs);
        def.health = e.value("health", def.health);
        def.visualSize = e.value("visualSize", def.visualSize);
        def.scale = e.value("scale", def.scale);
        def.color = readColor(e, "color", def.color);
        def.hitboxSize = e.value("hitboxSize", def.hitboxSize);
    }
}

void readBuildings(const json& j, GameConfig& cfg) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto type = parseBuildingType(it.key());
        if (!type) {
            Engine::logWarn("Unknown building type in gameplay config: " + it.key());
            continue;
        }
        if (!it.value().is_object()) continue;
        const auto& b = it.value();
        auto& def = cfg.buildings[static_cast<std::size_t>(*type)];
        def.name = b.value("name", def.name);
        def.buildTimeMs = b.value("buildTimeMs", def.buildTimeMs);
        def.size = b.value("size", def.size);
        def.color = readColor(b, "color", def.color);
        def.cost = b.value("cost", def.cost);
    }
}

void applyJson(const json& j, GameConfig& cfg) {
    if (j.contains("player") && j["player"].is_object()) {
        readPlayer(j["player"], cfg.player);
    }
    if (j.contains("world") && j["world"].is_object()) {
        const auto& w = j["world"];
        cfg.world.width = w.value("width", cfg.world.width);
        cfg.world.height = w.value("height", cfg.world.height);
        cfg.world.backgroundColor = readColor(w, "backgroundColor", cfg.world.backgroundColor);
    }
    if (j.contains("camera") && j["camera"].is_object()) {
        const auto& c = j["camera"];
        cfg.camera.zoom = c.value("zoom", cfg.camera.zoom);
        cfg.camera.followLerp = c.value("followLerp", cfg.camera.followLerp);
    }
    if (j.contains("enemies") && j["enemies"].is_object()) {
        readEnemies(j["enemies"], cfg);
    }
    if (j.contains("spawn") && j["spawn"].is_object()) {
        const auto& s = j["spawn"];
        cfg.spawn.maxEnemies = s.value("maxEnemies", cfg.spawn.maxEnemies);
        cfg.spawn.distance = s.value("distance", cfg.spawn.distance);
        cfg.spawn.intervalMs = s.value("intervalMs", cfg.spawn.intervalMs);
        cfg.spawn.margin = s.value("margin", cfg.spawn.margin);
        if (s.contains("type") && s["type"].is_string()) {
            if (auto type = parseEnemyType(s["type"].get<std::string>())) {
                cfg.spawn.type = *type;
            } else {
                Engine::logWarn("Unknown spawn enemy type: " + s["type"].get<std::string>());
            }
        }
    }
    if (j.contains("buildings") && j["buildings"].is_object()) {
        readBuildings(j["buildings"], cfg);
    }
    if (j.contains("construction") && j["construction"].is_object()) {
        const auto& c = j["construction"];
        cfg.construction.startHealth = c.value("startHealth", cfg.construction.startHealth);
        cfg.construction.maxHealth = c.value("maxHealth", cfg.construction.maxHealth);
        cfg.construction.healPerSecond = c.value("healPerSecond", cfg.construction.healPerSecond);
    }
    if (j.contains("placement") && j["placement"].is_object()) {
        const auto& p = j["placement"];
        cfg.placement.gridSize = p.value("gridSize", cfg.placement.gridSize);
        cfg.placement.minDistanceFromPlayer = p.value("minDistanceFromPlayer", cfg.placement.minDistanceFromPlayer);
    }
    if (j.contains("hud") && j["hud"].is_object()) {
        const auto& h = j["hud"];
        cfg.hud.iconSize = h.value("iconSize", cfg.hud.iconSize);
        cfg.hud.iconSpacing = h.value("iconSpacing", cfg.hud.iconSpacing);
        cfg.hud.iconYFraction = h.value("iconYFraction", cfg.hud.iconYFraction);
        cfg.hud.selectedAlpha = h.value("selectedAlpha", cfg.hud.selectedAlpha);
        cfg.hud.unselectedAlpha = h.value("unselectedAlpha", cfg.hud.unselectedAlpha);
    }
    if (j.contains("debug") && j["debug"].is_object()) {
        const auto& d = j["debug"];
        cfg.debug.consoleLogs = d.value("consoleLogs", cfg.debug.consoleLogs);
        cfg.debug.performanceMonitor = d.value("performanceMonitor", cfg.debug.performanceMonitor);
    }
}

}  // namespace

const char* toString(EnemyTypeId type) {
    switch (type) {
        case EnemyTypeId::Dog: return "DOG";
    }
    return "UNKNOWN";
}

const char* toString(BuildingType type) {
    switch (type) {
        case BuildingType::Power: return "POWER";
        case BuildingType::Water: return "WATER";
        case BuildingType::Food: return "FOOD";
        case BuildingType::Turret: return "TURRET";
    }
    return "UNKNOWN";
}

std::optional<EnemyTypeId> parseEnemyType(const std::string& name) {
    const std::string k = upper(name);
    if (k == "DOG") return EnemyTypeId::Dog;
    return std::nullopt;
}

std::optional<BuildingType> parseBuildingType(const std::string& name) {
    const std::string k = upper(name);
    if (k == "POWER") return BuildingType::Power;
    if (k == "WATER") return BuildingType::Water;
    if (k == "FOOD") return BuildingType::Food;
    if (k == "TURRET") return BuildingType::Turret;
    return std::nullopt;
}

bool loadGameConfig(const std::string& path, GameConfig& config) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Engine::logWarn("Gameplay config not found: " + path + " (using defaults)");
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!loadGameConfigFromString(buffer.str(), config)) {
        Engine::logWarn("Failed to load gameplay config: " + path);
        return false;
    }
    Engine::logInfo("Loaded gameplay config: " + path);
    return true;
}

bool loadGameConfigFromString(const std::string& text, GameConfig& config) {
    GameConfig staged = config;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            Engine::logWarn("Gameplay config root must be a JSON object.");
            return false;
        }
        applyJson(j, staged);
    } catch (const json::exception& e) {
        Engine::logWarn(std::string("Gameplay config parse error: ") + e.what());
        return false;
    }
    config = staged;
    return true;
}

}  // namespace Sundown
