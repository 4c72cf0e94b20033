#include "InputLoader.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "../core/Logger.h"

namespace Engine {

namespace {
KeyList readStrings(const nlohmann::json& arr) {
    KeyList out;
    if (arr.is_string()) {
        out.push_back(arr.get<std::string>());
        return out;
    }
    if (!arr.is_array()) return out;
    for (const auto& v : arr) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

void readAction(const nlohmann::json& j, const char* key, KeyList& dst) {
    if (!j.contains(key)) return;
    KeyList keys = readStrings(j[key]);
    if (keys.empty()) {
        logWarn(std::string("Input binding '") + key + "' has no usable keys; keeping defaults.");
        return;
    }
    dst = std::move(keys);
}

std::optional<InputBindings> parseBindings(const nlohmann::json& j) {
    if (!j.is_object()) {
        logWarn("Input bindings root must be a JSON object.");
        return std::nullopt;
    }
    InputBindings bindings = InputBindings::defaults();
    if (j.contains("move") && j["move"].is_object()) {
        const auto& move = j["move"];
        readAction(move, "up", bindings.moveUp);
        readAction(move, "down", bindings.moveDown);
        readAction(move, "left", bindings.moveLeft);
        readAction(move, "right", bindings.moveRight);
    }
    readAction(j, "selectPrev", bindings.selectPrev);
    readAction(j, "selectNext", bindings.selectNext);
    readAction(j, "confirmPlacement", bindings.confirmPlacement);
    readAction(j, "restart", bindings.restart);
    return bindings;
}
}  // namespace

std::optional<InputBindings> InputLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str());
}

std::optional<InputBindings> InputLoader::loadFromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        logWarn(std::string("Input bindings parse error: ") + e.what());
        return std::nullopt;
    }
    return parseBindings(j);
}

}  // namespace Engine
