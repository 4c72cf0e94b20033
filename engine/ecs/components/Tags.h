// Marker tags for entity classification.
#pragma once

namespace Engine::ECS {

struct PlayerTag {};
struct EnemyTag {};
struct BuildingTag {};

}  // namespace Engine::ECS
