// Lightweight entity handle. Ids are recycled after destroy; holders of a handle that can
// outlive its entity must check Registry::valid before use.
#pragma once

#include <cstdint>

namespace Engine::ECS {

using Entity = std::uint32_t;
constexpr Entity kInvalidEntity = 0;

}  // namespace Engine::ECS
