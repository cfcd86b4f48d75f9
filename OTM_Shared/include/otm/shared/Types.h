#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace otm::shared {

using RoomId      = std::string;
using PlayerName  = std::string;
using FloorNumber = int;

// Index into the NPC arena; stable for the lifetime of the engine
using NpcHandle = std::uint32_t;
inline constexpr NpcHandle InvalidNpcHandle = std::numeric_limits<NpcHandle>::max();

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using Milliseconds = std::uint32_t;  // configured intervals

} // namespace otm::shared
