#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ward {

uint64_t CurrentTimeMillis();

// 2024-05-01T12:30:00.123Z
std::string TimestampToISO8601(uint64_t ms_epoch);

// 20240501_123000, UTC. Used in file names.
std::string TimestampToCompact(uint64_t ms_epoch);

// Maps a steady_clock instant onto the wall clock, relative to now.
uint64_t SteadyToEpochMillis(std::chrono::steady_clock::time_point tp);

} // namespace ward
