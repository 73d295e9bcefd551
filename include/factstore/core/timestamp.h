#pragma once

#include <chrono>
#include <string>

namespace factstore::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * Format a time point as a fixed-width UTC ISO-8601 string with second
 * precision: 2025-10-01T14:30:00Z.
 *
 * Stores compare timestamps as byte strings, so every timestamp handed to
 * a store should use one fixed-width UTC format. This is the one the
 * library produces itself.
 */
std::string formatUtc(TimePoint tp);

/**
 * Current time formatted with formatUtc().
 */
std::string utcNow();

} // namespace factstore::core
