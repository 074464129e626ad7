#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. athlete_core/types/chunk.hpp),
// users can simply do `#include "athlete_core/types.hpp"`.
//
#include "athlete_core/types/chunk.hpp"
#include "athlete_core/types/indexing_stats.hpp"
#include "athlete_core/types/source_document.hpp"

#include <chrono>
#include <string>

namespace athlete_core {

// Timestamps are stored as "YYYY-MM-DD HH:MM:SS" in UTC.
std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

}  // namespace athlete_core
