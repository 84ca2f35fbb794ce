/**
 * Carpool route matching.
 *
 * Logging macros used across the library
 */

#ifndef POOLMATCH_UTIL_DEBUG_HPP
#define POOLMATCH_UTIL_DEBUG_HPP

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif

#include "spdlog/spdlog.h"
#include "spdlog/fmt/ranges.h"

#endif // POOLMATCH_UTIL_DEBUG_HPP
