/**
 * @file read_mode.h
 * @brief Session consistency modes and their read preference mapping
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::mongo {

/**
 * @brief Consistency mode of a session
 */
enum class ReadMode : uint8_t {
  kEventual = 0,   // Any member, may switch between reads (readPreference=nearest)
  kMonotonic = 1,  // Secondaries preferred (readPreference=secondaryPreferred)
  kStrong = 2,     // Primary only (readPreference=primary)
};

/**
 * @brief Parse "eventual" / "monotonic" / "strong" (case-insensitive) or "0" / "1" / "2"
 * @return ReadMode, or kMongoInvalidReadPreference
 */
mongokit::utils::Expected<ReadMode, mongokit::utils::Error> ParseReadMode(const std::string& name);

/**
 * @brief Lowercase name of a mode ("eventual", ...)
 */
const char* ReadModeToString(ReadMode mode);

/**
 * @brief readPreference URI option value for a mode
 */
const char* ReadModeToUriValue(ReadMode mode);

}  // namespace mongokit::mongo
