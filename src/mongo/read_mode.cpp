/**
 * @file read_mode.cpp
 * @brief Read mode parsing
 */

#include "mongo/read_mode.h"

#include "utils/string_utils.h"

namespace mongokit::mongo {

using mongokit::utils::Error;
using mongokit::utils::ErrorCode;
using mongokit::utils::Expected;
using mongokit::utils::MakeError;
using mongokit::utils::MakeUnexpected;

Expected<ReadMode, Error> ParseReadMode(const std::string& name) {
  std::string lower = mongokit::utils::ToLower(name);

  if (lower == "eventual" || lower == "0") {
    return ReadMode::kEventual;
  }
  if (lower == "monotonic" || lower == "1") {
    return ReadMode::kMonotonic;
  }
  if (lower == "strong" || lower == "2") {
    return ReadMode::kStrong;
  }

  return MakeUnexpected(MakeError(ErrorCode::kMongoInvalidReadPreference,
                                  "Unknown read preference: '" + name + "' (expected eventual, monotonic or strong)"));
}

const char* ReadModeToString(ReadMode mode) {
  switch (mode) {
    case ReadMode::kEventual:
      return "eventual";
    case ReadMode::kMonotonic:
      return "monotonic";
    case ReadMode::kStrong:
      return "strong";
  }
  return "strong";
}

const char* ReadModeToUriValue(ReadMode mode) {
  switch (mode) {
    case ReadMode::kEventual:
      return "nearest";
    case ReadMode::kMonotonic:
      return "secondaryPreferred";
    case ReadMode::kStrong:
      return "primary";
  }
  return "primary";
}

}  // namespace mongokit::mongo
