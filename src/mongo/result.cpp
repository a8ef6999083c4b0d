/**
 * @file result.cpp
 * @brief "No document matched" detection
 */

#include "mongo/result.h"

#include <utility>

namespace mongokit::mongo {

using mongokit::utils::Error;
using mongokit::utils::ErrorCode;
using mongokit::utils::Expected;
using mongokit::utils::MakeError;
using mongokit::utils::MakeUnexpected;

Expected<bsoncxx::document::value, Error> RequireDocument(bsoncxx::stdx::optional<bsoncxx::document::value> found) {
  if (!found) {
    return MakeUnexpected(MakeError(ErrorCode::kNoResults));
  }
  return std::move(*found);
}

bool IsNoResult(const Error& error) {
  return error.code() == ErrorCode::kNoResults;
}

}  // namespace mongokit::mongo
