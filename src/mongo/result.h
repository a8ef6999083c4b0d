/**
 * @file result.h
 * @brief "No document matched" detection for single-document lookups
 */

#pragma once

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/stdx/optional.hpp>

#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::mongo {

/**
 * @brief Turn a find_one() result into a document or kNoResults
 *
 * @code
 * auto doc = RequireDocument(collection.find_one(filter));
 * if (!doc && IsNoResult(doc.error())) {
 *   // respond 404
 * }
 * @endcode
 */
mongokit::utils::Expected<bsoncxx::document::value, mongokit::utils::Error> RequireDocument(
    bsoncxx::stdx::optional<bsoncxx::document::value> found);

/**
 * @brief Check whether an error is the "no document matched" signal
 */
bool IsNoResult(const mongokit::utils::Error& error);

}  // namespace mongokit::mongo
