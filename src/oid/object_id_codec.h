/**
 * @file object_id_codec.h
 * @brief Validation and conversion between hex strings and ObjectIds
 */

#pragma once

#include <bsoncxx/oid.hpp>

#include <cstddef>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::oid {

/// Length of the hexadecimal ObjectId representation
constexpr size_t kObjectIdHexLength = 24;

/**
 * @brief Check that a string is a valid ObjectId representation
 *
 * Checks run in order and stop at the first failure:
 * 1. length is exactly 24 (kIdBadLength)
 * 2. every character is a hexadecimal digit, either case (kIdNotHex)
 *
 * @param input Candidate identifier string
 * @return Expected<void, Error> - success or the first failed check
 */
mongokit::utils::Expected<void, mongokit::utils::Error> ValidateObjectIdString(const std::string& input);

/**
 * @brief Boolean form of ValidateObjectIdString()
 */
bool IsValidObjectIdString(const std::string& input);

/**
 * @brief Convert a hex string into an ObjectId
 *
 * @param input 24-character hexadecimal string (case-insensitive)
 * @return ObjectId, or kIdBadLength / kIdNotHex
 */
mongokit::utils::Expected<bsoncxx::oid, mongokit::utils::Error> DecodeObjectId(const std::string& input);

/**
 * @brief Convert an ObjectId into its 24-character lowercase hex string
 */
std::string EncodeObjectId(const bsoncxx::oid& id);

}  // namespace mongokit::oid
