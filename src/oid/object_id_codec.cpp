/**
 * @file object_id_codec.cpp
 * @brief ObjectId codec implementation
 */

#include "oid/object_id_codec.h"

#include <algorithm>
#include <cctype>

namespace mongokit::oid {

using mongokit::utils::Error;
using mongokit::utils::ErrorCode;
using mongokit::utils::Expected;
using mongokit::utils::MakeError;
using mongokit::utils::MakeUnexpected;

namespace {

bool IsHexDigit(char chr) {
  return std::isxdigit(static_cast<unsigned char>(chr)) != 0;
}

}  // namespace

Expected<void, Error> ValidateObjectIdString(const std::string& input) {
  if (input.size() != kObjectIdHexLength) {
    return MakeUnexpected(MakeError(ErrorCode::kIdBadLength,
                                    "ID must be " + std::to_string(kObjectIdHexLength) + " characters long, got " +
                                        std::to_string(input.size())));
  }

  auto bad_char = std::find_if_not(input.begin(), input.end(), IsHexDigit);
  if (bad_char != input.end()) {
    return MakeUnexpected(MakeError(ErrorCode::kIdNotHex, "ID contains a non-hexadecimal character at position " +
                                                              std::to_string(bad_char - input.begin())));
  }

  return {};
}

bool IsValidObjectIdString(const std::string& input) {
  return ValidateObjectIdString(input).has_value();
}

Expected<bsoncxx::oid, Error> DecodeObjectId(const std::string& input) {
  auto valid = ValidateObjectIdString(input);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }

  // Both checks passed, so the driver accepts the string
  return bsoncxx::oid(input);
}

std::string EncodeObjectId(const bsoncxx::oid& id) {
  return id.to_string();
}

}  // namespace mongokit::oid
