/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 */

#include "utils/string_utils.h"

#include <algorithm>
#include <cctype>

namespace mongokit::utils {

std::string ToLower(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return lower;
}

std::vector<std::string> Split(const std::string& text, char delimiter) {
  std::vector<std::string> tokens;
  size_t start = 0;
  while (true) {
    size_t pos = text.find(delimiter, start);
    if (pos == std::string::npos) {
      tokens.push_back(text.substr(start));
      break;
    }
    tokens.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return tokens;
}

std::string RedactCredentials(const std::string& uri) {
  size_t scheme_end = uri.find("://");
  size_t userinfo_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;

  // Userinfo ends at the last '@' before the path or options
  size_t path_start = uri.find_first_of("/?", userinfo_start);
  size_t at_pos = uri.rfind('@', path_start == std::string::npos ? std::string::npos : path_start);
  if (at_pos == std::string::npos || at_pos < userinfo_start) {
    return uri;
  }

  size_t colon_pos = uri.find(':', userinfo_start);
  if (colon_pos == std::string::npos || colon_pos > at_pos) {
    return uri;
  }

  return uri.substr(0, colon_pos + 1) + "***" + uri.substr(at_pos);
}

}  // namespace mongokit::utils
