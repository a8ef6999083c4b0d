/**
 * @file query_params.cpp
 * @brief Limit and sort extraction implementation
 */

#include "query/query_params.h"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>

#include <charconv>
#include <string_view>
#include <system_error>

#include "utils/string_utils.h"

namespace mongokit::query {

namespace {

/**
 * @brief Parse a whole string as a base-10 int64_t
 *
 * Accepts an optional single leading '+' or '-'. Whitespace, trailing
 * characters and out-of-range values are rejected.
 */
std::optional<int64_t> ParseInteger(std::string_view text) {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (!text.empty() && text.front() == '-') {
      return std::nullopt;
    }
  }
  if (text.empty()) {
    return std::nullopt;
  }

  int64_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

int64_t ResolveLimit(const std::optional<std::string>& raw, const QueryDefaults& defaults) {
  if (!raw.has_value() || raw->empty()) {
    return defaults.default_limit;
  }

  if (*raw == "none" || *raw == "all") {
    return kLimitReturnAll;
  }

  auto parsed = ParseInteger(*raw);
  if (!parsed.has_value()) {
    return defaults.default_limit;
  }
  return *parsed;
}

int64_t ResolveLimit(const ParamAccessor& accessor, const QueryDefaults& defaults) {
  if (!accessor) {
    return defaults.default_limit;
  }
  return ResolveLimit(accessor(kLimitParam), defaults);
}

std::vector<SortSpec> ResolveSort(const std::optional<std::string>& raw, const QueryDefaults& defaults) {
  if (!raw.has_value() || raw->empty()) {
    return {SortSpec{defaults.default_sort_field, SortOrder::ASC}};
  }

  std::vector<SortSpec> specs;
  for (auto& token : mongokit::utils::Split(*raw, ',')) {
    SortSpec spec;
    if (!token.empty() && token.front() == kDescendingPrefix) {
      spec.field = token.substr(1);
      spec.order = SortOrder::DESC;
    } else {
      spec.field = std::move(token);
      spec.order = SortOrder::ASC;
    }
    specs.push_back(std::move(spec));
  }
  return specs;
}

std::vector<SortSpec> ResolveSort(const ParamAccessor& accessor, const QueryDefaults& defaults) {
  if (!accessor) {
    return ResolveSort(std::optional<std::string>(), defaults);
  }
  return ResolveSort(accessor(kSortParam), defaults);
}

std::vector<std::string> ToSortKeys(const std::vector<SortSpec>& specs) {
  std::vector<std::string> keys;
  keys.reserve(specs.size());
  for (const auto& spec : specs) {
    keys.push_back(spec.IsDescending() ? kDescendingPrefix + spec.field : spec.field);
  }
  return keys;
}

bsoncxx::document::value BuildSortDocument(const std::vector<SortSpec>& specs) {
  using bsoncxx::builder::basic::kvp;

  bsoncxx::builder::basic::document doc;
  for (const auto& spec : specs) {
    doc.append(kvp(spec.field, spec.IsDescending() ? -1 : 1));
  }
  return doc.extract();
}

}  // namespace mongokit::query
