/**
 * @file query_params.h
 * @brief Limit and sort extraction from optional request parameters
 *
 * Inputs are untrusted and optional (typically HTTP query or form values such
 * as ?limit=10&sort=birthday,-username). Malformed input is normalized to the
 * configured defaults instead of being reported as an error.
 */

#pragma once

#include <bsoncxx/document/value.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mongokit::query {

/// Parameter name read by the accessor overload of ResolveLimit()
constexpr const char* kLimitParam = "limit";

/// Parameter name read by the accessor overload of ResolveSort()
constexpr const char* kSortParam = "sort";

/// Limit returned for "none" / "all": no cap on the result count
constexpr int64_t kLimitReturnAll = 0;

/// Limit used when the parameter is absent or unparseable
constexpr int64_t kDefaultLimit = 5;

/// Field sorted on when no sort parameter is given
constexpr const char* kDefaultSortField = "_id";

/// Prefix marking a descending sort field
constexpr char kDescendingPrefix = '-';

/**
 * @brief Sort direction
 */
enum class SortOrder : uint8_t {
  ASC,  // Ascending
  DESC  // Descending
};

/**
 * @brief One sort directive (field + direction)
 */
struct SortSpec {
  std::string field;
  SortOrder order = SortOrder::ASC;

  [[nodiscard]] bool IsDescending() const { return order == SortOrder::DESC; }

  bool operator==(const SortSpec& other) const { return field == other.field && order == other.order; }
  bool operator!=(const SortSpec& other) const { return !(*this == other); }
};

/**
 * @brief Configurable fallbacks for ResolveLimit() / ResolveSort()
 */
struct QueryDefaults {
  int64_t default_limit = kDefaultLimit;
  std::string default_sort_field = kDefaultSortField;
};

/**
 * @brief Produces the raw value of a named parameter, or nullopt if absent
 */
using ParamAccessor = std::function<std::optional<std::string>(const std::string& name)>;

/**
 * @brief Resolve the result-count limit
 *
 * - absent or empty: defaults.default_limit
 * - "none" or "all" (case-sensitive): kLimitReturnAll (0)
 * - base-10 integer (optional sign, nothing else): returned verbatim,
 *   so "0" also yields kLimitReturnAll and negatives pass through
 * - anything else: defaults.default_limit
 */
int64_t ResolveLimit(const std::optional<std::string>& raw, const QueryDefaults& defaults = {});

/**
 * @brief ResolveLimit() over the "limit" parameter of an accessor
 */
int64_t ResolveLimit(const ParamAccessor& accessor, const QueryDefaults& defaults = {});

/**
 * @brief Resolve the ordered list of sort directives
 *
 * - absent or empty: {defaults.default_sort_field, ASC}
 * - otherwise split on ',' without trimming; a leading '-' on a token
 *   means DESC and is removed from the field name
 *
 * The result keeps the input order; callers apply directives in sequence.
 */
std::vector<SortSpec> ResolveSort(const std::optional<std::string>& raw, const QueryDefaults& defaults = {});

/**
 * @brief ResolveSort() over the "sort" parameter of an accessor
 */
std::vector<SortSpec> ResolveSort(const ParamAccessor& accessor, const QueryDefaults& defaults = {});

/**
 * @brief Render directives as "field" / "-field" keys
 */
std::vector<std::string> ToSortKeys(const std::vector<SortSpec>& specs);

/**
 * @brief Build a {field: 1|-1, ...} sort document in directive order
 *
 * Suitable for mongocxx::options::find::sort().
 */
bsoncxx::document::value BuildSortDocument(const std::vector<SortSpec>& specs);

}  // namespace mongokit::query
