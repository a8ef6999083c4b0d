/**
 * @file query_params_test.cpp
 * @brief Unit tests for limit and sort extraction
 */

#include "query/query_params.h"

#include <bsoncxx/json.hpp>
#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace mongokit::query;

namespace {

/**
 * @brief Accessor over a fixed parameter map
 */
ParamAccessor MapAccessor(std::map<std::string, std::string> params) {
  return [params = std::move(params)](const std::string& name) -> std::optional<std::string> {
    auto iter = params.find(name);
    if (iter == params.end()) {
      return std::nullopt;
    }
    return iter->second;
  };
}

SortSpec Asc(const std::string& field) {
  return SortSpec{field, SortOrder::ASC};
}

SortSpec Desc(const std::string& field) {
  return SortSpec{field, SortOrder::DESC};
}

}  // namespace

// ===========================================================================
// ResolveLimit
// ===========================================================================

TEST(ResolveLimitTest, AbsentOrEmptyUsesDefault) {
  EXPECT_EQ(ResolveLimit(std::nullopt), 5);
  EXPECT_EQ(ResolveLimit(""), 5);
}

TEST(ResolveLimitTest, SentinelsMeanReturnAll) {
  EXPECT_EQ(ResolveLimit("none"), kLimitReturnAll);
  EXPECT_EQ(ResolveLimit("all"), kLimitReturnAll);
  EXPECT_EQ(kLimitReturnAll, 0);
}

TEST(ResolveLimitTest, SentinelsAreCaseSensitive) {
  EXPECT_EQ(ResolveLimit("ALL"), 5);
  EXPECT_EQ(ResolveLimit("None"), 5);
}

TEST(ResolveLimitTest, ParsesIntegers) {
  EXPECT_EQ(ResolveLimit("10"), 10);
  EXPECT_EQ(ResolveLimit("1"), 1);
  EXPECT_EQ(ResolveLimit("+5"), 5);
  EXPECT_EQ(ResolveLimit("007"), 7);
}

/**
 * @brief A literal zero is the same as the return-all sentinel
 */
TEST(ResolveLimitTest, LiteralZeroIsReturnAll) {
  EXPECT_EQ(ResolveLimit("0"), kLimitReturnAll);
}

TEST(ResolveLimitTest, NegativeValuesPassThrough) {
  EXPECT_EQ(ResolveLimit("-3"), -3);
}

TEST(ResolveLimitTest, MalformedFallsBackToDefault) {
  EXPECT_EQ(ResolveLimit("abc"), 5);
  EXPECT_EQ(ResolveLimit(" 5"), 5);
  EXPECT_EQ(ResolveLimit("5 "), 5);
  EXPECT_EQ(ResolveLimit("12abc"), 5);
  EXPECT_EQ(ResolveLimit("1.5"), 5);
  EXPECT_EQ(ResolveLimit("+"), 5);
  EXPECT_EQ(ResolveLimit("-"), 5);
  EXPECT_EQ(ResolveLimit("+-1"), 5);
  EXPECT_EQ(ResolveLimit("99999999999999999999"), 5);
}

TEST(ResolveLimitTest, CustomDefault) {
  QueryDefaults defaults;
  defaults.default_limit = 25;

  EXPECT_EQ(ResolveLimit(std::nullopt, defaults), 25);
  EXPECT_EQ(ResolveLimit("junk", defaults), 25);
  EXPECT_EQ(ResolveLimit("3", defaults), 3);
  EXPECT_EQ(ResolveLimit("all", defaults), 0);
}

TEST(ResolveLimitTest, AccessorReadsLimitParameter) {
  EXPECT_EQ(ResolveLimit(MapAccessor({{"limit", "10"}})), 10);
  EXPECT_EQ(ResolveLimit(MapAccessor({{"limit", "all"}})), 0);
  EXPECT_EQ(ResolveLimit(MapAccessor({{"sort", "10"}})), 5);
  EXPECT_EQ(ResolveLimit(MapAccessor({})), 5);
}

TEST(ResolveLimitTest, EmptyAccessorUsesDefault) {
  ParamAccessor empty;
  EXPECT_EQ(ResolveLimit(empty), 5);
}

// ===========================================================================
// ResolveSort
// ===========================================================================

TEST(ResolveSortTest, AbsentOrEmptyUsesDefaultField) {
  std::vector<SortSpec> expected{Asc("_id")};
  EXPECT_EQ(ResolveSort(std::nullopt), expected);
  EXPECT_EQ(ResolveSort(""), expected);
}

TEST(ResolveSortTest, PreservesOrderAndDirection) {
  std::vector<SortSpec> expected{Asc("birthday"), Desc("username")};
  EXPECT_EQ(ResolveSort("birthday,-username"), expected);
}

TEST(ResolveSortTest, MixedDirectionsInInputOrder) {
  std::vector<SortSpec> expected{Desc("a"), Desc("b"), Asc("c")};
  EXPECT_EQ(ResolveSort("-a,-b,c"), expected);
}

TEST(ResolveSortTest, SingleField) {
  std::vector<SortSpec> ascending{Asc("name")};
  std::vector<SortSpec> descending{Desc("name")};
  EXPECT_EQ(ResolveSort("name"), ascending);
  EXPECT_EQ(ResolveSort("-name"), descending);
}

/**
 * @brief Empty tokens are kept as empty field names
 */
TEST(ResolveSortTest, EmptyTokensAreKept) {
  std::vector<SortSpec> expected{Asc("a"), Asc(""), Asc("b")};
  EXPECT_EQ(ResolveSort("a,,b"), expected);

  std::vector<SortSpec> trailing{Asc("a"), Asc("")};
  EXPECT_EQ(ResolveSort("a,"), trailing);
}

TEST(ResolveSortTest, OnlyOneLeadingDashIsStripped) {
  std::vector<SortSpec> expected{Desc("-a")};
  EXPECT_EQ(ResolveSort("--a"), expected);

  std::vector<SortSpec> bare_dash{Desc("")};
  EXPECT_EQ(ResolveSort("-"), bare_dash);
}

TEST(ResolveSortTest, TokensAreNotTrimmed) {
  std::vector<SortSpec> expected{Asc("a"), Asc(" -b")};
  EXPECT_EQ(ResolveSort("a, -b"), expected);
}

TEST(ResolveSortTest, CustomDefaultField) {
  QueryDefaults defaults;
  defaults.default_sort_field = "created_at";

  std::vector<SortSpec> expected{Asc("created_at")};
  EXPECT_EQ(ResolveSort(std::nullopt, defaults), expected);
}

TEST(ResolveSortTest, AccessorReadsSortParameter) {
  std::vector<SortSpec> expected{Asc("birthday"), Desc("username")};
  EXPECT_EQ(ResolveSort(MapAccessor({{"sort", "birthday,-username"}, {"limit", "3"}})), expected);

  std::vector<SortSpec> fallback{Asc("_id")};
  EXPECT_EQ(ResolveSort(MapAccessor({{"limit", "3"}})), fallback);
  EXPECT_EQ(ResolveSort(ParamAccessor()), fallback);
}

// ===========================================================================
// Conversions
// ===========================================================================

TEST(SortSpecTest, ToSortKeys) {
  auto keys = ToSortKeys({Asc("birthday"), Desc("username")});
  ASSERT_EQ(keys.size(), 2);
  EXPECT_EQ(keys[0], "birthday");
  EXPECT_EQ(keys[1], "-username");
}

TEST(SortSpecTest, BuildSortDocumentKeepsOrder) {
  auto doc = BuildSortDocument(ResolveSort("username,-birthday,_id"));
  auto view = doc.view();

  std::vector<std::string> keys;
  for (const auto& element : view) {
    keys.emplace_back(element.key());
  }
  ASSERT_EQ(keys.size(), 3);
  EXPECT_EQ(keys[0], "username");
  EXPECT_EQ(keys[1], "birthday");
  EXPECT_EQ(keys[2], "_id");

  EXPECT_EQ(view["username"].get_int32().value, 1);
  EXPECT_EQ(view["birthday"].get_int32().value, -1);
  EXPECT_EQ(view["_id"].get_int32().value, 1);
}

TEST(SortSpecTest, BuildSortDocumentJson) {
  auto doc = BuildSortDocument({Asc("birthday"), Desc("username")});
  EXPECT_EQ(bsoncxx::to_json(doc.view()), R"({ "birthday" : 1, "username" : -1 })");
}
