/**
 * @file request_params_test.cpp
 * @brief Unit tests for limit, sort and ObjectId extraction from HTTP requests
 */

#include "server/request_params.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace mongokit::server;
using mongokit::query::QueryDefaults;
using mongokit::query::SortOrder;
using mongokit::query::SortSpec;
using mongokit::utils::ErrorCode;

namespace {

httplib::Request MakeRequest(std::initializer_list<std::pair<std::string, std::string>> params) {
  httplib::Request req;
  req.method = "GET";
  req.path = "/users";
  for (const auto& param : params) {
    req.params.emplace(param.first, param.second);
  }
  return req;
}

}  // namespace

TEST(RequestParamsTest, FormValue) {
  auto req = MakeRequest({{"limit", "10"}, {"sort", ""}});

  EXPECT_EQ(FormValue(req, "limit"), std::optional<std::string>("10"));
  EXPECT_EQ(FormValue(req, "sort"), std::optional<std::string>(""));
  EXPECT_FALSE(FormValue(req, "id").has_value());
}

TEST(RequestParamsTest, FirstValueWins) {
  auto req = MakeRequest({{"limit", "3"}, {"limit", "9"}});

  EXPECT_EQ(LimitFromRequest(req), 3);
}

TEST(RequestParamsTest, LimitFromRequest) {
  EXPECT_EQ(LimitFromRequest(MakeRequest({{"limit", "10"}})), 10);
  EXPECT_EQ(LimitFromRequest(MakeRequest({{"limit", "all"}})), 0);
  EXPECT_EQ(LimitFromRequest(MakeRequest({{"limit", "abc"}})), 5);
  EXPECT_EQ(LimitFromRequest(MakeRequest({})), 5);
}

TEST(RequestParamsTest, LimitFromRequestWithDefaults) {
  QueryDefaults defaults;
  defaults.default_limit = 50;

  EXPECT_EQ(LimitFromRequest(MakeRequest({}), defaults), 50);
  EXPECT_EQ(LimitFromRequest(MakeRequest({{"limit", ""}}), defaults), 50);
}

TEST(RequestParamsTest, SortFromRequest) {
  auto specs = SortFromRequest(MakeRequest({{"sort", "birthday,-username"}}));

  std::vector<SortSpec> expected{{"birthday", SortOrder::ASC}, {"username", SortOrder::DESC}};
  EXPECT_EQ(specs, expected);
}

TEST(RequestParamsTest, SortFromRequestDefaults) {
  std::vector<SortSpec> id_ascending{{"_id", SortOrder::ASC}};
  EXPECT_EQ(SortFromRequest(MakeRequest({})), id_ascending);

  QueryDefaults defaults;
  defaults.default_sort_field = "created_at";
  std::vector<SortSpec> created_ascending{{"created_at", SortOrder::ASC}};
  EXPECT_EQ(SortFromRequest(MakeRequest({{"sort", ""}}), defaults), created_ascending);
}

TEST(RequestParamsTest, AccessorReadsRequest) {
  auto req = MakeRequest({{"limit", "7"}});
  auto accessor = MakeParamAccessor(req);

  EXPECT_EQ(accessor("limit"), std::optional<std::string>("7"));
  EXPECT_FALSE(accessor("sort").has_value());
}

TEST(RequestParamsTest, ObjectIdFromRequest) {
  auto req = MakeRequest({{"id", "507f1f77bcf86cd799439011"}});

  auto id = ObjectIdFromRequest(req, "id");
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->to_string(), "507f1f77bcf86cd799439011");
}

TEST(RequestParamsTest, ObjectIdFromRequestErrors) {
  auto missing = ObjectIdFromRequest(MakeRequest({}), "id");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code(), ErrorCode::kIdBadLength);

  auto not_hex = ObjectIdFromRequest(MakeRequest({{"id", "507f1f77bcf86cd79943901x"}}), "id");
  ASSERT_FALSE(not_hex.has_value());
  EXPECT_EQ(not_hex.error().code(), ErrorCode::kIdNotHex);
}
