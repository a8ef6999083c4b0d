/**
 * @file result_test.cpp
 * @brief Unit tests for "no document matched" detection
 */

#include "mongo/result.h"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace mongokit::mongo;
using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using mongokit::utils::Error;
using mongokit::utils::ErrorCode;

TEST(ResultTest, EmptyLookupIsNoResults) {
  auto result = RequireDocument(bsoncxx::stdx::optional<bsoncxx::document::value>{});

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kNoResults);
  EXPECT_TRUE(IsNoResult(result.error()));
}

TEST(ResultTest, FoundDocumentIsReturned) {
  bsoncxx::stdx::optional<bsoncxx::document::value> found{make_document(kvp("username", "alice"))};

  auto result = RequireDocument(std::move(found));

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(std::string(result->view()["username"].get_string().value), "alice");
}

TEST(ResultTest, IsNoResultOnlyMatchesNoResults) {
  EXPECT_TRUE(IsNoResult(Error(ErrorCode::kNoResults)));
  EXPECT_FALSE(IsNoResult(Error(ErrorCode::kNotFound)));
  EXPECT_FALSE(IsNoResult(Error(ErrorCode::kMongoCommandFailed)));
  EXPECT_FALSE(IsNoResult(Error()));
}
