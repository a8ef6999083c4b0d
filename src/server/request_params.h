/**
 * @file request_params.h
 * @brief Limit, sort and ObjectId extraction from HTTP requests
 */

#pragma once

#include <bsoncxx/oid.hpp>
#include <httplib.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "query/query_params.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::server {

/**
 * @brief First value of a query-string or url-encoded form parameter
 * @return Parameter value, or nullopt when the request does not carry it
 */
std::optional<std::string> FormValue(const httplib::Request& req, const std::string& name);

/**
 * @brief Accessor reading parameters of a request (valid while req lives)
 */
query::ParamAccessor MakeParamAccessor(const httplib::Request& req);

/**
 * @brief query::ResolveLimit() over the "limit" parameter, e.g. ?limit=10
 */
int64_t LimitFromRequest(const httplib::Request& req, const query::QueryDefaults& defaults = {});

/**
 * @brief query::ResolveSort() over the "sort" parameter, e.g. ?sort=birthday,-username
 */
std::vector<query::SortSpec> SortFromRequest(const httplib::Request& req, const query::QueryDefaults& defaults = {});

/**
 * @brief Decode the ObjectId carried by a named parameter
 *
 * A missing parameter is decoded as the empty string and so reports
 * kIdBadLength.
 */
mongokit::utils::Expected<bsoncxx::oid, mongokit::utils::Error> ObjectIdFromRequest(const httplib::Request& req,
                                                                                    const std::string& name);

}  // namespace mongokit::server
