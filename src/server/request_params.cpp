/**
 * @file request_params.cpp
 * @brief HTTP request parameter extraction implementation
 */

#include "server/request_params.h"

#include "oid/object_id_codec.h"

namespace mongokit::server {

std::optional<std::string> FormValue(const httplib::Request& req, const std::string& name) {
  if (!req.has_param(name.c_str())) {
    return std::nullopt;
  }
  return req.get_param_value(name.c_str());
}

query::ParamAccessor MakeParamAccessor(const httplib::Request& req) {
  return [&req](const std::string& name) { return FormValue(req, name); };
}

int64_t LimitFromRequest(const httplib::Request& req, const query::QueryDefaults& defaults) {
  return query::ResolveLimit(MakeParamAccessor(req), defaults);
}

std::vector<query::SortSpec> SortFromRequest(const httplib::Request& req, const query::QueryDefaults& defaults) {
  return query::ResolveSort(MakeParamAccessor(req), defaults);
}

mongokit::utils::Expected<bsoncxx::oid, mongokit::utils::Error> ObjectIdFromRequest(const httplib::Request& req,
                                                                                    const std::string& name) {
  return oid::DecodeObjectId(FormValue(req, name).value_or(""));
}

}  // namespace mongokit::server
