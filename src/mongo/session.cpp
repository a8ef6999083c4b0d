/**
 * @file session.cpp
 * @brief MongoDB session implementation
 */

#include "mongo/session.h"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/uri.hpp>
#include <spdlog/spdlog.h>

#include <set>
#include <utility>
#include <vector>

#include "mongo/mongo_instance.h"
#include "mongo/read_mode.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace mongokit::mongo {

using mongokit::utils::Error;
using mongokit::utils::ErrorCode;
using mongokit::utils::Expected;
using mongokit::utils::MakeError;
using mongokit::utils::MakeUnexpected;

namespace {

constexpr const char* kSchemeSeparator = "://";
constexpr const char* kDefaultScheme = "mongodb://";
constexpr const char* kFallbackDatabase = "admin";

}  // namespace

std::string BuildConnectionUri(const config::MongoConfig& config) {
  std::string base = config.servers;
  std::string existing_options;

  size_t query_start = base.find('?');
  if (query_start != std::string::npos) {
    existing_options = base.substr(query_start + 1);
    base = base.substr(0, query_start);
  }

  if (base.find(kSchemeSeparator) == std::string::npos) {
    base = kDefaultScheme + base;
  }

  // A database already in the servers string wins over config.database
  size_t hosts_start = base.find(kSchemeSeparator) + 3;
  size_t path_pos = base.find('/', hosts_start);
  if (path_pos == std::string::npos) {
    base += "/" + config.database;
  } else if (path_pos + 1 == base.size()) {
    base += config.database;
  }

  std::vector<std::string> options;
  std::set<std::string> explicit_keys;
  if (!existing_options.empty()) {
    for (const auto& pair : mongokit::utils::Split(existing_options, '&')) {
      if (pair.empty()) {
        continue;
      }
      explicit_keys.insert(mongokit::utils::ToLower(pair.substr(0, pair.find('='))));
      options.push_back(pair);
    }
  }

  auto add_option = [&](const std::string& key, const std::string& value) {
    if (explicit_keys.count(mongokit::utils::ToLower(key)) == 0) {
      options.push_back(key + "=" + value);
    }
  };

  add_option("readPreference", ReadModeToUriValue(config.read_mode));

  const auto& write_concern = config.write_concern;
  add_option("w", write_concern.w_mode.empty() ? std::to_string(write_concern.w) : write_concern.w_mode);
  if (write_concern.journal) {
    add_option("journal", "true");
  }
  if (write_concern.wtimeout_ms > 0) {
    add_option("wtimeoutMS", std::to_string(write_concern.wtimeout_ms));
  }

  if (!config.app_name.empty()) {
    add_option("appname", config.app_name);
  }
  if (config.connect_timeout_ms > 0) {
    add_option("connectTimeoutMS", std::to_string(config.connect_timeout_ms));
  }
  if (config.server_selection_timeout_ms > 0) {
    add_option("serverSelectionTimeoutMS", std::to_string(config.server_selection_timeout_ms));
  }

  std::string uri = base;
  for (size_t i = 0; i < options.size(); ++i) {
    uri += (i == 0 ? "?" : "&");
    uri += options[i];
  }
  return uri;
}

Session::Session(config::MongoConfig config) : config_(std::move(config)) {}

Session::~Session() {
  Close();
}

Session::Session(Session&& other) noexcept = default;

Session& Session::operator=(Session&& other) noexcept = default;

Expected<void, Error> Session::Connect(const std::string& context) {
  GetMongoInstance();

  const std::string context_prefix = context.empty() ? "" : "[" + context + "] ";
  const std::string redacted_servers = mongokit::utils::RedactCredentials(config_.servers);

  if (pool_ != nullptr) {
    spdlog::debug("{}MongoDB session already connected, reconnecting", context_prefix);
    Close();
  }

  const std::string uri_string = BuildConnectionUri(config_);
  try {
    mongocxx::uri uri(uri_string);
    pool_ = std::make_unique<mongocxx::pool>(uri);
  } catch (const mongocxx::exception& e) {
    mongokit::utils::LogMongoConnectionError(redacted_servers, config_.database, e.what());
    return MakeUnexpected(MakeError(ErrorCode::kMongoInvalidUri, e.what(), redacted_servers));
  }

  auto ping = Ping();
  if (!ping) {
    pool_.reset();
    mongokit::utils::LogMongoConnectionError(redacted_servers, config_.database, ping.error().message());
    return MakeUnexpected(MakeError(ErrorCode::kMongoConnectionFailed, ping.error().message(), redacted_servers));
  }

  spdlog::info("{}Connected to MongoDB {}/{} (read preference: {}, w: {})", context_prefix, redacted_servers,
               DatabaseName(), ReadModeToString(config_.read_mode),
               config_.write_concern.w_mode.empty() ? std::to_string(config_.write_concern.w)
                                                    : config_.write_concern.w_mode);
  return {};
}

Expected<void, Error> Session::Ping() {
  auto client = Acquire();
  if (!client) {
    return MakeUnexpected(client.error());
  }

  using bsoncxx::builder::basic::kvp;
  using bsoncxx::builder::basic::make_document;

  try {
    (**client)[DatabaseName()].run_command(make_document(kvp("ping", 1)));
  } catch (const mongocxx::exception& e) {
    spdlog::warn("MongoDB ping failed: {}", e.what());
    return MakeUnexpected(MakeError(ErrorCode::kMongoCommandFailed, e.what(), "ping"));
  }
  return {};
}

void Session::Close() {
  if (pool_ != nullptr) {
    pool_.reset();
    spdlog::debug("MongoDB session closed");
  }
}

Expected<mongocxx::pool::entry, Error> Session::Acquire() {
  if (pool_ == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kMongoNotConnected, "Session is not connected; call Connect() first"));
  }

  try {
    return pool_->acquire();
  } catch (const mongocxx::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kMongoConnectionFailed, e.what(), "pool acquire"));
  }
}

std::string Session::DatabaseName() const {
  std::string name = config_.database;
  GetMongoInstance();
  try {
    name = mongocxx::uri(BuildConnectionUri(config_)).database();
  } catch (const mongocxx::exception& e) {
    spdlog::debug("Cannot parse MongoDB URI for database name: {}", e.what());
  }
  return name.empty() ? kFallbackDatabase : name;
}

}  // namespace mongokit::mongo
