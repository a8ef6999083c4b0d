/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <cstdint>
#include <string>

#include "mongo/read_mode.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::config {

// Default values for configuration
namespace defaults {

// MongoDB connection defaults
constexpr const char* kMongoServers = "localhost:27017";
constexpr const char* kMongoAppName = "mongokit";
constexpr int kMongoConnectTimeoutMs = 10000;
constexpr int kMongoServerSelectionTimeoutMs = 30000;
constexpr int kWriteConcernW = 1;

// Query defaults
constexpr int64_t kDefaultLimit = 5;
constexpr const char* kDefaultSort = "_id";

}  // namespace defaults

/**
 * @brief Write acknowledgement settings
 */
struct WriteConcernConfig {
  int w = defaults::kWriteConcernW;  ///< Number of members to acknowledge (0 = unacknowledged)
  std::string w_mode;                ///< Tag or "majority"; overrides w when non-empty
  int wtimeout_ms = 0;               ///< 0 = wait forever
  bool journal = false;              ///< Wait for the journal commit
};

/**
 * @brief MongoDB session configuration
 */
struct MongoConfig {
  std::string servers = defaults::kMongoServers;  ///< "host:port[,host:port]" or a full mongodb:// URI
  std::string database;
  std::string app_name = defaults::kMongoAppName;
  mongo::ReadMode read_mode = mongo::ReadMode::kStrong;
  WriteConcernConfig write_concern;
  int connect_timeout_ms = defaults::kMongoConnectTimeoutMs;
  int server_selection_timeout_ms = defaults::kMongoServerSelectionTimeoutMs;
};

/**
 * @brief Fallbacks for limit/sort extraction
 */
struct QueryConfig {
  int64_t default_limit = defaults::kDefaultLimit;
  std::string default_sort = defaults::kDefaultSort;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";
  std::string file;              ///< Log file path (empty = stdout, path = file output)
  std::string format = "text";  ///< Structured event format: "json" or "text"
};

/**
 * @brief Root configuration
 */
struct Config {
  MongoConfig mongo;
  QueryConfig query;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML or JSON file
 *
 * Detects the format from the extension (.yaml, .yml, .json). Unknown
 * extensions are tried as YAML first, then JSON.
 *
 * @param path Path to configuration file
 * @return Expected<Config, Error> with configuration or error
 */
mongokit::utils::Expected<Config, mongokit::utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Load configuration from a YAML file
 */
mongokit::utils::Expected<Config, mongokit::utils::Error> LoadConfigYaml(const std::string& path);

/**
 * @brief Load configuration from a JSON file
 */
mongokit::utils::Expected<Config, mongokit::utils::Error> LoadConfigJson(const std::string& path);

}  // namespace mongokit::config
