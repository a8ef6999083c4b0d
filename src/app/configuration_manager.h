/**
 * @file configuration_manager.h
 * @brief Configuration manager for loading configuration files and applying logging settings
 */

#ifndef MONGOKIT_APP_CONFIGURATION_MANAGER_H_
#define MONGOKIT_APP_CONFIGURATION_MANAGER_H_

#include <iostream>
#include <memory>
#include <string>

#include "config/config.h"
#include "query/query_params.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::app {

using mongokit::utils::Error;
using mongokit::utils::Expected;

/**
 * @brief Configuration manager
 *
 * Responsibilities:
 * - Load configuration from file (YAML/JSON)
 * - Apply logging configuration
 * - Provide read-only access to configuration
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create manager and load configuration
   * @param config_file Path to configuration file
   * @return Expected with manager instance or error
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file);

  ~ConfigurationManager() = default;

  // Non-copyable, non-movable (owns configuration state)
  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  [[nodiscard]] const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Fallbacks for limit/sort extraction taken from the query section
   */
  [[nodiscard]] query::QueryDefaults GetQueryDefaults() const;

  /**
   * @brief Test mode: print configuration details
   * @return Exit code (0 = success)
   *
   * Credentials in the servers string are redacted.
   */
  int PrintConfigTest(std::ostream& out = std::cout) const;

  /**
   * @brief Apply logging configuration
   *
   * Side effects:
   * - Sets spdlog log level (debug/info/warn/error)
   * - Configures file or console output
   * - Creates log directory if needed
   * - Sets the StructuredLog output format
   */
  Expected<void, Error> ApplyLoggingConfig();

  [[nodiscard]] const std::string& GetConfigFilePath() const { return config_file_; }

 private:
  ConfigurationManager(std::string config_file, config::Config initial_config);

  std::string config_file_;
  config::Config config_;
};

}  // namespace mongokit::app

#endif  // MONGOKIT_APP_CONFIGURATION_MANAGER_H_
