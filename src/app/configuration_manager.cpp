/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

#include "mongo/read_mode.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace mongokit::app {

using mongokit::utils::ErrorCode;
using mongokit::utils::MakeError;
using mongokit::utils::MakeUnexpected;

namespace {
constexpr const char* kLoggerName = "mongokit";
}  // namespace

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file) {
  auto config_result = config::LoadConfig(config_file);
  if (!config_result) {
    mongokit::utils::LogConfigLoadError(config_file, config_result.error().message());
    return MakeUnexpected(config_result.error());
  }

  auto manager =
      std::unique_ptr<ConfigurationManager>(new ConfigurationManager(config_file, std::move(*config_result)));
  return manager;
}

ConfigurationManager::ConfigurationManager(std::string config_file, config::Config initial_config)
    : config_file_(std::move(config_file)), config_(std::move(initial_config)) {}

query::QueryDefaults ConfigurationManager::GetQueryDefaults() const {
  query::QueryDefaults defaults;
  defaults.default_limit = config_.query.default_limit;
  defaults.default_sort_field = config_.query.default_sort;
  return defaults;
}

int ConfigurationManager::PrintConfigTest(std::ostream& out) const {
  const auto& mongo = config_.mongo;
  out << "Configuration file syntax is OK\n";
  out << "Configuration details:\n";
  out << "  MongoDB servers: " << mongokit::utils::RedactCredentials(mongo.servers) << "\n";
  out << "  Database: " << (mongo.database.empty() ? "(default)" : mongo.database) << "\n";
  out << "  Read preference: " << mongo::ReadModeToString(mongo.read_mode) << "\n";
  out << "  Write concern: w="
      << (mongo.write_concern.w_mode.empty() ? std::to_string(mongo.write_concern.w) : mongo.write_concern.w_mode)
      << (mongo.write_concern.journal ? ", journal" : "") << "\n";
  out << "  Query defaults: limit=" << config_.query.default_limit << ", sort=" << config_.query.default_sort << "\n";
  out << "  Logging level: " << config_.logging.level << "\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  // Configure log output (file or stdout) BEFORE setting level
  if (!config_.logging.file.empty()) {
    try {
      std::filesystem::path log_path(config_.logging.file);
      std::filesystem::path log_dir = log_path.parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }

      spdlog::drop(kLoggerName);
      auto file_logger = spdlog::basic_logger_mt(kLoggerName, config_.logging.file);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      return MakeUnexpected(MakeError(ErrorCode::kIOError, "Log file initialization failed: " + std::string(ex.what())));
    } catch (const std::filesystem::filesystem_error& ex) {
      return MakeUnexpected(
          MakeError(ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
    }
  }

  // Apply logging level (must be AFTER setting default logger)
  if (config_.logging.level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (config_.logging.level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (config_.logging.level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (config_.logging.level == "error") {
    spdlog::set_level(spdlog::level::err);
  }

  mongokit::utils::StructuredLog::SetFormat(mongokit::utils::StructuredLog::ParseFormat(config_.logging.format));

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }
  return {};
}

}  // namespace mongokit::app
