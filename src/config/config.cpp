/**
 * @file config.cpp
 * @brief Configuration parser implementation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "utils/string_utils.h"

namespace mongokit::config {

using mongokit::utils::Error;
using mongokit::utils::ErrorCode;
using mongokit::utils::Expected;
using mongokit::utils::MakeError;
using mongokit::utils::MakeUnexpected;

namespace {

using json = nlohmann::json;

enum class FileFormat : uint8_t { kYaml, kJson, kUnknown };

FileFormat DetectFileFormat(const std::string& path) {
  std::string ext = mongokit::utils::ToLower(std::filesystem::path(path).extension().string());
  if (ext == ".yaml" || ext == ".yml") {
    return FileFormat::kYaml;
  }
  if (ext == ".json") {
    return FileFormat::kJson;
  }
  return FileFormat::kUnknown;
}

Expected<std::string, Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, "Cannot open configuration file", path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/**
 * @brief Convert YAML node to JSON object recursively
 *
 * Scalars that parse as JSON (numbers, booleans) keep their type,
 * everything else becomes a string.
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      const auto scalar = node.as<std::string>();
      try {
        return json::parse(scalar);
      } catch (const json::exception&) {
        return scalar;
      }
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

/**
 * @brief Assign obj[key] to out if present and not null
 */
template <typename T>
void ReadField(const json& obj, const char* key, T& out) {
  auto iter = obj.find(key);
  if (iter == obj.end() || iter->is_null()) {
    return;
  }
  out = iter->get<T>();
}

// Reject values that would wrap when narrowed to int
template <>
void ReadField<int>(const json& obj, const char* key, int& out) {
  auto iter = obj.find(key);
  if (iter == obj.end() || iter->is_null()) {
    return;
  }
  const bool too_large = iter->is_number_unsigned() &&
                         iter->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max());
  const auto value = too_large ? int64_t{0} : iter->get<int64_t>();
  if (too_large || value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(std::string("'") + key + "' is out of range: " + iter->dump());
  }
  out = static_cast<int>(value);
}

// YAML turns unquoted "2" or "123" into numbers; accept them for string fields
template <>
void ReadField<std::string>(const json& obj, const char* key, std::string& out) {
  auto iter = obj.find(key);
  if (iter == obj.end() || iter->is_null()) {
    return;
  }
  out = iter->is_number() ? iter->dump() : iter->get<std::string>();
}

const json& Section(const json& root, const char* name) {
  static const json kEmpty = json::object();
  auto iter = root.find(name);
  if (iter == root.end() || iter->is_null()) {
    return kEmpty;
  }
  if (!iter->is_object()) {
    throw std::invalid_argument(std::string("section '") + name + "' must be a mapping");
  }
  return *iter;
}

WriteConcernConfig ParseWriteConcernConfig(const json& json_obj) {
  WriteConcernConfig config;
  ReadField(json_obj, "w", config.w);
  ReadField(json_obj, "w_mode", config.w_mode);
  ReadField(json_obj, "wtimeout_ms", config.wtimeout_ms);
  ReadField(json_obj, "journal", config.journal);
  return config;
}

Expected<MongoConfig, Error> ParseMongoConfig(const json& json_obj) {
  MongoConfig config;
  ReadField(json_obj, "servers", config.servers);
  ReadField(json_obj, "database", config.database);
  ReadField(json_obj, "app_name", config.app_name);
  ReadField(json_obj, "connect_timeout_ms", config.connect_timeout_ms);
  ReadField(json_obj, "server_selection_timeout_ms", config.server_selection_timeout_ms);
  config.write_concern = ParseWriteConcernConfig(Section(json_obj, "write_concern"));

  std::string read_preference;
  ReadField(json_obj, "read_preference", read_preference);
  if (!read_preference.empty()) {
    auto mode = mongo::ParseReadMode(read_preference);
    if (!mode) {
      return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, mode.error().message(), "mongo.read_preference"));
    }
    config.read_mode = *mode;
  }

  return config;
}

QueryConfig ParseQueryConfig(const json& json_obj) {
  QueryConfig config;
  ReadField(json_obj, "default_limit", config.default_limit);
  ReadField(json_obj, "default_sort", config.default_sort);
  return config;
}

LoggingConfig ParseLoggingConfig(const json& json_obj) {
  LoggingConfig config;
  ReadField(json_obj, "level", config.level);
  ReadField(json_obj, "file", config.file);
  ReadField(json_obj, "format", config.format);
  return config;
}

Expected<void, Error> ValidateConfig(const Config& config) {
  if (config.mongo.servers.empty()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigMissingRequired, "mongo.servers must not be empty", "mongo.servers"));
  }
  if (config.mongo.connect_timeout_ms < 0 || config.mongo.server_selection_timeout_ms < 0) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "Timeouts must be non-negative", "mongo"));
  }
  if (config.mongo.write_concern.w < 0 || config.mongo.write_concern.wtimeout_ms < 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigInvalidValue, "Write concern values must be non-negative", "mongo.write_concern"));
  }
  if (config.query.default_sort.empty()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigInvalidValue, "query.default_sort must not be empty", "query.default_sort"));
  }

  const auto& level = config.logging.level;
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue,
                                    "Unknown logging level: '" + level + "' (expected debug, info, warn or error)",
                                    "logging.level"));
  }
  if (config.logging.format != "json" && config.logging.format != "text") {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue,
                                    "Unknown logging format: '" + config.logging.format + "' (expected json or text)",
                                    "logging.format"));
  }

  return {};
}

Expected<Config, Error> ParseConfigFromJson(const json& root, const std::string& path) {
  if (!root.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Top level must be a mapping", path));
  }

  Config config;
  try {
    auto mongo_config = ParseMongoConfig(Section(root, "mongo"));
    if (!mongo_config) {
      return MakeUnexpected(mongo_config.error());
    }
    config.mongo = std::move(*mongo_config);
    config.query = ParseQueryConfig(Section(root, "query"));
    config.logging = ParseLoggingConfig(Section(root, "logging"));
  } catch (const json::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, e.what(), path));
  } catch (const std::invalid_argument& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, e.what(), path));
  }

  auto valid = ValidateConfig(config);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }
  return config;
}

void LogLoaded(const Config& config, const std::string& path) {
  spdlog::info("Configuration loaded successfully from {}", path);
  spdlog::info("  MongoDB: {}/{} (read preference: {})", mongokit::utils::RedactCredentials(config.mongo.servers),
               config.mongo.database, mongo::ReadModeToString(config.mongo.read_mode));
}

}  // namespace

Expected<Config, Error> LoadConfigJson(const std::string& path) {
  auto content = ReadFileToString(path);
  if (!content) {
    return MakeUnexpected(content.error());
  }

  json root;
  try {
    root = json::parse(*content);
  } catch (const json::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, std::string("JSON parse error: ") + e.what(), path));
  }

  auto config = ParseConfigFromJson(root, path);
  if (config) {
    LogLoaded(*config, path);
  }
  return config;
}

Expected<Config, Error> LoadConfigYaml(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, "Cannot open configuration file", path));
  }

  json root;
  try {
    root = YamlToJson(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    std::stringstream err_msg;
    err_msg << "YAML parse error: " << e.what();
    if (e.mark.line != -1) {
      err_msg << " (line " << (e.mark.line + 1) << ", column " << (e.mark.column + 1) << ")";
    }
    return MakeUnexpected(MakeError(ErrorCode::kConfigYamlError, err_msg.str(), path));
  }

  // An empty file is a valid configuration with every default applied
  if (root.is_null()) {
    root = json::object();
  }

  auto config = ParseConfigFromJson(root, path);
  if (config) {
    LogLoaded(*config, path);
  }
  return config;
}

Expected<Config, Error> LoadConfig(const std::string& path) {
  switch (DetectFileFormat(path)) {
    case FileFormat::kJson:
      spdlog::debug("Detected JSON format for config file: {}", path);
      return LoadConfigJson(path);

    case FileFormat::kYaml:
      spdlog::debug("Detected YAML format for config file: {}", path);
      return LoadConfigYaml(path);

    case FileFormat::kUnknown:
    default: {
      spdlog::debug("Unknown file format, trying YAML first: {}", path);
      auto yaml_config = LoadConfigYaml(path);
      if (yaml_config || yaml_config.error().code() != ErrorCode::kConfigYamlError) {
        return yaml_config;
      }
      spdlog::debug("YAML parsing failed, trying JSON: {}", path);
      return LoadConfigJson(path);
    }
  }
}

}  // namespace mongokit::config
