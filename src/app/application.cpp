/**
 * @file application.cpp
 * @brief Main application class implementation
 */

#include "app/application.h"

#include <bsoncxx/json.hpp>
#include <spdlog/spdlog.h>

#include <utility>

#include "mongo/session.h"
#include "oid/object_id_codec.h"
#include "query/query_params.h"
#include "version.h"

namespace mongokit::app {

using mongokit::utils::ErrorCode;
using mongokit::utils::MakeError;
using mongokit::utils::MakeUnexpected;

namespace {
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kNotSpecialMode = -1;
}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(int argc, char* argv[]) {
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return MakeUnexpected(args_result.error());
  }

  CommandLineArgs args = std::move(*args_result);
  std::string program_name = argc > 0 ? argv[0] : "mongokit";  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  // Help and version need no configuration
  if (args.show_help || args.show_version) {
    return std::unique_ptr<Application>(new Application(std::move(program_name), std::move(args), nullptr));
  }

  if (!args.config_test_mode && !args.HasAction()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "No action requested. Use --config-test, --ping, --id, --limit or --sort"));
  }

  auto config_mgr = ConfigurationManager::Create(args.config_file);
  if (!config_mgr) {
    return MakeUnexpected(config_mgr.error());
  }

  return std::unique_ptr<Application>(
      new Application(std::move(program_name), std::move(args), std::move(*config_mgr)));
}

Application::Application(std::string program_name, CommandLineArgs args,
                         std::unique_ptr<ConfigurationManager> config_mgr)
    : program_name_(std::move(program_name)), args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

int Application::Run(std::ostream& out, std::ostream& err) {
  int special_exit_code = HandleSpecialModes(out);
  if (special_exit_code != kNotSpecialMode) {
    return special_exit_code;
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    err << logging_result.error().to_string() << "\n";
    return kExitFailure;
  }
  spdlog::debug("{} loaded configuration from {}", Version::FullString(), config_manager_->GetConfigFilePath());

  if (args_.config_test_mode) {
    return config_manager_->PrintConfigTest(out);
  }

  // Every requested action runs; any failure makes the exit code non-zero
  bool ok = true;
  if (args_.id) {
    ok = RunIdAction(out, err) && ok;
  }
  if (args_.limit) {
    RunLimitAction(out);
  }
  if (args_.sort) {
    RunSortAction(out);
  }
  if (args_.ping) {
    ok = RunPingAction(out, err) && ok;
  }
  return ok ? kExitSuccess : kExitFailure;
}

int Application::HandleSpecialModes(std::ostream& out) const {
  if (args_.show_help) {
    CommandLineParser::PrintHelp(program_name_.c_str(), out);
    return kExitSuccess;
  }
  if (args_.show_version) {
    CommandLineParser::PrintVersion(out);
    return kExitSuccess;
  }
  return kNotSpecialMode;
}

bool Application::RunIdAction(std::ostream& out, std::ostream& err) const {
  auto decoded = oid::DecodeObjectId(*args_.id);
  if (!decoded) {
    err << "id: " << decoded.error().to_string() << "\n";
    return false;
  }
  out << "id: " << oid::EncodeObjectId(*decoded) << "\n";
  return true;
}

void Application::RunLimitAction(std::ostream& out) const {
  out << "limit: " << query::ResolveLimit(args_.limit, config_manager_->GetQueryDefaults()) << "\n";
}

void Application::RunSortAction(std::ostream& out) const {
  auto specs = query::ResolveSort(args_.sort, config_manager_->GetQueryDefaults());
  out << "sort: " << bsoncxx::to_json(query::BuildSortDocument(specs).view()) << "\n";
}

bool Application::RunPingAction(std::ostream& out, std::ostream& err) const {
  mongo::Session session(config_manager_->GetConfig().mongo);
  auto connected = session.Connect("ping");
  if (!connected) {
    err << "ping: " << connected.error().to_string() << "\n";
    return false;
  }
  out << "ping: ok (" << session.DatabaseName() << ")\n";
  return true;
}

}  // namespace mongokit::app
