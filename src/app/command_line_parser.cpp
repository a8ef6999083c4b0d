/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include "version.h"

namespace mongokit::app {

using mongokit::utils::ErrorCode;
using mongokit::utils::MakeError;
using mongokit::utils::MakeUnexpected;

namespace {

bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid argument count (argc < 1)"));
  }

  // Handle help and version flags first (early exit)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (MatchesOption(arg, "-h", "--help")) {
      args.show_help = true;
      return args;
    }
    if (MatchesOption(arg, "-v", "--version")) {
      args.show_version = true;
      return args;
    }
  }

  if (argc < 2) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No arguments provided. Use --help for usage."));
  }

  // Options taking a value; an empty string is a legitimate value for --limit/--sort/--id
  auto take_value = [&](int& i, const std::string& option) -> Expected<std::string, Error> {
    if (i + 1 >= argc) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, option + " requires an argument"));
    }
    return std::string(argv[++i]);
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (MatchesOption(arg, "-c", "--config")) {
      auto value = take_value(i, "--config");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.config_file = *value;
    } else if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
    } else if (arg == "--ping") {
      args.ping = true;
    } else if (arg == "--id") {
      auto value = take_value(i, "--id");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.id = *value;
    } else if (arg == "--limit") {
      auto value = take_value(i, "--limit");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.limit = *value;
    } else if (arg == "--sort") {
      auto value = take_value(i, "--sort");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.sort = *value;
    } else if (!arg.empty() && arg[0] == '-') {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown option: " + arg));
    } else {
      // Positional argument: config file without -c flag
      if (args.config_file.empty()) {
        args.config_file = arg;
      } else {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                        "Unexpected positional argument: " + arg + " (config file already specified)"));
      }
    }
  }

  if (args.config_file.empty()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "Configuration file path required. Use --help for usage."));
  }

  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return args;
}

void CommandLineParser::PrintHelp(const char* program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [OPTIONS] <config.yaml|config.json>\n";
  out << "       " << program_name << " -c <config.yaml|config.json> [OPTIONS]\n";
  out << "\n";
  out << "Options:\n";
  out << "  -c, --config <file>            Configuration file path\n";
  out << "  -t, --config-test              Test configuration file and exit\n";
  out << "      --ping                     Connect to MongoDB and report reachability\n";
  out << "      --id <hex>                 Decode a 24-character hexadecimal ObjectId\n";
  out << "      --limit <value>            Resolve a limit parameter value\n";
  out << "      --sort <value>             Resolve a sort parameter value (e.g. birthday,-username)\n";
  out << "  -h, --help                     Show this help message\n";
  out << "  -v, --version                  Show version information\n";
  out << "\n";
  out << "Configuration file format (auto-detected):\n";
  out << "  - YAML (.yaml, .yml)\n";
  out << "  - JSON (.json)\n";
}

void CommandLineParser::PrintVersion(std::ostream& out) {
  out << Version::FullString() << "\n";
}

}  // namespace mongokit::app
