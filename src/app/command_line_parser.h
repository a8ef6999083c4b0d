/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef MONGOKIT_APP_COMMAND_LINE_PARSER_H_
#define MONGOKIT_APP_COMMAND_LINE_PARSER_H_

#include <iostream>
#include <optional>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::app {

using mongokit::utils::Error;
using mongokit::utils::Expected;

/**
 * @brief Parsed command-line arguments
 */
struct CommandLineArgs {
  std::string config_file;
  bool config_test_mode = false;
  bool ping = false;
  std::optional<std::string> id;     ///< Hex ObjectId to decode
  std::optional<std::string> limit;  ///< Raw limit value to resolve
  std::optional<std::string> sort;   ///< Raw sort value to resolve
  bool show_help = false;
  bool show_version = false;

  /**
   * @brief True when at least one of --ping, --id, --limit, --sort was given
   */
  [[nodiscard]] bool HasAction() const { return ping || id || limit || sort; }
};

/**
 * @brief Command-line argument parser
 *
 * Supports both short (-c) and long (--config) option formats.
 */
class CommandLineParser {
 public:
  /**
   * @brief Parse command line arguments
   * @param argc Argument count
   * @param argv Argument values
   * @return Expected with parsed arguments or error
   *
   * Supported options:
   * - -c, --config <file>: Configuration file path
   * - -t, --config-test: Print the loaded configuration and exit
   * - --ping: Connect to MongoDB and report reachability
   * - --id <hex>: Decode an ObjectId
   * - --limit <raw>: Resolve a limit value
   * - --sort <raw>: Resolve a sort value
   * - -h, --help: Show help message
   * - -v, --version: Show version information
   *
   * @note Help and version flags take precedence
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  static void PrintHelp(const char* program_name, std::ostream& out = std::cout);

  static void PrintVersion(std::ostream& out = std::cout);

 private:
  CommandLineParser() = default;
};

}  // namespace mongokit::app

#endif  // MONGOKIT_APP_COMMAND_LINE_PARSER_H_
