/**
 * @file application.h
 * @brief Main application class
 */

#ifndef MONGOKIT_APP_APPLICATION_H_
#define MONGOKIT_APP_APPLICATION_H_

#include <iostream>
#include <memory>
#include <string>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::app {

using mongokit::utils::Error;
using mongokit::utils::Expected;

/**
 * @brief Main application class
 *
 * Parses arguments, loads configuration, applies logging and runs the
 * requested actions (--id, --limit, --sort, --ping) in that order.
 * --config-test prints the configuration and skips the actions.
 *
 * Usage:
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << app.error().to_string() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Create application from command-line arguments
   *
   * Help and version requests produce an application without configuration.
   * Otherwise the configuration file is loaded here.
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application() = default;

  // Non-copyable, non-movable
  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run the application
   * @param out Stream for results
   * @param err Stream for error reports
   * @return Exit code (0 = success, 1 = any action failed)
   */
  int Run(std::ostream& out = std::cout, std::ostream& err = std::cerr);

 private:
  Application(std::string program_name, CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  int HandleSpecialModes(std::ostream& out) const;

  bool RunIdAction(std::ostream& out, std::ostream& err) const;
  void RunLimitAction(std::ostream& out) const;
  void RunSortAction(std::ostream& out) const;
  bool RunPingAction(std::ostream& out, std::ostream& err) const;

  std::string program_name_;
  CommandLineArgs args_;
  std::unique_ptr<ConfigurationManager> config_manager_;
};

}  // namespace mongokit::app

#endif  // MONGOKIT_APP_APPLICATION_H_
