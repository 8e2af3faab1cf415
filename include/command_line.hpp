#pragma once

#include "config_manager.hpp"
#include <exception>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace httpload {

// Parsed command line: an optional configuration file plus key overrides
struct CommandLineOptions {
  std::string configPath;
  std::vector<std::pair<std::string, std::string>> overrides;
  bool showHelp = false;

  void applyTo(ConfigManager &config) const;
};

/**
 * @brief Parse command line arguments (without the program name).
 *
 * Numeric flags are checked here so that a typo fails before any network
 * activity.
 *
 * @throws ValidationException on unknown flags, missing values or values
 * that do not parse.
 */
CommandLineOptions parseCommandLine(const std::vector<std::string> &args);
CommandLineOptions parseCommandLine(int argc, char *argv[]);

void printUsage(std::ostream &out, const std::string &programName);

/**
 * @brief Log a failure that ended the run and describe it on @p err.
 *
 * @p error must not be null.
 * @return the process exit code (always 1).
 */
int reportFatalError(std::exception_ptr error, std::ostream &err);

} // namespace httpload
