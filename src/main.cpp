#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "command_line.hpp"
#include "config_manager.hpp"
#include "console_reporter.hpp"
#include "httpload_exceptions.hpp"
#include "json_report.hpp"
#include "load_config.hpp"
#include "load_runner.hpp"
#include "logger.hpp"
#include "request_corpus.hpp"
#include "transport_pool.hpp"

using namespace httpload;

int main(int argc, char *argv[]) {
  const std::string programName = argc > 0 ? argv[0] : "httpload";

  CommandLineOptions options;
  try {
    options = parseCommandLine(argc, argv);
  } catch (const ValidationException &e) {
    std::cerr << "Error: " << e.getMessage() << "\n\n";
    printUsage(std::cerr, programName);
    return 1;
  }

  if (options.showHelp) {
    printUsage(std::cout, programName);
    return 0;
  }

  auto &config = ConfigManager::getInstance();
  if (!options.configPath.empty() && !config.loadConfig(options.configPath)) {
    std::cerr << "Failed to load configuration from " << options.configPath
              << std::endl;
    return 1;
  }
  options.applyTo(config);

  auto &logger = Logger::getInstance();
  logger.configure(config.getLoggingConfig());

  LoadTestConfig loadConfig = LoadTestConfig::fromConfig(config);
  auto validation = loadConfig.validate();
  for (const auto &warning : validation.warnings) {
    LOG_WARN("Main", warning);
  }
  if (!validation.isValid) {
    for (const auto &error : validation.errors) {
      std::cerr << "Error: " << error << std::endl;
    }
    return 1;
  }

  RequestCorpus corpus;
  if (!loadConfig.corpusFile.empty()) {
    corpus = RequestCorpus::loadFromFile(loadConfig.corpusFile);
  }

  try {
    TransportPool transports(loadConfig.transport);

    ConsoleReporter console(std::cout, loadConfig.report.chartHeight);
    CompositeReportSink sinks;
    sinks.add(console);

    std::unique_ptr<JsonReportSink> jsonSink;
    if (!loadConfig.report.jsonFile.empty()) {
      jsonSink = std::make_unique<JsonReportSink>(loadConfig.report.jsonFile);
      sinks.add(*jsonSink);
    }

    ConsoleProgressBar progressBar(std::cerr);
    NullProgressIndicator noProgress;
    ProgressIndicator &progress =
        loadConfig.report.showProgress
            ? static_cast<ProgressIndicator &>(progressBar)
            : static_cast<ProgressIndicator &>(noProgress);

    LoadRunner runner(loadConfig, corpus, transports, sinks, progress);
    runner.run();
  } catch (...) {
    int exitCode = reportFatalError(std::current_exception(), std::cerr);
    logger.flush();
    return exitCode;
  }

  LogMetrics logStats = logger.getMetrics();
  if (logStats.errorCount > 0 || logStats.droppedMessages > 0) {
    LOG_WARN("Main", "Run completed with " +
                         std::to_string(logStats.errorCount.load()) +
                         " errors logged and " +
                         std::to_string(logStats.droppedMessages.load()) +
                         " log messages dropped");
  }

  logger.flush();
  return 0;
}
