#include "command_line.hpp"
#include "httpload_exceptions.hpp"
#include "logger.hpp"
#include <ostream>
#include <stdexcept>

namespace httpload {

namespace {

enum class ValueKind { String, Integer, NonNegativeInteger, Ratio };

struct FlagSpec {
  const char *shortName;
  const char *longName;
  const char *configKey;
  ValueKind kind;
};

const FlagSpec kFlags[] = {
    {nullptr, "--url", "target.url", ValueKind::String},
    {"-X", "--method", "target.method", ValueKind::String},
    {nullptr, "--bodyfile", "target.corpus_file", ValueKind::String},
    {"-c", "--concurrency", "load.concurrency", ValueKind::Integer},
    {"-n", "--requests", "load.total_requests", ValueKind::NonNegativeInteger},
    {nullptr, "--keepalive-ratio", "load.keepalive_ratio", ValueKind::Ratio},
    {nullptr, "--interval-ms", "load.report_interval_ms", ValueKind::Integer},
    {nullptr, "--seed", "load.seed", ValueKind::NonNegativeInteger},
    {nullptr, "--timeout-ms", "transport.request_timeout_ms",
     ValueKind::Integer},
    {nullptr, "--report", "report.json_file", ValueKind::String},
    {nullptr, "--log-level", "logging.level", ValueKind::String},
};

const FlagSpec *findFlag(const std::string &arg) {
  for (const auto &flag : kFlags) {
    if ((flag.shortName && arg == flag.shortName) || arg == flag.longName) {
      return &flag;
    }
  }
  return nullptr;
}

void checkValue(const std::string &flag, const std::string &value,
                ValueKind kind) {
  try {
    size_t consumed = 0;
    switch (kind) {
    case ValueKind::String:
      return;
    case ValueKind::Integer: {
      std::stoi(value, &consumed);
      break;
    }
    case ValueKind::NonNegativeInteger: {
      int parsed = std::stoi(value, &consumed);
      if (parsed < 0) {
        throw ValidationException(ErrorCode::INVALID_RANGE,
                                  "Invalid value for " + flag +
                                      ". Must be a non-negative integer",
                                  flag, value);
      }
      break;
    }
    case ValueKind::Ratio: {
      double parsed = std::stod(value, &consumed);
      if (parsed < 0.0 || parsed > 1.0) {
        throw ValidationException(ErrorCode::INVALID_RANGE,
                                  "Invalid value for " + flag +
                                      ". Must be between 0.0 and 1.0",
                                  flag, value);
      }
      break;
    }
    }
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
  } catch (const std::invalid_argument &) {
    throw ValidationException(ErrorCode::INVALID_FORMAT,
                              "Invalid value for " + flag + ": '" + value + "'",
                              flag, value);
  } catch (const std::out_of_range &) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Value for " + flag + " is out of range", flag,
                              value);
  }
}

} // namespace

void CommandLineOptions::applyTo(ConfigManager &config) const {
  for (const auto &[key, value] : overrides) {
    config.setValue(key, value);
  }
}

CommandLineOptions parseCommandLine(const std::vector<std::string> &args) {
  CommandLineOptions options;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.showHelp = true;
      continue;
    }
    if (arg == "--no-progress") {
      options.overrides.emplace_back("report.progress", "false");
      continue;
    }

    bool isConfig = arg == "--config";
    const FlagSpec *flag = isConfig ? nullptr : findFlag(arg);
    if (!isConfig && !flag) {
      throw ValidationException(ErrorCode::INVALID_INPUT,
                                "Unknown argument: " + arg, "argument", arg);
    }
    if (i + 1 >= args.size()) {
      throw ValidationException(ErrorCode::MISSING_FIELD,
                                "Missing value for " + arg, arg);
    }

    const std::string &value = args[++i];
    if (isConfig) {
      options.configPath = value;
      continue;
    }

    checkValue(arg, value, flag->kind);
    options.overrides.emplace_back(flag->configKey, value);
  }

  return options;
}

CommandLineOptions parseCommandLine(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parseCommandLine(args);
}

void printUsage(std::ostream &out, const std::string &programName) {
  out << "Usage: " << programName << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --config <file>           JSON configuration file\n"
      << "  --url <url>               Target URL (default http://localhost:8080)\n"
      << "  -c, --concurrency <n>     Number of concurrent workers (default 10)\n"
      << "  -n, --requests <n>        Total number of requests (default 100)\n"
      << "  --keepalive-ratio <r>     Share of requests using keep-alive, 0.0-1.0 "
         "(default 0.7)\n"
      << "  -X, --method <method>     HTTP method (default POST)\n"
      << "  --bodyfile <file>         JSON file with request bodies or "
         "[url, body] pairs\n"
      << "  --interval-ms <ms>        Live report interval (default 1000)\n"
      << "  --timeout-ms <ms>         Per-request timeout (default 10000)\n"
      << "  --seed <n>                Seed for reproducible request selection\n"
      << "  --report <file>           Write the final report as JSON\n"
      << "  --log-level <level>       DEBUG, INFO, WARN, ERROR or FATAL\n"
      << "  --no-progress             Disable the progress bar\n"
      << "  -h, --help                Show this help\n";
}

int reportFatalError(std::exception_ptr error, std::ostream &err) {
  try {
    std::rethrow_exception(error);
  } catch (const ValidationException &e) {
    LOG_ERROR("Main", e.toLogString());
    err << "Error: " << e.getMessage() << std::endl;
  } catch (const LoadTestException &e) {
    LOG_FATAL("Main", e.toLogString());
    err << "Fatal: " << e.getMessage() << std::endl;
  } catch (const std::exception &e) {
    LOG_FATAL("Main", std::string("Unhandled exception: ") + e.what());
    err << "Fatal: " << e.what() << std::endl;
  } catch (...) {
    LOG_FATAL("Main", "Unhandled exception of unknown type");
    err << "Fatal: unknown error" << std::endl;
  }
  return 1;
}

} // namespace httpload
