#include "core/deid_settings.h"
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace Deid {

namespace {

// Accepts [0, 1] or a percentage in (1, 100]
bool ParseThreshold(const std::string& text, float* value) {
  if (text.empty()) return false;
  char* end = nullptr;
  float parsed = std::strtof(text.c_str(), &end);
  if (end == nullptr || *end != '\0' || !std::isfinite(parsed)) return false;
  if (parsed > 1.0f && parsed <= 100.0f) parsed /= 100.0f;
  if (parsed < 0.0f || parsed > 1.0f) return false;
  *value = parsed;
  return true;
}

}  // namespace

DeidResult ApplyEnvironment(DeidSettings* settings) {
  if (const char* env = std::getenv("DEID_LANGUAGE")) {
    if (!ParseLanguage(env, &settings->language)) {
      return DeidResult::InvalidParameter("DEID_LANGUAGE", std::string("unknown language '") +
                                          env + "' (expected en or da)");
    }
  }
  if (const char* env = std::getenv("DEID_THRESHOLD")) {
    if (!ParseThreshold(env, &settings->threshold)) {
      return DeidResult::InvalidParameter("DEID_THRESHOLD", std::string("'") + env +
                                          "' is not a number in [0, 1]");
    }
  }
  if (const char* env = std::getenv("DEID_LOG_LEVEL")) {
    if (!DeidLogger::Logger::ParseLevel(env, &settings->log_level)) {
      return DeidResult::InvalidParameter("DEID_LOG_LEVEL", std::string("unknown level '") +
                                          env + "'");
    }
  }
  if (const char* env = std::getenv("DEID_LOG_FILE")) {
    settings->log_file = env;
  }
  return DeidResult::Success();
}

DeidResult ParseCommandLine(int argc, const char* const* argv, DeidSettings* settings) {
  if (argc < 2) {
    return DeidResult::InvalidParameter("command", "missing command");
  }

  const std::string command = argv[1];
  if (command == "extract" || command == "ex") {
    settings->command = Command::EXTRACT;
  } else if (command == "anonymize" || command == "an") {
    settings->command = Command::ANONYMIZE;
  } else if (command == "help" || command == "-h" || command == "--help") {
    settings->command = Command::HELP;
    return DeidResult::Success();
  } else if (command == "version" || command == "--version") {
    settings->command = Command::VERSION;
    return DeidResult::Success();
  } else {
    return DeidResult::InvalidParameter("command", "unknown command '" + command + "'");
  }

  bool options_done = false;
  for (int i = 2; i < argc; i++) {
    const std::string arg = argv[i];

    if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
      settings->inputs.push_back(arg);
      continue;
    }
    if (arg == "--") {
      options_done = true;
      continue;
    }

    // Options taking a value
    auto value = [&](std::string* out) -> bool {
      if (i + 1 >= argc) return false;
      *out = argv[++i];
      return true;
    };

    std::string v;
    if (arg == "-c" || arg == "--config") {
      if (!value(&v)) return DeidResult::InvalidParameter(arg, "missing value");
      settings->config_path = v;
      settings->config_given = true;
    } else if (arg == "-o" || arg == "--output") {
      if (!value(&v)) return DeidResult::InvalidParameter(arg, "missing value");
      settings->outputs.push_back(v);
    } else if (arg == "-l" || arg == "--language") {
      if (!value(&v)) return DeidResult::InvalidParameter(arg, "missing value");
      if (!ParseLanguage(v, &settings->language)) {
        return DeidResult::InvalidParameter(arg, "unknown language '" + v + "' (expected en or da)");
      }
    } else if (arg == "-t" || arg == "--threshold") {
      if (!value(&v)) return DeidResult::InvalidParameter(arg, "missing value");
      if (!ParseThreshold(v, &settings->threshold)) {
        return DeidResult::InvalidParameter(arg, "'" + v + "' is not a number in [0, 1]");
      }
    } else if (arg == "--mapping") {
      if (!value(&v)) return DeidResult::InvalidParameter(arg, "missing value");
      settings->mapping_path = v;
    } else if (arg == "--log-file") {
      if (!value(&v)) return DeidResult::InvalidParameter(arg, "missing value");
      settings->log_file = v;
    } else if (arg == "--save-config") {
      settings->save_config = true;
    } else if (arg == "--no-detect") {
      settings->detect = false;
    } else if (arg == "-v" || arg == "--verbose") {
      settings->log_level = settings->log_level == DeidLogger::WARN ? DeidLogger::INFO
                                                                     : DeidLogger::DEBUG;
    } else {
      return DeidResult::InvalidParameter(arg, "unknown option");
    }
  }

  return DeidResult::Success();
}

std::string DefaultOutputPath(const std::string& input) {
  size_t slash = input.find_last_of('/');
  size_t dot = input.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
      dot == (slash == std::string::npos ? 0 : slash + 1)) {
    return input + DEID_OUTPUT_SUFFIX;
  }
  return input.substr(0, dot) + DEID_OUTPUT_SUFFIX + input.substr(dot);
}

DeidResult FinalizeSettings(DeidSettings* settings) {
  if (settings->command != Command::EXTRACT && settings->command != Command::ANONYMIZE) {
    return DeidResult::Success();
  }
  if (settings->inputs.empty()) {
    return DeidResult::InvalidParameter("INPUT", "no input files");
  }

  if (settings->command == Command::EXTRACT) {
    if (!settings->outputs.empty()) {
      return DeidResult::InvalidParameter("-o", "extract writes only the configuration (use -c)");
    }
    if (settings->config_path.empty()) settings->config_path = DEID_DEFAULT_CONFIG;
    return DeidResult::Success();
  }

  if (!settings->config_given || settings->config_path.empty()) {
    return DeidResult::InvalidParameter("-c", "anonymize requires a configuration file");
  }
  if (settings->outputs.empty()) {
    for (const auto& input : settings->inputs) {
      settings->outputs.push_back(DefaultOutputPath(input));
    }
  } else if (settings->outputs.size() != settings->inputs.size()) {
    return DeidResult::InvalidParameter(
        "-o", "got " + std::to_string(settings->outputs.size()) + " output(s) for " +
              std::to_string(settings->inputs.size()) + " input(s)");
  }
  return DeidResult::Success();
}

}  // namespace Deid
