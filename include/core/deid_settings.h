/**
 * deid - Run settings
 *
 * Priority order: CLI args > Environment variables > Defaults
 *
 * Environment:
 *   DEID_LANGUAGE    en | da
 *   DEID_THRESHOLD   similarity threshold in [0, 1]
 *   DEID_LOG_LEVEL   debug | info | warn | error
 *   DEID_LOG_FILE    append log lines to this file
 */

#ifndef DEID_SETTINGS_H_
#define DEID_SETTINGS_H_

#include <string>
#include <vector>

#include "ai/deid_recognizer.h"
#include "core/deid_result.h"
#include "util/logger.h"

#define DEID_DEFAULT_CONFIG "__temp.yaml"
#define DEID_DEFAULT_THRESHOLD 0.85f
#define DEID_OUTPUT_SUFFIX "_anon"

namespace Deid {

enum class Command {
  NONE,
  EXTRACT,
  ANONYMIZE,
  HELP,
  VERSION
};

struct DeidSettings {
  Command command = Command::NONE;
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  std::string config_path;
  bool config_given = false;
  std::string mapping_path;
  Language language = Language::EN;
  float threshold = DEID_DEFAULT_THRESHOLD;
  bool save_config = false;
  bool detect = true;
  DeidLogger::Level log_level = DeidLogger::WARN;
  std::string log_file;
};

/**
 * Apply DEID_* environment variables on top of the current values.
 *
 * @return INVALID_PARAMETER naming the variable with a bad value
 */
DeidResult ApplyEnvironment(DeidSettings* settings);

/**
 * Parse the command line on top of the current values.
 *
 *   deid extract|ex   [-c CONFIG] [-l LANG] [-t THRESHOLD] [--mapping FILE] [-v] INPUT...
 *   deid anonymize|an -c CONFIG [-o OUTPUT]... [-l LANG] [--save-config]
 *                     [--no-detect] [--mapping FILE] [-v] INPUT...
 *
 * @return INVALID_PARAMETER on usage errors
 */
DeidResult ParseCommandLine(int argc, const char* const* argv, DeidSettings* settings);

// Fill defaults that depend on the command (config path, output paths)
DeidResult FinalizeSettings(DeidSettings* settings);

// "<stem>_anon<ext>" next to the input
std::string DefaultOutputPath(const std::string& input);

}  // namespace Deid

#endif  // DEID_SETTINGS_H_
