/**
 * deid - Configuration Store
 *
 * Loads and saves the entity configuration as YAML or JSON.
 *
 *   names:
 *     - id: <PERSON_1>
 *       variants: ["John Doe", "Jon Doe"]
 *   numbers:
 *     - id: <NUMBER_1>
 *       variants: ["1234567890"]
 *       pattern: '(?:1\s*2\s*3\s*4\s*5\s*6\s*7\s*8\s*9\s*0)'
 *   watermarks:
 *     names: 4
 *
 * Sections: names, emails, addresses, numbers, cpr (upper-case labels are
 * accepted as aliases). `watermarks` is optional and only written when an
 * id suffix above the highest existing one has been issued.
 */

#ifndef DEID_CONFIG_STORE_H_
#define DEID_CONFIG_STORE_H_

#include <string>

#include <nlohmann/json.hpp>

#include "core/deid_result.h"
#include "core/deid_types.h"

using json = nlohmann::json;

namespace Deid {

enum class ConfigFormat {
  UNKNOWN,
  JSON,
  YAML
};

class DeidConfigStore {
 public:
  /**
   * Detect configuration format from the file extension.
   *
   * @param path Path to the configuration file
   * @return JSON for .json, YAML for .yaml/.yml, UNKNOWN otherwise
   */
  static ConfigFormat DetectFormat(const std::string& path);

  /**
   * Load and validate a configuration file (format auto-detected; unknown
   * extensions are sniffed from the first character).
   *
   * @return FILE_NOT_FOUND, IO_ERROR, CONFIG_VALIDATION_ERROR or
   *         PATTERN_COMPILE_ERROR on failure
   */
  static DeidResult LoadFile(const std::string& path, Configuration* config);

  // Parse without validation
  static DeidResult LoadYaml(const std::string& text, Configuration* config);
  static DeidResult LoadJson(const std::string& text, Configuration* config);

  /**
   * Check ids are non-empty and unique, every group has non-empty variants
   * and every pattern compiles.
   */
  static DeidResult Validate(const Configuration& config);

  static DeidResult ToYaml(const Configuration& config, std::string* out);
  static DeidResult ToJson(const Configuration& config, std::string* out);

  // Serialize in the format of the path (YAML when unknown)
  static DeidResult SaveFile(const std::string& path, const Configuration& config);

  /**
   * Entity mapping: label -> { variant -> id }, what the engine substitutes.
   */
  static json MappingJson(const Configuration& config);
  static DeidResult SaveMapping(const std::string& path, const Configuration& config);

  // Whole-file helpers shared with the pipeline
  static DeidResult ReadText(const std::string& path, std::string* text);
  static DeidResult WriteText(const std::string& path, const std::string& text);

 private:
  // Watermark worth persisting: above every existing suffix of the kind
  static int PersistedWatermark(const Configuration& config, EntityKind kind);
};

}  // namespace Deid

#endif  // DEID_CONFIG_STORE_H_
