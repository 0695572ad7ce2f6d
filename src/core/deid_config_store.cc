#include "core/deid_config_store.h"
#include "core/deid_pattern_matcher.h"
#include "ai/deid_text_similarity_scorer.h"
#include "util/logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <sys/stat.h>

#include <yaml-cpp/yaml.h>

namespace Deid {

namespace {

std::string ToLower(const std::string& text) {
  std::string lower;
  for (char c : text) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lower;
}

std::string ItemName(const std::string& section, size_t index) {
  return section + "[" + std::to_string(index) + "]";
}

// Folds a watermark into the parsed configuration; never lowers it
void ApplyWatermark(Configuration* config, EntityKind kind, int value) {
  config->SetWatermark(kind, std::max(config->Watermark(kind), value));
}

DeidResult ParseYamlGroup(const YAML::Node& node, EntityKind kind, const std::string& name,
                          EntityGroup* group) {
  if (!node.IsMap()) {
    return DeidResult::ConfigValidationError(name, "expected a mapping with id and variants");
  }

  group->kind = kind;
  for (const auto& field : node) {
    const std::string key = field.first.as<std::string>();
    const YAML::Node& value = field.second;

    if (key == "id") {
      group->id = value.IsNull() ? "" : value.as<std::string>();
    } else if (key == "variants") {
      if (value.IsNull()) continue;
      if (value.IsScalar()) {
        group->AddVariant(value.as<std::string>());
        continue;
      }
      if (!value.IsSequence()) {
        return DeidResult::ConfigValidationError(name, "variants must be a list");
      }
      for (const auto& variant : value) {
        if (!variant.IsScalar()) {
          return DeidResult::ConfigValidationError(name, "variants must be strings");
        }
        std::string text = variant.as<std::string>();
        if (text.empty()) {
          return DeidResult::ConfigValidationError(group->id.empty() ? name : group->id,
                                                   "empty variant");
        }
        group->AddVariant(text);
      }
    } else if (key == "pattern") {
      if (!value.IsNull() && !value.as<std::string>().empty()) {
        group->pattern = value.as<std::string>();
      }
    } else {
      return DeidResult::ConfigValidationError(name, "unknown key '" + key + "'");
    }
  }
  return DeidResult::Success();
}

DeidResult ParseJsonGroup(const json& node, EntityKind kind, const std::string& name,
                          EntityGroup* group) {
  if (!node.is_object()) {
    return DeidResult::ConfigValidationError(name, "expected an object with id and variants");
  }

  group->kind = kind;
  for (auto it = node.begin(); it != node.end(); ++it) {
    const std::string& key = it.key();
    const json& value = it.value();

    if (key == "id") {
      if (!value.is_null() && !value.is_string()) {
        return DeidResult::ConfigValidationError(name, "id must be a string");
      }
      group->id = value.is_string() ? value.get<std::string>() : "";
    } else if (key == "variants") {
      if (value.is_null()) continue;
      if (!value.is_array()) {
        return DeidResult::ConfigValidationError(name, "variants must be a list");
      }
      for (const auto& variant : value) {
        if (!variant.is_string()) {
          return DeidResult::ConfigValidationError(name, "variants must be strings");
        }
        std::string text = variant.get<std::string>();
        if (text.empty()) {
          return DeidResult::ConfigValidationError(group->id.empty() ? name : group->id,
                                                   "empty variant");
        }
        group->AddVariant(text);
      }
    } else if (key == "pattern") {
      if (value.is_null()) continue;
      if (!value.is_string()) {
        return DeidResult::ConfigValidationError(name, "pattern must be a string");
      }
      if (!value.get<std::string>().empty()) {
        group->pattern = value.get<std::string>();
      }
    } else {
      return DeidResult::ConfigValidationError(name, "unknown key '" + key + "'");
    }
  }
  return DeidResult::Success();
}

}  // namespace

ConfigFormat DeidConfigStore::DetectFormat(const std::string& path) {
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos) return ConfigFormat::UNKNOWN;

  const std::string ext = ToLower(path.substr(dot));
  if (ext == ".json") return ConfigFormat::JSON;
  if (ext == ".yaml" || ext == ".yml") return ConfigFormat::YAML;
  return ConfigFormat::UNKNOWN;
}

DeidResult DeidConfigStore::ReadText(const std::string& path, std::string* text) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return DeidResult::FileNotFound(path);
  }
  if (S_ISDIR(st.st_mode)) {
    return DeidResult::IoError(path, "is a directory");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return DeidResult::IoError(path, "cannot open for reading");
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return DeidResult::IoError(path, "read failed");
  }
  *text = buffer.str();
  return DeidResult::Success();
}

DeidResult DeidConfigStore::WriteText(const std::string& path, const std::string& text) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return DeidResult::IoError(path, "cannot open for writing");
  }
  file << text;
  file.flush();
  if (!file.good()) {
    return DeidResult::IoError(path, "write failed");
  }
  return DeidResult::Success();
}

DeidResult DeidConfigStore::LoadYaml(const std::string& text, Configuration* config) {
  Configuration parsed;

  try {
    YAML::Node root = YAML::Load(text);
    if (root.IsNull()) {
      *config = parsed;
      return DeidResult::Success();
    }
    if (!root.IsMap()) {
      return DeidResult::ConfigValidationError("(root)", "expected a mapping of sections");
    }

    std::map<EntityKind, int> watermarks;
    for (const auto& entry : root) {
      const std::string key = entry.first.as<std::string>();
      const YAML::Node& value = entry.second;

      if (key == "watermarks") {
        if (value.IsNull()) continue;
        if (!value.IsMap()) {
          return DeidResult::ConfigValidationError(key, "expected a mapping of section to number");
        }
        for (const auto& mark : value) {
          EntityKind kind;
          const std::string section = mark.first.as<std::string>();
          if (!ParseEntitySection(section, &kind)) {
            return DeidResult::ConfigValidationError("watermarks." + section, "unknown section");
          }
          int n = mark.second.as<int>();
          if (n < 0) {
            return DeidResult::ConfigValidationError("watermarks." + section, "negative value");
          }
          watermarks[kind] = std::max(watermarks[kind], n);
        }
        continue;
      }

      EntityKind kind;
      if (!ParseEntitySection(key, &kind)) {
        return DeidResult::ConfigValidationError(key, "unknown section");
      }
      if (value.IsNull()) continue;
      if (!value.IsSequence()) {
        return DeidResult::ConfigValidationError(key, "expected a list of groups");
      }

      for (size_t i = 0; i < value.size(); i++) {
        EntityGroup group;
        DeidResult r = ParseYamlGroup(value[i], kind, ItemName(key, i), &group);
        if (!r.success) return r;
        parsed.AddGroup(group);
      }
    }

    for (const auto& [kind, n] : watermarks) {
      ApplyWatermark(&parsed, kind, n);
    }
  } catch (const YAML::Exception& e) {
    return DeidResult::ConfigValidationError("yaml", e.what());
  }

  *config = parsed;
  return DeidResult::Success();
}

DeidResult DeidConfigStore::LoadJson(const std::string& text, Configuration* config) {
  Configuration parsed;

  try {
    json root = json::parse(text);
    if (root.is_null()) {
      *config = parsed;
      return DeidResult::Success();
    }
    if (!root.is_object()) {
      return DeidResult::ConfigValidationError("(root)", "expected an object of sections");
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string& key = it.key();
      const json& value = it.value();

      if (key == "watermarks") {
        if (value.is_null()) continue;
        if (!value.is_object()) {
          return DeidResult::ConfigValidationError(key, "expected an object of section to number");
        }
        for (auto mark = value.begin(); mark != value.end(); ++mark) {
          EntityKind kind;
          if (!ParseEntitySection(mark.key(), &kind)) {
            return DeidResult::ConfigValidationError("watermarks." + mark.key(), "unknown section");
          }
          if (!mark.value().is_number_integer() || mark.value().get<int>() < 0) {
            return DeidResult::ConfigValidationError("watermarks." + mark.key(),
                                                     "expected a non-negative integer");
          }
          ApplyWatermark(&parsed, kind, mark.value().get<int>());
        }
        continue;
      }

      EntityKind kind;
      if (!ParseEntitySection(key, &kind)) {
        return DeidResult::ConfigValidationError(key, "unknown section");
      }
      if (value.is_null()) continue;
      if (!value.is_array()) {
        return DeidResult::ConfigValidationError(key, "expected a list of groups");
      }

      for (size_t i = 0; i < value.size(); i++) {
        EntityGroup group;
        DeidResult r = ParseJsonGroup(value[i], kind, ItemName(key, i), &group);
        if (!r.success) return r;
        parsed.AddGroup(group);
      }
    }
  } catch (const json::exception& e) {
    return DeidResult::ConfigValidationError("json", e.what());
  }

  *config = parsed;
  return DeidResult::Success();
}

DeidResult DeidConfigStore::Validate(const Configuration& config) {
  std::set<std::string> ids;

  for (EntityKind kind : AllEntityKinds()) {
    const std::string section = EntityKindToSection(kind);
    const auto& groups = config.Groups(kind);
    // Literal matching ignores case and whitespace, so these variants collide
    std::map<std::string, std::string> owners;
    for (size_t i = 0; i < groups.size(); i++) {
      const EntityGroup& group = groups[i];
      if (group.id.empty()) {
        return DeidResult::ConfigValidationError(ItemName(section, i), "missing id");
      }
      if (!ids.insert(group.id).second) {
        return DeidResult::ConfigValidationError(group.id, "duplicate id");
      }
      if (group.variants.empty()) {
        return DeidResult::ConfigValidationError(group.id, "group has no variants");
      }
      for (const auto& variant : group.variants) {
        if (variant.empty()) {
          return DeidResult::ConfigValidationError(group.id, "empty variant");
        }
        const std::string key = TextSimilarityScorer::NormalizeText(variant);
        auto owner = owners.emplace(key, group.id);
        if (!owner.second && owner.first->second != group.id) {
          return DeidResult::ConfigValidationError(
              group.id, "variant '" + variant + "' also belongs to " + owner.first->second);
        }
      }
      if (group.pattern) {
        std::regex compiled;
        DeidResult r = DeidPatternMatcher::CompileOne(group.id, *group.pattern, &compiled);
        if (!r.success) return r;
      }
    }
  }
  return DeidResult::Success();
}

DeidResult DeidConfigStore::LoadFile(const std::string& path, Configuration* config) {
  std::string text;
  DeidResult r = ReadText(path, &text);
  if (!r.success) return r;

  ConfigFormat format = DetectFormat(path);
  if (format == ConfigFormat::UNKNOWN) {
    size_t first = text.find_first_not_of(" \t\r\n");
    format = (first != std::string::npos && text[first] == '{') ? ConfigFormat::JSON
                                                               : ConfigFormat::YAML;
  }

  Configuration loaded;
  r = format == ConfigFormat::JSON ? LoadJson(text, &loaded) : LoadYaml(text, &loaded);
  if (r.success) r = Validate(loaded);
  if (!r.success) {
    r.InFile(path);
    LOG_ERROR("ConfigStore", r.ToString());
    return r;
  }

  *config = std::move(loaded);
  LOG_INFO("ConfigStore", "Loaded " + std::to_string(config->TotalGroups()) + " group(s) from " +
           path);
  return DeidResult::Success();
}

int DeidConfigStore::PersistedWatermark(const Configuration& config, EntityKind kind) {
  int highest = 0;
  for (const auto& group : config.Groups(kind)) {
    highest = std::max(highest, ParseGroupSuffix(kind, group.id));
  }
  int watermark = config.Watermark(kind);
  return watermark > highest ? watermark : 0;
}

DeidResult DeidConfigStore::ToYaml(const Configuration& config, std::string* out) {
  YAML::Emitter emitter;
  emitter << YAML::BeginMap;

  for (EntityKind kind : AllEntityKinds()) {
    const auto& groups = config.Groups(kind);
    emitter << YAML::Key << EntityKindToSection(kind) << YAML::Value;
    if (groups.empty()) {
      emitter << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
      continue;
    }

    emitter << YAML::BeginSeq;
    for (const auto& group : groups) {
      emitter << YAML::BeginMap;
      emitter << YAML::Key << "id" << YAML::Value << group.id;
      emitter << YAML::Key << "variants" << YAML::Value << YAML::BeginSeq;
      for (const auto& variant : group.variants) {
        emitter << YAML::DoubleQuoted << variant;
      }
      emitter << YAML::EndSeq;
      if (group.pattern) {
        emitter << YAML::Key << "pattern" << YAML::Value << YAML::SingleQuoted << *group.pattern;
      }
      emitter << YAML::EndMap;
    }
    emitter << YAML::EndSeq;
  }

  bool has_watermarks = false;
  for (EntityKind kind : AllEntityKinds()) {
    if (PersistedWatermark(config, kind) > 0) has_watermarks = true;
  }
  if (has_watermarks) {
    emitter << YAML::Key << "watermarks" << YAML::Value << YAML::BeginMap;
    for (EntityKind kind : AllEntityKinds()) {
      int watermark = PersistedWatermark(config, kind);
      if (watermark > 0) {
        emitter << YAML::Key << EntityKindToSection(kind) << YAML::Value << watermark;
      }
    }
    emitter << YAML::EndMap;
  }

  emitter << YAML::EndMap;

  if (!emitter.good()) {
    return DeidResult::Failure(DeidStatus::INTERNAL_ERROR,
                               "YAML emitter failed: " + emitter.GetLastError());
  }
  *out = std::string(emitter.c_str()) + "\n";
  return DeidResult::Success();
}

DeidResult DeidConfigStore::ToJson(const Configuration& config, std::string* out) {
  nlohmann::ordered_json root = nlohmann::ordered_json::object();

  for (EntityKind kind : AllEntityKinds()) {
    nlohmann::ordered_json section = nlohmann::ordered_json::array();
    for (const auto& group : config.Groups(kind)) {
      nlohmann::ordered_json item;
      item["id"] = group.id;
      item["variants"] = group.variants;
      if (group.pattern) item["pattern"] = *group.pattern;
      section.push_back(item);
    }
    root[EntityKindToSection(kind)] = section;
  }

  nlohmann::ordered_json watermarks = nlohmann::ordered_json::object();
  for (EntityKind kind : AllEntityKinds()) {
    int watermark = PersistedWatermark(config, kind);
    if (watermark > 0) watermarks[EntityKindToSection(kind)] = watermark;
  }
  if (!watermarks.empty()) root["watermarks"] = watermarks;

  try {
    *out = root.dump(2) + "\n";
  } catch (const json::exception& e) {
    return DeidResult::Failure(DeidStatus::INTERNAL_ERROR,
                               std::string("JSON serialization failed: ") + e.what());
  }
  return DeidResult::Success();
}

DeidResult DeidConfigStore::SaveFile(const std::string& path, const Configuration& config) {
  std::string text;
  DeidResult r = DetectFormat(path) == ConfigFormat::JSON ? ToJson(config, &text)
                                                          : ToYaml(config, &text);
  if (!r.success) return r.InFile(path);

  r = WriteText(path, text);
  if (!r.success) {
    LOG_ERROR("ConfigStore", r.ToString());
    return r;
  }
  LOG_INFO("ConfigStore", "Saved " + std::to_string(config.TotalGroups()) + " group(s) to " + path);
  return DeidResult::Success();
}

json DeidConfigStore::MappingJson(const Configuration& config) {
  json mapping = json::object();
  for (EntityKind kind : AllEntityKinds()) {
    const auto& groups = config.Groups(kind);
    if (groups.empty()) continue;

    json entries = json::object();
    for (const auto& group : groups) {
      for (const auto& variant : group.variants) {
        entries[variant] = group.id;
      }
    }
    mapping[EntityKindToLabel(kind)] = entries;
  }
  return mapping;
}

DeidResult DeidConfigStore::SaveMapping(const std::string& path, const Configuration& config) {
  std::string text;
  try {
    text = MappingJson(config).dump(2) + "\n";
  } catch (const json::exception& e) {
    return DeidResult::IoError(path, std::string("JSON serialization failed: ") + e.what());
  }
  return WriteText(path, text);
}

}  // namespace Deid
