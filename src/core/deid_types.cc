#include "core/deid_types.h"
#include <algorithm>
#include <cctype>

namespace Deid {

const std::vector<EntityKind>& AllEntityKinds() {
  static const std::vector<EntityKind> kinds = {
    EntityKind::PERSON,
    EntityKind::EMAIL,
    EntityKind::ADDRESS,
    EntityKind::PHONE_NUMBER,
    EntityKind::CPR_NUMBER
  };
  return kinds;
}

const char* EntityKindToLabel(EntityKind kind) {
  switch (kind) {
    case EntityKind::PERSON: return "PERSON";
    case EntityKind::EMAIL: return "EMAIL";
    case EntityKind::ADDRESS: return "ADDRESS";
    case EntityKind::PHONE_NUMBER: return "PHONE_NUMBER";
    case EntityKind::CPR_NUMBER: return "CPR_NUMBER";
    default: return "UNKNOWN";
  }
}

const char* EntityKindToSection(EntityKind kind) {
  switch (kind) {
    case EntityKind::PERSON: return "names";
    case EntityKind::EMAIL: return "emails";
    case EntityKind::ADDRESS: return "addresses";
    case EntityKind::PHONE_NUMBER: return "numbers";
    case EntityKind::CPR_NUMBER: return "cpr";
    default: return "unknown";
  }
}

const char* EntityKindToIdStem(EntityKind kind) {
  switch (kind) {
    case EntityKind::PERSON: return "PERSON";
    case EntityKind::EMAIL: return "EMAIL";
    case EntityKind::ADDRESS: return "ADDRESS";
    case EntityKind::PHONE_NUMBER: return "NUMBER";
    case EntityKind::CPR_NUMBER: return "CPR";
    default: return "UNKNOWN";
  }
}

bool ParseEntityLabel(const std::string& label, EntityKind* kind) {
  static const std::map<std::string, EntityKind> labels = {
    {"PERSON", EntityKind::PERSON},
    {"EMAIL", EntityKind::EMAIL},
    {"EMAIL_ADDRESS", EntityKind::EMAIL},
    {"ADDRESS", EntityKind::ADDRESS},
    {"LOCATION", EntityKind::ADDRESS},
    {"PHONE_NUMBER", EntityKind::PHONE_NUMBER},
    {"NUMBER_PATTERN", EntityKind::PHONE_NUMBER},
    {"NUMBER", EntityKind::PHONE_NUMBER},
    {"CPR_NUMBER", EntityKind::CPR_NUMBER},
    {"CPR", EntityKind::CPR_NUMBER},
  };
  auto it = labels.find(label);
  if (it == labels.end()) return false;
  *kind = it->second;
  return true;
}

bool ParseEntitySection(const std::string& section, EntityKind* kind) {
  for (EntityKind k : AllEntityKinds()) {
    if (section == EntityKindToSection(k)) {
      *kind = k;
      return true;
    }
  }
  return ParseEntityLabel(section, kind);
}

bool IsNumericKind(EntityKind kind) {
  return kind == EntityKind::PHONE_NUMBER || kind == EntityKind::CPR_NUMBER;
}

std::string FormatGroupId(EntityKind kind, int suffix) {
  return std::string("<") + EntityKindToIdStem(kind) + "_" + std::to_string(suffix) + ">";
}

int ParseGroupSuffix(EntityKind kind, const std::string& id) {
  const std::string head = std::string("<") + EntityKindToIdStem(kind) + "_";
  if (id.size() <= head.size() + 1 || id.compare(0, head.size(), head) != 0 ||
      id.back() != '>') {
    return -1;
  }
  const std::string digits = id.substr(head.size(), id.size() - head.size() - 1);
  if (digits.empty() || digits.size() > 9) return -1;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
  }
  return std::stoi(digits);
}

bool EntityGroup::HasVariant(const std::string& text) const {
  return std::find(variants.begin(), variants.end(), text) != variants.end();
}

bool EntityGroup::AddVariant(const std::string& text) {
  if (text.empty() || HasVariant(text)) return false;
  variants.push_back(text);
  return true;
}

const std::vector<EntityGroup>& Configuration::Groups(EntityKind kind) const {
  static const std::vector<EntityGroup> empty;
  auto it = sections_.find(kind);
  return it == sections_.end() ? empty : it->second;
}

EntityGroup* Configuration::FindById(const std::string& id) {
  for (auto& [kind, groups] : sections_) {
    for (auto& group : groups) {
      if (group.id == id) return &group;
    }
  }
  return nullptr;
}

const EntityGroup* Configuration::FindById(const std::string& id) const {
  for (const auto& [kind, groups] : sections_) {
    for (const auto& group : groups) {
      if (group.id == id) return &group;
    }
  }
  return nullptr;
}

EntityGroup& Configuration::AddGroup(const EntityGroup& group) {
  auto& groups = sections_[group.kind];
  groups.push_back(group);
  int suffix = ParseGroupSuffix(group.kind, group.id);
  if (suffix > Watermark(group.kind)) {
    watermarks_[group.kind] = suffix;
  }
  return groups.back();
}

int Configuration::Watermark(EntityKind kind) const {
  auto it = watermarks_.find(kind);
  return it == watermarks_.end() ? 0 : it->second;
}

void Configuration::SetWatermark(EntityKind kind, int value) {
  if (value <= 0) {
    watermarks_.erase(kind);
  } else {
    watermarks_[kind] = value;
  }
}

int Configuration::NextSuffix(EntityKind kind) const {
  int highest = Watermark(kind);
  for (const auto& group : Groups(kind)) {
    highest = std::max(highest, ParseGroupSuffix(kind, group.id));
  }
  return highest + 1;
}

size_t Configuration::TotalGroups() const {
  size_t total = 0;
  for (const auto& [kind, groups] : sections_) {
    total += groups.size();
  }
  return total;
}

size_t Configuration::TotalVariants() const {
  size_t total = 0;
  for (const auto& [kind, groups] : sections_) {
    for (const auto& group : groups) {
      total += group.variants.size();
    }
  }
  return total;
}

bool Configuration::operator==(const Configuration& other) const {
  for (EntityKind kind : AllEntityKinds()) {
    if (Groups(kind) != other.Groups(kind)) return false;
    if (NextSuffix(kind) != other.NextSuffix(kind)) return false;
  }
  return true;
}

}  // namespace Deid
