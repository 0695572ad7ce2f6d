#ifndef DEID_TYPES_H_
#define DEID_TYPES_H_

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Deid {

/**
 * Entity categories. Each kind owns one configuration section and one id
 * template; the enum order is the section order of a configuration file.
 */
enum class EntityKind {
  PERSON,
  EMAIL,
  ADDRESS,
  PHONE_NUMBER,
  CPR_NUMBER
};

// All kinds in section order
const std::vector<EntityKind>& AllEntityKinds();

// "PERSON", "EMAIL", ...
const char* EntityKindToLabel(EntityKind kind);

// "names", "emails", "addresses", "numbers", "cpr"
const char* EntityKindToSection(EntityKind kind);

// Id stem: "PERSON", "EMAIL", "ADDRESS", "NUMBER", "CPR"
const char* EntityKindToIdStem(EntityKind kind);

// Accepts canonical labels and recognizer aliases (EMAIL_ADDRESS, LOCATION,
// NUMBER_PATTERN, NUMBER, CPR). Case-sensitive.
bool ParseEntityLabel(const std::string& label, EntityKind* kind);

// Accepts section names and upper-case labels as section keys
bool ParseEntitySection(const std::string& section, EntityKind* kind);

// Numeric kinds compare digit strings and carry derived patterns
bool IsNumericKind(EntityKind kind);

// "<PERSON_3>"
std::string FormatGroupId(EntityKind kind, int suffix);

// Numeric suffix of an id following the kind's template, -1 otherwise
int ParseGroupSuffix(EntityKind kind, const std::string& id);

/**
 * A detected mention. Byte offsets into the document named by file_id.
 */
struct Span {
  std::string file_id;
  size_t start = 0;
  size_t end = 0;
  EntityKind kind = EntityKind::PERSON;
  std::string text;

  size_t length() const { return end - start; }
  bool Contains(const Span& other) const {
    return file_id == other.file_id && start <= other.start && other.end <= end;
  }
};

/**
 * A canonical identity: stable id, verbatim variants, optional regex.
 */
struct EntityGroup {
  std::string id;
  EntityKind kind = EntityKind::PERSON;
  std::vector<std::string> variants;
  std::optional<std::string> pattern;

  bool HasVariant(const std::string& text) const;

  // Append unless already present verbatim. Returns true if appended.
  bool AddVariant(const std::string& text);

  bool operator==(const EntityGroup& other) const {
    return id == other.id && kind == other.kind && variants == other.variants &&
           pattern == other.pattern;
  }
  bool operator!=(const EntityGroup& other) const { return !(*this == other); }
};

using GroupsByKind = std::map<EntityKind, std::vector<EntityGroup>>;

/**
 * Ordered mapping kind -> groups, plus the per-kind id watermark (highest
 * suffix ever issued). Single source of truth for replacement.
 */
class Configuration {
 public:
  Configuration() = default;

  std::vector<EntityGroup>& Groups(EntityKind kind) { return sections_[kind]; }
  const std::vector<EntityGroup>& Groups(EntityKind kind) const;

  EntityGroup* FindById(const std::string& id);
  const EntityGroup* FindById(const std::string& id) const;

  // Appends a group; raises the kind's watermark to the group's suffix
  EntityGroup& AddGroup(const EntityGroup& group);

  int Watermark(EntityKind kind) const;
  void SetWatermark(EntityKind kind, int value);

  // max(existing suffixes, watermark) + 1
  int NextSuffix(EntityKind kind) const;

  size_t TotalGroups() const;
  size_t TotalVariants() const;
  bool Empty() const { return TotalGroups() == 0; }

  bool operator==(const Configuration& other) const;
  bool operator!=(const Configuration& other) const { return !(*this == other); }

 private:
  std::map<EntityKind, std::vector<EntityGroup>> sections_;
  std::map<EntityKind, int> watermarks_;
};

}  // namespace Deid

#endif  // DEID_TYPES_H_
