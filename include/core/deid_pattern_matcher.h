#ifndef DEID_PATTERN_MATCHER_H_
#define DEID_PATTERN_MATCHER_H_

#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "core/deid_result.h"
#include "core/deid_types.h"

namespace Deid {

/**
 * A group pattern compiled once per configuration.
 */
struct CompiledPattern {
  EntityKind kind = EntityKind::PHONE_NUMBER;
  size_t group_index = 0;  // index into Configuration::Groups(kind)
  std::string id;
  std::string source;
  std::regex regex;
};

/**
 * A match attributed to a configuration group.
 */
struct GroupMatch {
  Span span;
  size_t group_index = 0;
  bool literal = false;  // true for a variant match, false for a pattern match
};

/**
 * DeidPatternMatcher - regex and literal matching of configured groups.
 *
 * Pattern matches are digit-anchored: a match whose first (last) byte is a
 * digit is rejected when the byte before (after) it is also a digit, so a
 * group never matches inside a longer number.
 *
 * Literal matches are ASCII case-insensitive, treat every whitespace run of
 * the variant as "one or more whitespace characters" (line-wrapped mentions)
 * and are word-boundary anchored.
 */
class DeidPatternMatcher {
 public:
  /**
   * Compile every group pattern of a configuration.
   *
   * @return PATTERN_COMPILE_ERROR naming the first group whose pattern fails
   */
  static DeidResult Compile(const Configuration& config, std::vector<CompiledPattern>* out);

  // Compile a single pattern (same flags as Compile)
  static DeidResult CompileOne(const std::string& id, const std::string& pattern,
                               std::regex* out);

  /**
   * Run compiled patterns over text[begin, end). Offsets are absolute.
   */
  static std::vector<GroupMatch> Match(const std::string& text,
                                       const std::vector<CompiledPattern>& patterns,
                                       size_t begin = 0,
                                       size_t end = std::string::npos);

  // Same as Match, reduced to labelled spans
  static std::vector<Span> MatchSpans(const std::string& text,
                                      const std::vector<CompiledPattern>& patterns);

  // True if the whole text is matched by the pattern
  static bool FullMatch(const std::string& text, const CompiledPattern& pattern);

  /**
   * All non-overlapping literal occurrences of a variant in text[begin, end),
   * left to right, as [start, end) pairs.
   */
  static std::vector<std::pair<size_t, size_t>> FindLiteral(const std::string& text,
                                                            const std::string& variant,
                                                            size_t begin = 0,
                                                            size_t end = std::string::npos);

  /**
   * Pattern reproducing the separator style of a numeric group's variants,
   * tolerant of whitespace (including newlines) between digits. Empty for
   * groups without digits.
   */
  static std::string DerivePattern(const EntityGroup& group);

  static std::string EscapeRegex(const std::string& text);

 private:
  static bool IsWordByte(unsigned char c);
  static bool IsDigitAnchored(const std::string& text, size_t start, size_t end);
  static bool IsWordAnchored(const std::string& text, size_t start, size_t end);
  static bool MatchLiteralAt(const std::string& text, size_t pos, size_t limit,
                             const std::string& variant, size_t* match_end);
};

}  // namespace Deid

#endif  // DEID_PATTERN_MATCHER_H_
