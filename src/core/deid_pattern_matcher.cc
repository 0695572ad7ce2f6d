#include "core/deid_pattern_matcher.h"
#include "util/logger.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace Deid {

namespace {

bool IsDigitByte(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsSpaceByte(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string Trim(const std::string& text) {
  size_t start = 0;
  while (start < text.size() && IsSpaceByte(text[start])) start++;
  size_t end = text.size();
  while (end > start && IsSpaceByte(text[end - 1])) end--;
  return text.substr(start, end - start);
}

}  // namespace

bool DeidPatternMatcher::IsWordByte(unsigned char c) {
  return std::isalnum(c) || c >= 0x80;
}

bool DeidPatternMatcher::IsDigitAnchored(const std::string& text, size_t start, size_t end) {
  if (IsDigitByte(text[start]) && start > 0 && IsDigitByte(text[start - 1])) {
    return false;
  }
  if (IsDigitByte(text[end - 1]) && end < text.size() && IsDigitByte(text[end])) {
    return false;
  }
  return true;
}

bool DeidPatternMatcher::IsWordAnchored(const std::string& text, size_t start, size_t end) {
  unsigned char first = static_cast<unsigned char>(text[start]);
  unsigned char last = static_cast<unsigned char>(text[end - 1]);
  if (IsWordByte(first) && start > 0 &&
      IsWordByte(static_cast<unsigned char>(text[start - 1]))) {
    return false;
  }
  if (IsWordByte(last) && end < text.size() &&
      IsWordByte(static_cast<unsigned char>(text[end]))) {
    return false;
  }
  return true;
}

std::string DeidPatternMatcher::EscapeRegex(const std::string& text) {
  static const std::string specials = "\\^$.|?*+()[]{}";
  std::string result;
  result.reserve(text.size() * 2);
  for (char c : text) {
    if (specials.find(c) != std::string::npos) {
      result += '\\';
    }
    result += c;
  }
  return result;
}

DeidResult DeidPatternMatcher::CompileOne(const std::string& id, const std::string& pattern,
                                          std::regex* out) {
  if (pattern.empty()) {
    return DeidResult::PatternCompileError(id, pattern, "pattern is empty");
  }
  try {
    *out = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
  } catch (const std::regex_error& e) {
    return DeidResult::PatternCompileError(id, pattern, e.what());
  }
  return DeidResult::Success();
}

DeidResult DeidPatternMatcher::Compile(const Configuration& config,
                                       std::vector<CompiledPattern>* out) {
  out->clear();
  for (EntityKind kind : AllEntityKinds()) {
    const auto& groups = config.Groups(kind);
    for (size_t i = 0; i < groups.size(); i++) {
      if (!groups[i].pattern) continue;

      CompiledPattern compiled;
      compiled.kind = kind;
      compiled.group_index = i;
      compiled.id = groups[i].id;
      compiled.source = *groups[i].pattern;
      DeidResult r = CompileOne(compiled.id, compiled.source, &compiled.regex);
      if (!r.success) {
        LOG_ERROR("PatternMatcher", r.message);
        return r;
      }
      out->push_back(std::move(compiled));
    }
  }
  LOG_DEBUG("PatternMatcher", "Compiled " + std::to_string(out->size()) + " pattern(s)");
  return DeidResult::Success();
}

std::vector<GroupMatch> DeidPatternMatcher::Match(const std::string& text,
                                                  const std::vector<CompiledPattern>& patterns,
                                                  size_t begin, size_t end) {
  std::vector<GroupMatch> matches;
  end = std::min(end, text.size());
  if (begin >= end) return matches;

  for (const auto& pattern : patterns) {
    size_t pos = begin;
    while (pos < end) {
      std::smatch m;
      auto flags = pos > 0 ? std::regex_constants::match_prev_avail
                           : std::regex_constants::match_default;
      if (!std::regex_search(text.cbegin() + pos, text.cbegin() + end, m, pattern.regex, flags)) {
        break;
      }

      size_t start = static_cast<size_t>(m[0].first - text.cbegin());
      size_t stop = static_cast<size_t>(m[0].second - text.cbegin());
      if (stop == start) {
        pos = start + 1;
        continue;
      }
      if (!IsDigitAnchored(text, start, stop)) {
        pos = start + 1;
        continue;
      }

      GroupMatch match;
      match.span.start = start;
      match.span.end = stop;
      match.span.kind = pattern.kind;
      match.span.text = text.substr(start, stop - start);
      match.group_index = pattern.group_index;
      match.literal = false;
      matches.push_back(std::move(match));
      pos = stop;
    }
  }

  return matches;
}

std::vector<Span> DeidPatternMatcher::MatchSpans(const std::string& text,
                                                 const std::vector<CompiledPattern>& patterns) {
  std::vector<Span> spans;
  for (auto& match : Match(text, patterns)) {
    spans.push_back(std::move(match.span));
  }
  return spans;
}

bool DeidPatternMatcher::FullMatch(const std::string& text, const CompiledPattern& pattern) {
  return std::regex_match(text, pattern.regex);
}

bool DeidPatternMatcher::MatchLiteralAt(const std::string& text, size_t pos, size_t limit,
                                        const std::string& variant, size_t* match_end) {
  size_t t = pos;
  size_t v = 0;
  while (v < variant.size()) {
    if (IsSpaceByte(variant[v])) {
      while (v < variant.size() && IsSpaceByte(variant[v])) v++;
      if (t >= limit || !IsSpaceByte(text[t])) return false;
      while (t < limit && IsSpaceByte(text[t])) t++;
      continue;
    }
    if (t >= limit) return false;
    if (std::tolower(static_cast<unsigned char>(text[t])) !=
        std::tolower(static_cast<unsigned char>(variant[v]))) {
      return false;
    }
    t++;
    v++;
  }
  *match_end = t;
  return true;
}

std::vector<std::pair<size_t, size_t>> DeidPatternMatcher::FindLiteral(const std::string& text,
                                                                       const std::string& variant,
                                                                       size_t begin, size_t end) {
  std::vector<std::pair<size_t, size_t>> found;
  const std::string needle = Trim(variant);
  end = std::min(end, text.size());
  if (needle.empty() || begin >= end) return found;

  const int first = std::tolower(static_cast<unsigned char>(needle[0]));
  size_t pos = begin;
  while (pos < end) {
    if (std::tolower(static_cast<unsigned char>(text[pos])) != first) {
      pos++;
      continue;
    }
    size_t stop = 0;
    if (MatchLiteralAt(text, pos, end, needle, &stop) && IsWordAnchored(text, pos, stop)) {
      found.emplace_back(pos, stop);
      pos = stop;
    } else {
      pos++;
    }
  }
  return found;
}

std::string DeidPatternMatcher::DerivePattern(const EntityGroup& group) {
  std::set<std::string> seen;
  std::vector<std::string> alternatives;

  for (const auto& raw : group.variants) {
    const std::string variant = Trim(raw);
    std::string alt;
    bool prev_digit = false;
    size_t i = 0;
    while (i < variant.size()) {
      if (IsDigitByte(variant[i])) {
        if (prev_digit) alt += "\\s*";
        alt += variant[i];
        prev_digit = true;
        i++;
        continue;
      }

      // Separator run
      size_t j = i;
      std::string visible;
      while (j < variant.size() && !IsDigitByte(variant[j])) {
        if (!IsSpaceByte(variant[j])) visible += variant[j];
        j++;
      }
      const bool leading = alt.empty();
      const bool trailing = j >= variant.size();
      if (visible.empty()) {
        if (!leading && !trailing) alt += "\\s+";
      } else {
        if (!leading) alt += "\\s*";
        alt += EscapeRegex(visible);
        if (!trailing) alt += "\\s*";
      }
      prev_digit = false;
      i = j;
    }

    const bool has_digit = std::any_of(alt.begin(), alt.end(), IsDigitByte);
    if (has_digit && seen.insert(alt).second) {
      alternatives.push_back(alt);
    }
  }

  if (alternatives.empty()) return "";

  std::stable_sort(alternatives.begin(), alternatives.end(),
                   [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

  std::string pattern = "(?:";
  for (size_t k = 0; k < alternatives.size(); k++) {
    if (k > 0) pattern += "|";
    pattern += alternatives[k];
  }
  pattern += ")";
  return pattern;
}

}  // namespace Deid
