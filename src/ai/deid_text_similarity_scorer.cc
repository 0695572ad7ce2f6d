#include "ai/deid_text_similarity_scorer.h"
#include <algorithm>
#include <cctype>

TextSimilarityScorer* TextSimilarityScorer::GetInstance() {
  static TextSimilarityScorer instance;
  return &instance;
}

std::string TextSimilarityScorer::NormalizeText(const std::string& text) {
  std::string result;
  result.reserve(text.length());

  for (char c : text) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      if (!result.empty() && result.back() != ' ') {
        result += ' ';
      }
    } else {
      result += static_cast<char>(std::tolower(uc));
    }
  }

  while (!result.empty() && result.back() == ' ') {
    result.pop_back();
  }

  return result;
}

std::string TextSimilarityScorer::NormalizeName(const std::string& text) {
  // UTF-8 sequences for the Danish letters, upper and lower case
  static const std::vector<std::pair<std::string, std::string>> folds = {
    {"\xC3\xA6", "ae"}, {"\xC3\x86", "ae"},  // æ Æ
    {"\xC3\xB8", "oe"}, {"\xC3\x98", "oe"},  // ø Ø
    {"\xC3\xA5", "aa"}, {"\xC3\x85", "aa"},  // å Å
  };

  std::string folded;
  folded.reserve(text.length());
  size_t i = 0;
  while (i < text.length()) {
    bool matched = false;
    for (const auto& [from, to] : folds) {
      if (text.compare(i, from.length(), from) == 0) {
        folded += to;
        i += from.length();
        matched = true;
        break;
      }
    }
    if (matched) continue;
    if (text[i] != '-') {
      folded += text[i];
    }
    i++;
  }

  return NormalizeText(folded);
}

std::string TextSimilarityScorer::NormalizeNumber(const std::string& text) {
  std::string digits;
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits += c;
    }
  }
  return digits;
}

std::string TextSimilarityScorer::Normalize(const std::string& text, Deid::EntityKind kind) const {
  if (Deid::IsNumericKind(kind)) {
    return NormalizeNumber(text);
  }
  if (kind == Deid::EntityKind::PERSON) {
    return NormalizeName(text);
  }
  return NormalizeText(text);
}

int TextSimilarityScorer::LcsLength(const std::string& s1, const std::string& s2) const {
  const size_t m = s1.length();
  const size_t n = s2.length();
  if (m == 0 || n == 0) return 0;

  // Single-row dynamic programming
  std::vector<int> prev_row(n + 1, 0);
  std::vector<int> curr_row(n + 1, 0);

  for (size_t i = 1; i <= m; i++) {
    curr_row[0] = 0;
    for (size_t j = 1; j <= n; j++) {
      if (s1[i-1] == s2[j-1]) {
        curr_row[j] = prev_row[j-1] + 1;
      } else {
        curr_row[j] = std::max(prev_row[j], curr_row[j-1]);
      }
    }
    std::swap(prev_row, curr_row);
  }

  return prev_row[n];
}

int TextSimilarityScorer::IndelDistance(const std::string& s1, const std::string& s2) const {
  return static_cast<int>(s1.length() + s2.length()) - 2 * LcsLength(s1, s2);
}

float TextSimilarityScorer::IndelRatio(const std::string& s1, const std::string& s2) const {
  const size_t total = s1.length() + s2.length();
  if (total == 0) return 1.0f;

  return 1.0f - static_cast<float>(IndelDistance(s1, s2)) / static_cast<float>(total);
}

float TextSimilarityScorer::Score(const std::string& a, const std::string& b,
                                  Deid::EntityKind kind) const {
  std::string norm_a = Normalize(a, kind);
  std::string norm_b = Normalize(b, kind);

  if (norm_a.empty() || norm_b.empty()) {
    return norm_a == norm_b ? 1.0f : 0.0f;
  }
  if (norm_a == norm_b) return 1.0f;

  return IndelRatio(norm_a, norm_b);
}

float TextSimilarityScorer::ScoreBestMatch(const std::string& text,
                                           const std::vector<std::string>& variants,
                                           Deid::EntityKind kind) const {
  float best = 0.0f;
  for (const auto& variant : variants) {
    best = std::max(best, Score(text, variant, kind));
    if (best >= 1.0f) break;
  }
  return best;
}
