#pragma once

#include <string>
#include <vector>

#include "core/deid_types.h"

/**
 * TextSimilarityScorer - fuzzy comparison of entity mentions.
 *
 * Mentions are first reduced to a normalized form (case-folded, whitespace
 * collapsed, kind-specific folding) and then compared with the normalized
 * indel ratio:
 *
 *   ratio(a, b) = 1 - indel_distance(a, b) / (|a| + |b|)
 *
 * where indel_distance counts insertions and deletions only (a substitution
 * costs 2). Scores are in [0, 1]; two empty strings score 1.
 */
class TextSimilarityScorer {
public:
  static TextSimilarityScorer* GetInstance();

  /**
   * Similarity of two raw mentions of the given kind, after normalization.
   */
  float Score(const std::string& a, const std::string& b, Deid::EntityKind kind) const;

  /**
   * Best score of a mention against a list of raw variants.
   */
  float ScoreBestMatch(const std::string& text, const std::vector<std::string>& variants,
                       Deid::EntityKind kind) const;

  // Ratio on already-normalized strings
  float IndelRatio(const std::string& s1, const std::string& s2) const;
  int IndelDistance(const std::string& s1, const std::string& s2) const;

  // Kind-dispatching normalization used for clustering and lookup
  std::string Normalize(const std::string& text, Deid::EntityKind kind) const;

  // Lower-case ASCII, collapse whitespace runs to one space, trim
  static std::string NormalizeText(const std::string& text);

  // NormalizeText + Danish letter folding (æ->ae, ø->oe, å->aa) and no hyphens
  static std::string NormalizeName(const std::string& text);

  // Digits only
  static std::string NormalizeNumber(const std::string& text);

private:
  TextSimilarityScorer() = default;

  // Length of the longest common subsequence
  int LcsLength(const std::string& s1, const std::string& s2) const;
};
