#include "core/deid_variant_clusterer.h"
#include "core/deid_pattern_matcher.h"
#include "ai/deid_text_similarity_scorer.h"
#include "util/logger.h"
#include <cctype>
#include <set>
#include <sstream>

namespace Deid {

DeidVariantClusterer::DeidVariantClusterer(const ClusterOptions& options)
    : options_(options) {
}

bool DeidVariantClusterer::IsValidName(const std::string& text) {
  static const std::set<std::string> blacklist = {
    "multiline", "phone", "account", "code", "street"
  };

  std::istringstream iss(text);
  std::string word;
  int count = 0;
  while (iss >> word) {
    count++;
    if (count > 3) return false;

    bool has_letter = false;
    std::string lower;
    for (char c : word) {
      unsigned char uc = static_cast<unsigned char>(c);
      // Non-ASCII bytes belong to letters such as æ, ø, å
      if (std::isalpha(uc) || uc >= 0x80) has_letter = true;
      lower += static_cast<char>(std::tolower(uc));
    }
    if (!has_letter || blacklist.count(lower) > 0) return false;
  }
  return count >= 1;
}

std::vector<Span> DeidVariantClusterer::DropContained(const std::vector<Span>& spans,
                                                      EntityKind kind) {
  std::vector<const Span*> bucket;
  for (const auto& span : spans) {
    if (span.kind == kind) bucket.push_back(&span);
  }

  std::vector<Span> kept;
  for (size_t i = 0; i < bucket.size(); i++) {
    bool duplicate = false;
    for (size_t j = 0; j < bucket.size() && !duplicate; j++) {
      if (i == j || !bucket[j]->Contains(*bucket[i])) continue;
      // Identical spans: keep the first occurrence only
      if (bucket[i]->Contains(*bucket[j])) {
        duplicate = j < i;
      } else {
        duplicate = true;
      }
    }
    if (!duplicate) kept.push_back(*bucket[i]);
  }
  return kept;
}

std::vector<EntityGroup> DeidVariantClusterer::Cluster(const std::vector<Span>& spans,
                                                       EntityKind kind) const {
  const TextSimilarityScorer* scorer = TextSimilarityScorer::GetInstance();
  const float threshold = options_.ThresholdFor(kind);

  std::vector<EntityGroup> clusters;
  for (const auto& span : DropContained(spans, kind)) {
    if (scorer->Normalize(span.text, kind).empty()) continue;
    if (kind == EntityKind::PERSON && !IsValidName(span.text)) {
      LOG_DEBUG("VariantClusterer", "Skipping invalid name '" + span.text + "'");
      continue;
    }

    int best_index = -1;
    float best_score = 0.0f;
    for (size_t i = 0; i < clusters.size(); i++) {
      float score = scorer->Score(span.text, clusters[i].variants.front(), kind);
      if (score + kScoreEpsilon >= threshold && score > best_score) {
        best_score = score;
        best_index = static_cast<int>(i);
      }
    }

    if (best_index >= 0) {
      clusters[best_index].AddVariant(span.text);
    } else {
      EntityGroup group;
      group.kind = kind;
      group.variants.push_back(span.text);
      clusters.push_back(std::move(group));
    }
  }

  if (IsNumericKind(kind)) {
    for (auto& group : clusters) {
      std::string pattern = DeidPatternMatcher::DerivePattern(group);
      if (!pattern.empty()) group.pattern = pattern;
    }
  }

  LOG_DEBUG("VariantClusterer", std::string(EntityKindToLabel(kind)) + ": " +
            std::to_string(clusters.size()) + " cluster(s)");
  return clusters;
}

GroupsByKind DeidVariantClusterer::ClusterAll(const std::vector<Span>& spans) const {
  GroupsByKind result;
  for (EntityKind kind : AllEntityKinds()) {
    std::vector<EntityGroup> groups = Cluster(spans, kind);
    if (!groups.empty()) {
      result[kind] = std::move(groups);
    }
  }
  return result;
}

}  // namespace Deid
