#ifndef DEID_VARIANT_CLUSTERER_H_
#define DEID_VARIANT_CLUSTERER_H_

#include <map>
#include <string>
#include <vector>

#include "core/deid_types.h"

namespace Deid {

/**
 * Similarity thresholds used by clustering and reconciliation.
 */
struct ClusterOptions {
  float threshold = 0.85f;
  std::map<EntityKind, float> kind_thresholds = {{EntityKind::EMAIL, 1.0f}};

  float ThresholdFor(EntityKind kind) const {
    auto it = kind_thresholds.find(kind);
    return it == kind_thresholds.end() ? threshold : it->second;
  }
};

// Scores within this distance of the threshold count as reaching it
constexpr float kScoreEpsilon = 1e-5f;

/**
 * DeidVariantClusterer - groups raw mentions of one kind into canonical groups.
 *
 * Processing is in collection order. Each mention is compared with the first
 * variant of every cluster built so far; the best score at or above the
 * threshold wins (earliest cluster on ties) and the mention is appended
 * verbatim. Otherwise it starts a new cluster.
 *
 * Returned groups carry no id. Numeric groups carry a derived pattern.
 */
class DeidVariantClusterer {
 public:
  explicit DeidVariantClusterer(const ClusterOptions& options = ClusterOptions());

  std::vector<EntityGroup> Cluster(const std::vector<Span>& spans, EntityKind kind) const;

  // Cluster every kind present in spans
  GroupsByKind ClusterAll(const std::vector<Span>& spans) const;

  /**
   * Drop spans of `kind` contained in another span of the same kind and file.
   * Order is preserved; of two identical spans the first is kept.
   */
  static std::vector<Span> DropContained(const std::vector<Span>& spans, EntityKind kind);

  /**
   * PERSON mentions: 1-3 words, each with a letter, none of them a
   * blacklisted token.
   */
  static bool IsValidName(const std::string& text);

  const ClusterOptions& options() const { return options_; }

 private:
  ClusterOptions options_;
};

}  // namespace Deid

#endif  // DEID_VARIANT_CLUSTERER_H_
