#ifndef DEID_CONFIG_RECONCILER_H_
#define DEID_CONFIG_RECONCILER_H_

#include <string>

#include "core/deid_result.h"
#include "core/deid_types.h"
#include "core/deid_variant_clusterer.h"

namespace Deid {

/**
 * Counters describing what a reconciliation changed.
 */
struct ReconcileStats {
  int groups_added = 0;
  int groups_extended = 0;
  int variants_added = 0;

  void Add(const ReconcileStats& other) {
    groups_added += other.groups_added;
    groups_extended += other.groups_extended;
    variants_added += other.variants_added;
  }

  bool Changed() const { return groups_added > 0 || variants_added > 0; }
};

/**
 * DeidConfigReconciler - merges freshly clustered groups into a configuration.
 *
 * For each fresh group, in kind order then group order:
 *   1. an existing group with the same id (same kind) absorbs it;
 *   2. otherwise the existing group with the best variant-pair similarity
 *      absorbs it if the score reaches the kind's threshold;
 *   3. otherwise it is appended under the next free id of its kind.
 *
 * Assigned ids never change and suffixes are never re-issued (the
 * configuration watermark outlives deleted groups). The result is a pure
 * function of the inputs.
 */
class DeidConfigReconciler {
 public:
  explicit DeidConfigReconciler(const ClusterOptions& options = ClusterOptions());

  /**
   * Reconcile fresh groups into a copy of `existing`.
   *
   * @param existing Current configuration, left untouched
   * @param fresh Groups from the clusterer (ids usually empty)
   * @param out Receives the merged configuration on success
   * @param stats Optional change counters
   * @return CONFIG_VALIDATION_ERROR if a fresh group has no variants
   */
  DeidResult Reconcile(const Configuration& existing, const GroupsByKind& fresh,
                       Configuration* out, ReconcileStats* stats = nullptr) const;

  /**
   * Inline assignment of a single mention during anonymization.
   *
   * @param config Configuration to extend in place
   * @param kind Kind of the mention
   * @param text Verbatim mention
   * @param id Receives the id of the owning group
   * @param stats Optional change counters (a new group or variant)
   */
  DeidResult Assign(Configuration* config, EntityKind kind, const std::string& text,
                    std::string* id, ReconcileStats* stats = nullptr) const;

  const ClusterOptions& options() const { return options_; }

 private:
  // Best-scoring group of the kind at or above threshold, -1 if none
  int FindBestGroup(const Configuration& config, const EntityGroup& fresh) const;

  void MergeInto(EntityGroup* target, const EntityGroup& fresh, ReconcileStats* stats) const;

  DeidResult ReconcileGroup(Configuration* config, const EntityGroup& fresh,
                            std::string* id, ReconcileStats* stats) const;

  ClusterOptions options_;
};

}  // namespace Deid

#endif  // DEID_CONFIG_RECONCILER_H_
