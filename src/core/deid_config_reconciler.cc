#include "core/deid_config_reconciler.h"
#include "core/deid_pattern_matcher.h"
#include "ai/deid_text_similarity_scorer.h"
#include "util/logger.h"
#include <algorithm>

namespace Deid {

namespace {

// `fresh` without the variants another group of its kind already holds
EntityGroup WithoutForeignVariants(const Configuration& config, const EntityGroup& fresh,
                                   const EntityGroup* target) {
  EntityGroup kept = fresh;
  kept.variants.clear();
  for (const auto& variant : fresh.variants) {
    const std::string key = TextSimilarityScorer::NormalizeText(variant);
    const EntityGroup* owner = nullptr;
    for (const auto& group : config.Groups(fresh.kind)) {
      if (&group == target) continue;
      for (const auto& other : group.variants) {
        if (TextSimilarityScorer::NormalizeText(other) == key) {
          owner = &group;
          break;
        }
      }
      if (owner) break;
    }
    if (owner) {
      LOG_DEBUG("ConfigReconciler", "'" + variant + "' stays with " + owner->id);
      continue;
    }
    kept.variants.push_back(variant);
  }
  return kept;
}

}  // namespace

DeidConfigReconciler::DeidConfigReconciler(const ClusterOptions& options)
    : options_(options) {
}

int DeidConfigReconciler::FindBestGroup(const Configuration& config,
                                        const EntityGroup& fresh) const {
  const TextSimilarityScorer* scorer = TextSimilarityScorer::GetInstance();
  const float threshold = options_.ThresholdFor(fresh.kind);
  const auto& groups = config.Groups(fresh.kind);

  int best_index = -1;
  float best_score = 0.0f;
  for (size_t i = 0; i < groups.size(); i++) {
    float score = 0.0f;
    for (const auto& variant : fresh.variants) {
      score = std::max(score, scorer->ScoreBestMatch(variant, groups[i].variants, fresh.kind));
      if (score >= 1.0f) break;
    }
    if (score + kScoreEpsilon >= threshold && score > best_score) {
      best_score = score;
      best_index = static_cast<int>(i);
    }
  }
  return best_index;
}

void DeidConfigReconciler::MergeInto(EntityGroup* target, const EntityGroup& fresh,
                                     ReconcileStats* stats) const {
  const std::string old_derived = DeidPatternMatcher::DerivePattern(*target);

  int added = 0;
  for (const auto& variant : fresh.variants) {
    if (target->AddVariant(variant)) added++;
  }

  if (IsNumericKind(target->kind)) {
    // Only a pattern this code derived is refreshed; an edited one is kept
    const bool derived = !target->pattern || *target->pattern == old_derived;
    if (derived && added > 0) {
      std::string pattern = DeidPatternMatcher::DerivePattern(*target);
      if (!pattern.empty()) target->pattern = pattern;
    }
  } else if (!target->pattern && fresh.pattern) {
    target->pattern = fresh.pattern;
  }

  if (stats && added > 0) {
    stats->groups_extended++;
    stats->variants_added += added;
  }
}

DeidResult DeidConfigReconciler::ReconcileGroup(Configuration* config, const EntityGroup& fresh,
                                                std::string* id, ReconcileStats* stats) const {
  const std::string label = EntityKindToLabel(fresh.kind);
  if (fresh.variants.empty()) {
    return DeidResult::ConfigValidationError(fresh.id.empty() ? label : fresh.id,
                                             "group has no variants");
  }
  for (const auto& variant : fresh.variants) {
    if (variant.empty()) {
      return DeidResult::ConfigValidationError(fresh.id.empty() ? label : fresh.id,
                                               "empty variant");
    }
  }

  if (!fresh.id.empty()) {
    EntityGroup* same = config->FindById(fresh.id);
    if (same && same->kind != fresh.kind) {
      return DeidResult::ConfigValidationError(
          fresh.id, std::string("id already used in section '") +
                    EntityKindToSection(same->kind) + "'");
    }
    if (same) {
      MergeInto(same, WithoutForeignVariants(*config, fresh, same), stats);
      *id = same->id;
      return DeidResult::Success();
    }
  }

  int best = FindBestGroup(*config, fresh);
  if (best >= 0) {
    EntityGroup& target = config->Groups(fresh.kind)[best];
    MergeInto(&target, WithoutForeignVariants(*config, fresh, &target), stats);
    *id = target.id;
    return DeidResult::Success();
  }

  EntityGroup group = fresh;
  if (group.id.empty()) {
    group.id = FormatGroupId(fresh.kind, config->NextSuffix(fresh.kind));
  }
  if (IsNumericKind(group.kind) && !group.pattern) {
    std::string pattern = DeidPatternMatcher::DerivePattern(group);
    if (!pattern.empty()) group.pattern = pattern;
  }
  config->AddGroup(group);
  *id = group.id;
  if (stats) {
    stats->groups_added++;
    stats->variants_added += static_cast<int>(group.variants.size());
  }
  LOG_DEBUG("ConfigReconciler", "New group " + group.id + " for '" + group.variants.front() + "'");
  return DeidResult::Success();
}

DeidResult DeidConfigReconciler::Reconcile(const Configuration& existing, const GroupsByKind& fresh,
                                           Configuration* out, ReconcileStats* stats) const {
  Configuration merged = existing;
  ReconcileStats local;

  for (EntityKind kind : AllEntityKinds()) {
    auto it = fresh.find(kind);
    if (it == fresh.end()) continue;

    for (const auto& group : it->second) {
      EntityGroup candidate = group;
      candidate.kind = kind;
      std::string id;
      DeidResult r = ReconcileGroup(&merged, candidate, &id, &local);
      if (!r.success) {
        LOG_ERROR("ConfigReconciler", r.message);
        return r;
      }
    }
  }

  LOG_INFO("ConfigReconciler", "Reconciled: " + std::to_string(local.groups_added) +
           " new group(s), " + std::to_string(local.groups_extended) + " extended");
  *out = std::move(merged);
  if (stats) stats->Add(local);
  return DeidResult::Success();
}

DeidResult DeidConfigReconciler::Assign(Configuration* config, EntityKind kind,
                                        const std::string& text, std::string* id,
                                        ReconcileStats* stats) const {
  EntityGroup fresh;
  fresh.kind = kind;
  fresh.variants.push_back(text);
  return ReconcileGroup(config, fresh, id, stats);
}

}  // namespace Deid
