#include "core/deid_replacement_engine.h"
#include "core/deid_variant_clusterer.h"
#include "ai/deid_text_similarity_scorer.h"
#include "util/logger.h"
#include <algorithm>
#include <regex>
#include <sstream>

namespace Deid {

// ============================================================================
// ReplacementStats
// ============================================================================

int ReplacementStats::TotalFound() const {
  int total = 0;
  for (const auto& [kind, counts] : by_kind) total += counts.found;
  return total;
}

int ReplacementStats::TotalReplaced() const {
  int total = 0;
  for (const auto& [kind, counts] : by_kind) total += counts.replaced;
  return total;
}

void ReplacementStats::Add(const ReplacementStats& other) {
  for (const auto& [kind, counts] : other.by_kind) {
    by_kind[kind].found += counts.found;
    by_kind[kind].replaced += counts.replaced;
  }
  literal_replaced += other.literal_replaced;
  pattern_replaced += other.pattern_replaced;
  recognizer_replaced += other.recognizer_replaced;
  reconcile.Add(other.reconcile);
}

std::string ReplacementStats::ToString() const {
  std::stringstream ss;
  ss << TotalReplaced() << " replacement(s)";
  if (!by_kind.empty()) {
    ss << " (";
    bool first = true;
    for (const auto& [kind, counts] : by_kind) {
      if (!first) ss << ", ";
      ss << EntityKindToLabel(kind) << ":" << counts.replaced << "/" << counts.found;
      first = false;
    }
    ss << ")";
  }
  if (reconcile.groups_added > 0) {
    ss << ", " << reconcile.groups_added << " new group(s)";
  }
  return ss.str();
}

// ============================================================================
// DeidReplacementEngine
// ============================================================================

DeidReplacementEngine::DeidReplacementEngine(DeidRecognizer* recognizer,
                                             const DeidFormatSegmenter* segmenter,
                                             const DeidConfigReconciler* reconciler,
                                             Language language)
    : recognizer_(recognizer),
      segmenter_(segmenter),
      reconciler_(reconciler),
      language_(language) {
}

std::vector<std::pair<size_t, size_t>> DeidReplacementEngine::FindIdTokens(
    const std::string& document, const Configuration& config) {
  static const std::regex token_pattern(R"(<[A-Z][A-Z_]*_\d+>)");

  std::vector<std::pair<size_t, size_t>> tokens;
  std::sregex_iterator it(document.begin(), document.end(), token_pattern);
  std::sregex_iterator end;
  for (; it != end; ++it) {
    size_t start = static_cast<size_t>(it->position());
    tokens.emplace_back(start, start + static_cast<size_t>(it->length()));
  }

  // Operators may rename ids freely
  for (EntityKind kind : AllEntityKinds()) {
    for (const auto& group : config.Groups(kind)) {
      if (group.id.empty()) continue;
      size_t pos = document.find(group.id);
      while (pos != std::string::npos) {
        tokens.emplace_back(pos, pos + group.id.size());
        pos = document.find(group.id, pos + group.id.size());
      }
    }
  }

  std::sort(tokens.begin(), tokens.end());
  return tokens;
}

bool DeidReplacementEngine::Overlaps(size_t start, size_t end,
                                     const std::vector<std::pair<size_t, size_t>>& ranges) {
  for (const auto& [range_start, range_end] : ranges) {
    if (range_start >= end) break;
    if (start < range_end) return true;
  }
  return false;
}

DeidResult DeidReplacementEngine::Recognize(
    const std::string& document, const std::vector<Region>& regions,
    const std::vector<std::pair<size_t, size_t>>& id_tokens,
    std::vector<Span>* spans) const {
  spans->clear();
  if (!recognizer_) return DeidResult::Success();

  for (const auto& region : regions) {
    if (!region.is_content || region.end <= region.start) continue;

    const std::string text = document.substr(region.start, region.end - region.start);
    std::vector<Span> detected;
    DeidResult r = recognizer_->Detect(text, language_, &detected);
    if (!r.success) {
      LOG_ERROR("ReplacementEngine", recognizer_->Name() + " recognizer failed: " + r.message);
      return r;
    }

    for (auto& span : detected) {
      if (span.end > text.size() || span.start >= span.end) continue;
      span.start += region.start;
      span.end += region.start;
      span.text = document.substr(span.start, span.end - span.start);
      if (Overlaps(span.start, span.end, id_tokens)) continue;
      spans->push_back(std::move(span));
    }
  }
  return DeidResult::Success();
}

DeidResult DeidReplacementEngine::CollectSpans(const std::string& document, FormatKind format,
                                               const Configuration& config,
                                               const std::string& file_id,
                                               std::vector<Span>* spans) const {
  spans->clear();

  std::vector<Region> regions;
  DeidResult r = segmenter_->Segment(document, format, &regions);
  if (!r.success) return r;

  std::vector<CompiledPattern> patterns;
  r = DeidPatternMatcher::Compile(config, &patterns);
  if (!r.success) return r;

  const auto id_tokens = FindIdTokens(document, config);

  for (const auto& region : regions) {
    if (!region.is_content) continue;
    for (auto& match : DeidPatternMatcher::Match(document, patterns, region.start, region.end)) {
      if (Overlaps(match.span.start, match.span.end, id_tokens)) continue;
      spans->push_back(std::move(match.span));
    }
  }

  std::vector<Span> recognized;
  r = Recognize(document, regions, id_tokens, &recognized);
  if (!r.success) return r;
  spans->insert(spans->end(), recognized.begin(), recognized.end());

  for (auto& span : *spans) {
    span.file_id = file_id;
  }
  return DeidResult::Success();
}

DeidResult DeidReplacementEngine::MapToGroup(const Span& span, Configuration* config,
                                             const std::vector<CompiledPattern>& patterns,
                                             std::string* id, ReplacementStats* stats) const {
  const TextSimilarityScorer* scorer = TextSimilarityScorer::GetInstance();
  const std::string normalized = scorer->Normalize(span.text, span.kind);

  for (const auto& group : config->Groups(span.kind)) {
    for (const auto& variant : group.variants) {
      if (scorer->Normalize(variant, span.kind) == normalized) {
        *id = group.id;
        return DeidResult::Success();
      }
    }
  }

  for (const auto& pattern : patterns) {
    if (pattern.kind == span.kind && DeidPatternMatcher::FullMatch(span.text, pattern)) {
      *id = pattern.id;
      return DeidResult::Success();
    }
  }

  return reconciler_->Assign(config, span.kind, span.text, id,
                             stats ? &stats->reconcile : nullptr);
}

DeidResult DeidReplacementEngine::RewriteOnce(const std::string& document, FormatKind format,
                                              Configuration* config, std::string* out,
                                              std::vector<Candidate>* plan,
                                              ReplacementStats* stats) const {
  out->clear();
  plan->clear();

  std::vector<Region> regions;
  DeidResult r = segmenter_->Segment(document, format, &regions);
  if (!r.success) {
    LOG_WARN("ReplacementEngine", r.message);
    return r;
  }

  std::vector<CompiledPattern> patterns;
  r = DeidPatternMatcher::Compile(*config, &patterns);
  if (!r.success) return r;

  const auto id_tokens = FindIdTokens(document, *config);

  // Configuration order of every group
  std::map<std::pair<EntityKind, size_t>, size_t> group_order;
  size_t rank = 0;
  for (EntityKind kind : AllEntityKinds()) {
    const auto& groups = config->Groups(kind);
    for (size_t i = 0; i < groups.size(); i++) {
      group_order[{kind, i}] = rank++;
    }
  }

  std::vector<Candidate> candidates;
  for (const auto& region : regions) {
    if (!region.is_content) continue;

    for (EntityKind kind : AllEntityKinds()) {
      const auto& groups = config->Groups(kind);
      for (size_t i = 0; i < groups.size(); i++) {
        for (const auto& variant : groups[i].variants) {
          for (const auto& [start, end] :
               DeidPatternMatcher::FindLiteral(document, variant, region.start, region.end)) {
            Candidate candidate;
            candidate.span.start = start;
            candidate.span.end = end;
            candidate.span.kind = kind;
            candidate.source = Source::LITERAL;
            candidate.order = group_order[{kind, i}];
            candidate.id = groups[i].id;
            candidates.push_back(std::move(candidate));
          }
        }
      }
    }

    for (auto& match : DeidPatternMatcher::Match(document, patterns, region.start, region.end)) {
      Candidate candidate;
      candidate.span = std::move(match.span);
      candidate.source = Source::PATTERN;
      candidate.order = group_order[{candidate.span.kind, match.group_index}];
      candidate.id = config->Groups(candidate.span.kind)[match.group_index].id;
      candidates.push_back(std::move(candidate));
    }
  }

  std::vector<Span> recognized;
  r = Recognize(document, regions, id_tokens, &recognized);
  if (!r.success) return r;

  ReplacementStats local;
  for (auto& span : recognized) {
    if (span.kind == EntityKind::PERSON && !DeidVariantClusterer::IsValidName(span.text)) {
      continue;
    }
    local.by_kind[span.kind].found++;
    Candidate candidate;
    candidate.span = std::move(span);
    candidate.source = Source::RECOGNIZER;
    candidate.order = rank;
    candidates.push_back(std::move(candidate));
  }

  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [&](const Candidate& c) {
                                    return Overlaps(c.span.start, c.span.end, id_tokens);
                                  }),
                   candidates.end());

  std::sort(candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b) {
              if (a.span.start != b.span.start) return a.span.start < b.span.start;
              if (a.span.length() != b.span.length()) return a.span.length() > b.span.length();
              if (a.source != b.source) return a.source < b.source;
              return a.order < b.order;
            });

  size_t last_end = 0;
  for (auto& candidate : candidates) {
    if (!plan->empty() && candidate.span.start < last_end) continue;
    last_end = candidate.span.end;
    plan->push_back(std::move(candidate));
  }

  // Map surviving recognizer mentions in document order
  for (auto& step : *plan) {
    if (step.source != Source::RECOGNIZER) continue;
    r = MapToGroup(step.span, config, patterns, &step.id, &local);
    if (!r.success) {
      LOG_ERROR("ReplacementEngine", r.message);
      return r;
    }
  }

  std::string result;
  result.reserve(document.size());
  size_t pos = 0;
  for (const auto& step : *plan) {
    result.append(document, pos, step.span.start - pos);
    result += step.id;
    pos = step.span.end;

    local.by_kind[step.span.kind].replaced++;
    switch (step.source) {
      case Source::LITERAL: local.literal_replaced++; break;
      case Source::PATTERN: local.pattern_replaced++; break;
      case Source::RECOGNIZER: local.recognizer_replaced++; break;
    }
  }
  result.append(document, pos, std::string::npos);

  *out = std::move(result);
  if (stats) stats->Add(local);
  return DeidResult::Success();
}

DeidResult DeidReplacementEngine::Rewrite(const std::string& document, FormatKind format,
                                          Configuration* config, std::string* out,
                                          ReplacementStats* stats,
                                          std::vector<Span>* mentions) const {
  std::string current = document;

  // Offset in `document` of every byte of `current`, npos inside inserted ids
  std::vector<size_t> origin;
  if (mentions) {
    origin.resize(document.size());
    for (size_t i = 0; i < origin.size(); i++) origin[i] = i;
  }

  // Every pass turns at least one span of plain text into a protected id token
  for (int pass = 1;; pass++) {
    std::string next;
    std::vector<Candidate> plan;
    DeidResult r = RewriteOnce(current, format, config, &next, &plan, stats);
    if (!r.success) return r;
    if (plan.empty()) break;

    if (mentions) {
      std::vector<size_t> next_origin;
      next_origin.reserve(next.size());
      size_t pos = 0;
      for (const auto& step : plan) {
        next_origin.insert(next_origin.end(), origin.begin() + pos,
                           origin.begin() + step.span.start);
        next_origin.insert(next_origin.end(), step.id.size(), std::string::npos);
        pos = step.span.end;

        if (step.source != Source::RECOGNIZER) continue;
        const size_t first = origin[step.span.start];
        const size_t last = origin[step.span.end - 1];
        if (first == std::string::npos || last == std::string::npos) continue;
        Span mention = step.span;
        mention.start = first;
        mention.end = last + 1;
        mentions->push_back(std::move(mention));
      }
      next_origin.insert(next_origin.end(), origin.begin() + pos, origin.end());
      origin = std::move(next_origin);
    }

    if (pass > 1) {
      LOG_DEBUG("ReplacementEngine", "Pass " + std::to_string(pass) + " replaced " +
                std::to_string(plan.size()) + " more span(s)");
    }
    current = std::move(next);
  }

  *out = std::move(current);
  return DeidResult::Success();
}

DeidResult DeidReplacementEngine::Anonymize(const std::string& document, FormatKind format,
                                            Configuration* config, std::string* out,
                                            ReplacementStats* stats) const {
  out->clear();

  ReplacementStats local;
  std::string result;
  DeidResult r = Rewrite(document, format, config, &result, &local, nullptr);
  if (!r.success) return r;

  *out = std::move(result);
  if (stats) stats->Add(local);
  LOG_DEBUG("ReplacementEngine", local.ToString());
  return DeidResult::Success();
}

DeidResult DeidReplacementEngine::CollectMentions(const std::string& document, FormatKind format,
                                                  const Configuration& config,
                                                  const std::string& file_id,
                                                  std::vector<Span>* spans) const {
  spans->clear();
  if (!recognizer_) return DeidResult::Success();

  // Inline assignment lands in the scratch copy only
  Configuration scratch = config;
  std::string rewritten;
  DeidResult r = Rewrite(document, format, &scratch, &rewritten, nullptr, spans);
  if (!r.success) {
    spans->clear();
    return r;
  }

  for (auto& span : *spans) {
    span.file_id = file_id;
  }
  return DeidResult::Success();
}

}  // namespace Deid
