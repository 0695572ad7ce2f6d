#ifndef DEID_REPLACEMENT_ENGINE_H_
#define DEID_REPLACEMENT_ENGINE_H_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "ai/deid_recognizer.h"
#include "content/deid_format_segmenter.h"
#include "core/deid_config_reconciler.h"
#include "core/deid_pattern_matcher.h"
#include "core/deid_result.h"
#include "core/deid_types.h"

namespace Deid {

struct KindCounts {
  int found = 0;     // recognizer mentions in content regions
  int replaced = 0;  // substitutions made
};

/**
 * Counters for one or more anonymized documents.
 */
struct ReplacementStats {
  std::map<EntityKind, KindCounts> by_kind;
  int literal_replaced = 0;
  int pattern_replaced = 0;
  int recognizer_replaced = 0;
  ReconcileStats reconcile;

  int TotalFound() const;
  int TotalReplaced() const;
  void Add(const ReplacementStats& other);
  std::string ToString() const;
};

/**
 * DeidReplacementEngine - rewrites a document against a configuration.
 *
 * Candidates come from three sources, inside content regions only:
 *   literal   every variant of every group
 *   pattern   every group pattern
 *   recognizer  spans from the recognizer, mapped to a group afterwards
 *
 * Candidates are sorted by start, then longer first, then source (literal,
 * pattern, recognizer), then configuration order, and swept left to right;
 * a candidate starting before the end of the last kept one is dropped.
 * Id tokens already present in the document are never candidates.
 *
 * A pass is repeated over its own output until it changes nothing: once a
 * configured variant becomes an id token, the words around it can form a
 * new mention ("Peter Hansen Larsen Berg" with "Peter Hansen" configured).
 * Anonymizing the result again is therefore a no-op.
 *
 * The recognizer and segmenter are not owned. The recognizer may be null.
 */
class DeidReplacementEngine {
 public:
  DeidReplacementEngine(DeidRecognizer* recognizer,
                        const DeidFormatSegmenter* segmenter,
                        const DeidConfigReconciler* reconciler,
                        Language language = Language::EN);

  /**
   * Anonymize one document.
   *
   * Recognized mentions that match no group are assigned inline, so
   * `config` may grow; the caller decides whether to persist it.
   *
   * @param document Document bytes
   * @param format Document format
   * @param config Configuration, extended in place by inline assignment
   * @param out Receives the anonymized document on success
   * @param stats Optional counters, accumulated
   * @return FORMAT_PARSE_ERROR, RECOGNITION_ERROR or PATTERN_COMPILE_ERROR
   *         on failure, with `out` left empty
   */
  DeidResult Anonymize(const std::string& document, FormatKind format,
                       Configuration* config, std::string* out,
                       ReplacementStats* stats = nullptr) const;

  /**
   * Spans for clustering: recognizer spans plus the pattern matches of the
   * configured groups. Restricted to content regions and excluding id tokens.
   */
  DeidResult CollectSpans(const std::string& document, FormatKind format,
                          const Configuration& config, const std::string& file_id,
                          std::vector<Span>* spans) const;

  /**
   * Recognizer mentions that would be replaced by Anonymize with `config`:
   * mentions covered by a configured variant or pattern are left out.
   * Offsets refer to `document`. The configuration is not modified.
   */
  DeidResult CollectMentions(const std::string& document, FormatKind format,
                             const Configuration& config, const std::string& file_id,
                             std::vector<Span>* spans) const;

  // [start, end) of id tokens in the document: configured ids and <LABEL_n> tokens
  static std::vector<std::pair<size_t, size_t>> FindIdTokens(const std::string& document,
                                                             const Configuration& config);

  void SetLanguage(Language language) { language_ = language; }
  Language language() const { return language_; }

 private:
  enum class Source {
    LITERAL = 0,
    PATTERN = 1,
    RECOGNIZER = 2
  };

  struct Candidate {
    Span span;
    Source source = Source::LITERAL;
    size_t order = 0;  // configuration order of the group
    std::string id;    // empty for recognizer candidates until mapped
  };

  // One pass over `document`; `plan` receives the replaced spans in order
  DeidResult RewriteOnce(const std::string& document, FormatKind format, Configuration* config,
                         std::string* out, std::vector<Candidate>* plan,
                         ReplacementStats* stats) const;

  // Passes until a fixed point; `mentions` (optional) collects recognizer replacements
  DeidResult Rewrite(const std::string& document, FormatKind format, Configuration* config,
                     std::string* out, ReplacementStats* stats,
                     std::vector<Span>* mentions) const;

  DeidResult Recognize(const std::string& document, const std::vector<Region>& regions,
                       const std::vector<std::pair<size_t, size_t>>& id_tokens,
                       std::vector<Span>* spans) const;

  // Id for a recognized mention: exact variant, full pattern match, else Assign
  DeidResult MapToGroup(const Span& span, Configuration* config,
                        const std::vector<CompiledPattern>& patterns,
                        std::string* id, ReplacementStats* stats) const;

  static bool Overlaps(size_t start, size_t end,
                       const std::vector<std::pair<size_t, size_t>>& ranges);

  DeidRecognizer* recognizer_;
  const DeidFormatSegmenter* segmenter_;
  const DeidConfigReconciler* reconciler_;
  Language language_;
};

}  // namespace Deid

#endif  // DEID_REPLACEMENT_ENGINE_H_
