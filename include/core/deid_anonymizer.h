#ifndef DEID_ANONYMIZER_H_
#define DEID_ANONYMIZER_H_

#include <string>
#include <vector>

#include "ai/deid_recognizer.h"
#include "content/deid_format_segmenter.h"
#include "core/deid_config_reconciler.h"
#include "core/deid_replacement_engine.h"
#include "core/deid_result.h"
#include "core/deid_types.h"
#include "core/deid_variant_clusterer.h"

namespace Deid {

struct FileReport {
  std::string input;
  std::string output;  // empty for extraction
  DeidResult result;
  size_t spans = 0;    // collected mentions
  ReplacementStats stats;
};

struct RunReport {
  std::vector<FileReport> files;
  ReplacementStats totals;
  ReconcileStats reconcile;  // phase-1 reconciliation

  int FailedFiles() const;
  bool ConfigChanged() const { return reconcile.Changed() || totals.reconcile.Changed(); }
  std::string Summary() const;
};

/**
 * DeidAnonymizer - two-phase batch driver.
 *
 * Extraction: collect spans of every file, then cluster them jointly and
 * reconcile once into the configuration.
 *
 * Anonymization: collect the recognizer mentions of every file that no
 * configured variant or pattern covers and reconcile them into the
 * configuration, then rewrite each file against the finalized configuration.
 *
 * A failing file (read, segmentation, recognition, write) is recorded in
 * the report and skipped. Configuration errors abort the run.
 */
class DeidAnonymizer {
 public:
  DeidAnonymizer(DeidRecognizer* recognizer,
                 const DeidFormatSegmenter* segmenter,
                 const ClusterOptions& options = ClusterOptions(),
                 Language language = Language::EN);

  DeidAnonymizer(const DeidAnonymizer&) = delete;
  DeidAnonymizer& operator=(const DeidAnonymizer&) = delete;

  /**
   * @param inputs Document paths
   * @param config Existing configuration, updated in place on success
   * @param report Per-file results and counters
   * @return Run-level failure (CONFIG_VALIDATION_ERROR, PATTERN_COMPILE_ERROR)
   *         or success; file failures are only in the report
   */
  DeidResult Extract(const std::vector<std::string>& inputs, Configuration* config,
                     RunReport* report);

  /**
   * @param inputs Document paths
   * @param outputs Output paths, one per input
   * @param config Validated configuration; grows with newly seen entities
   * @param report Per-file results and counters
   */
  DeidResult Anonymize(const std::vector<std::string>& inputs,
                       const std::vector<std::string>& outputs,
                       Configuration* config, RunReport* report);

  void SetLanguage(Language language) { engine_.SetLanguage(language); }

  const DeidReplacementEngine& engine() const { return engine_; }

 private:
  // Read and classify one input
  DeidResult ReadDocument(const std::string& path, std::string* text, FormatKind* format) const;

  // Phase 1 shared by both commands; failed files are marked in the report.
  // Extraction clusters every span, anonymization only the mentions the
  // replacement engine would still have to assign.
  DeidResult CollectAndReconcile(const std::vector<std::string>& inputs, Configuration* config,
                                 RunReport* report, bool anonymizing);

  DeidRecognizer* recognizer_;
  DeidVariantClusterer clusterer_;
  DeidConfigReconciler reconciler_;
  DeidReplacementEngine engine_;
};

}  // namespace Deid

#endif  // DEID_ANONYMIZER_H_
