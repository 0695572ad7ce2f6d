#include "core/deid_anonymizer.h"
#include "core/deid_config_store.h"
#include "util/logger.h"
#include <sstream>

namespace Deid {

int RunReport::FailedFiles() const {
  int failed = 0;
  for (const auto& file : files) {
    if (!file.result.success) failed++;
  }
  return failed;
}

std::string RunReport::Summary() const {
  std::stringstream ss;
  ss << files.size() << " file(s), " << FailedFiles() << " failed";
  if (reconcile.groups_added > 0 || reconcile.groups_extended > 0) {
    ss << "; configuration: " << reconcile.groups_added << " new group(s), "
       << reconcile.groups_extended << " extended";
  }
  if (totals.TotalReplaced() > 0 || totals.TotalFound() > 0) {
    ss << "; " << totals.ToString();
  }
  return ss.str();
}

DeidAnonymizer::DeidAnonymizer(DeidRecognizer* recognizer,
                               const DeidFormatSegmenter* segmenter,
                               const ClusterOptions& options,
                               Language language)
    : recognizer_(recognizer),
      clusterer_(options),
      reconciler_(options),
      engine_(recognizer, segmenter, &reconciler_, language) {
}

DeidResult DeidAnonymizer::ReadDocument(const std::string& path, std::string* text,
                                        FormatKind* format) const {
  *format = DetectFormat(path);
  if (*format == FormatKind::UNKNOWN) {
    return DeidResult::UnsupportedFormat(path, FileExtension(path));
  }
  return DeidConfigStore::ReadText(path, text);
}

DeidResult DeidAnonymizer::CollectAndReconcile(const std::vector<std::string>& inputs,
                                               Configuration* config, RunReport* report,
                                               bool anonymizing) {
  std::vector<Span> all_spans;

  for (size_t i = 0; i < inputs.size(); i++) {
    FileReport& file = report->files[i];

    std::string text;
    FormatKind format;
    DeidResult r = ReadDocument(inputs[i], &text, &format);
    if (r.success) {
      std::vector<Span> spans;
      if (anonymizing) {
        r = engine_.CollectMentions(text, format, *config, inputs[i], &spans);
      } else {
        r = engine_.CollectSpans(text, format, *config, inputs[i], &spans);
      }
      if (r.success) {
        file.spans = spans.size();
        all_spans.insert(all_spans.end(), spans.begin(), spans.end());
      }
    }

    if (!r.success) {
      r.InFile(inputs[i]);
      if (DeidStatusIsRunLevel(r.status)) {
        LOG_ERROR("Anonymizer", r.ToString());
        return r;
      }
      LOG_WARN("Anonymizer", "Skipping " + inputs[i] + ": " + r.message);
      file.result = r;
      continue;
    }
    LOG_INFO("Anonymizer", inputs[i] + ": " + std::to_string(file.spans) + " mention(s)");
  }

  GroupsByKind fresh = clusterer_.ClusterAll(all_spans);
  Configuration merged;
  DeidResult r = reconciler_.Reconcile(*config, fresh, &merged, &report->reconcile);
  if (!r.success) return r;
  *config = std::move(merged);
  return DeidResult::Success();
}

DeidResult DeidAnonymizer::Extract(const std::vector<std::string>& inputs, Configuration* config,
                                   RunReport* report) {
  *report = RunReport();
  DeidResult r = DeidConfigStore::Validate(*config);
  if (!r.success) return r;

  for (const auto& input : inputs) {
    FileReport file;
    file.input = input;
    file.result = DeidResult::Success();
    report->files.push_back(file);
  }

  // Extraction also learns from pattern matches of the existing groups
  r = CollectAndReconcile(inputs, config, report, false);
  if (!r.success) return r;

  LOG_INFO("Anonymizer", "Extraction: " + report->Summary());
  return DeidResult::Success();
}

DeidResult DeidAnonymizer::Anonymize(const std::vector<std::string>& inputs,
                                     const std::vector<std::string>& outputs,
                                     Configuration* config, RunReport* report) {
  *report = RunReport();
  if (inputs.size() != outputs.size()) {
    return DeidResult::InvalidParameter("outputs", std::to_string(outputs.size()) +
                                        " output path(s) for " + std::to_string(inputs.size()) +
                                        " input(s)");
  }
  DeidResult r = DeidConfigStore::Validate(*config);
  if (!r.success) return r;

  for (size_t i = 0; i < inputs.size(); i++) {
    FileReport file;
    file.input = inputs[i];
    file.output = outputs[i];
    file.result = DeidResult::Success();
    report->files.push_back(file);
  }

  // Phase 1: recognized entities no configured variant or pattern covers join the
  // configuration before any file is written
  if (recognizer_) {
    r = CollectAndReconcile(inputs, config, report, true);
    if (!r.success) return r;
  }

  // Phase 2: rewrite every file against the finalized configuration
  for (size_t i = 0; i < inputs.size(); i++) {
    FileReport& file = report->files[i];
    if (!file.result.success) continue;

    if (inputs[i] == outputs[i]) {
      file.result = DeidResult::IoError(outputs[i], "output would overwrite the input");
      LOG_WARN("Anonymizer", file.result.message);
      continue;
    }

    std::string text;
    FormatKind format;
    r = ReadDocument(inputs[i], &text, &format);

    std::string anonymized;
    if (r.success) r = engine_.Anonymize(text, format, config, &anonymized, &file.stats);
    if (r.success) r = DeidConfigStore::WriteText(outputs[i], anonymized);

    if (!r.success) {
      r.InFile(inputs[i]);
      if (DeidStatusIsRunLevel(r.status)) {
        LOG_ERROR("Anonymizer", r.ToString());
        return r;
      }
      LOG_WARN("Anonymizer", "Skipping " + inputs[i] + ": " + r.message);
      file.result = r;
      continue;
    }

    report->totals.Add(file.stats);
    LOG_INFO("Anonymizer", inputs[i] + " -> " + outputs[i] + ": " + file.stats.ToString());
  }

  LOG_INFO("Anonymizer", "Anonymization: " + report->Summary());
  return DeidResult::Success();
}

}  // namespace Deid
