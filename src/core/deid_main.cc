#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "ai/deid_rule_recognizer.h"
#include "content/deid_format_segmenter.h"
#include "core/deid_anonymizer.h"
#include "core/deid_config_store.h"
#include "core/deid_settings.h"
#include "util/logger.h"

#ifndef DEID_VERSION
#define DEID_VERSION "1.0.0"
#endif

namespace {

enum ExitCode {
  EXIT_OK = 0,
  EXIT_FILE_FAILURE = 1,
  EXIT_USAGE = 2
};

void PrintUsage(const char* program) {
  std::cout << "Usage:\n";
  std::cout << "  " << program << " extract|ex [options] INPUT...\n";
  std::cout << "  " << program << " anonymize|an -c CONFIG [options] INPUT...\n";
  std::cout << "  " << program << " help | version\n\n";
  std::cout << "Inputs: .txt .md .tex .bib\n\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config FILE     Entity configuration (.yaml, .yml, .json)\n";
  std::cout << "                        extract default: " << DEID_DEFAULT_CONFIG << "\n";
  std::cout << "  -o, --output FILE     Output path, once per input (anonymize)\n";
  std::cout << "                        default: <stem>" << DEID_OUTPUT_SUFFIX << "<ext>\n";
  std::cout << "  -l, --language LANG   Recognizer language: en (default) or da\n";
  std::cout << "  -t, --threshold N     Similarity threshold in [0, 1] (default 0.85)\n";
  std::cout << "      --mapping FILE    Write the variant -> id mapping as JSON\n";
  std::cout << "      --save-config     Write newly assigned ids back to CONFIG (anonymize)\n";
  std::cout << "      --no-detect       Replace configured entities only (anonymize)\n";
  std::cout << "      --log-file FILE   Append log lines to FILE\n";
  std::cout << "  -v, --verbose         More logging (repeat for debug)\n\n";
  std::cout << "Environment: DEID_LANGUAGE, DEID_THRESHOLD, DEID_LOG_LEVEL, DEID_LOG_FILE\n";
}

void PrintFileFailures(const Deid::RunReport& report) {
  for (const auto& file : report.files) {
    if (!file.result.success) {
      std::cerr << "  FAILED " << file.result.ToString() << "\n";
    }
  }
}

int ExitFor(const Deid::RunReport& report) {
  return report.FailedFiles() > 0 ? EXIT_FILE_FAILURE : EXIT_OK;
}

DeidResult WriteMapping(const Deid::DeidSettings& settings, const Deid::Configuration& config) {
  if (settings.mapping_path.empty()) return DeidResult::Success();
  DeidResult r = Deid::DeidConfigStore::SaveMapping(settings.mapping_path, config);
  if (r.success) LOG_INFO("Main", "Mapping written to " + settings.mapping_path);
  return r;
}

int RunExtract(const Deid::DeidSettings& settings, Deid::DeidAnonymizer* anonymizer) {
  Deid::Configuration config;
  DeidResult r = Deid::DeidConfigStore::LoadFile(settings.config_path, &config);
  if (!r.success && r.status != DeidStatus::FILE_NOT_FOUND) {
    std::cerr << "Error: " << r.ToString() << "\n";
    return EXIT_USAGE;
  }
  if (r.success) {
    LOG_INFO("Main", "Reconciling with existing " + settings.config_path + " (" +
             std::to_string(config.TotalGroups()) + " group(s))");
  }

  Deid::RunReport report;
  r = anonymizer->Extract(settings.inputs, &config, &report);
  if (!r.success) {
    std::cerr << "Error: " << r.ToString() << "\n";
    return EXIT_USAGE;
  }

  r = Deid::DeidConfigStore::SaveFile(settings.config_path, config);
  if (!r.success) {
    std::cerr << "Error: " << r.ToString() << "\n";
    return EXIT_FILE_FAILURE;
  }
  r = WriteMapping(settings, config);
  if (!r.success) {
    std::cerr << "Error: " << r.ToString() << "\n";
    return EXIT_FILE_FAILURE;
  }

  std::cout << "Extracted " << config.TotalGroups() << " group(s), "
            << config.TotalVariants() << " variant(s) -> " << settings.config_path << "\n";
  std::cout << report.Summary() << "\n";
  PrintFileFailures(report);
  return ExitFor(report);
}

int RunAnonymize(const Deid::DeidSettings& settings, Deid::DeidAnonymizer* anonymizer) {
  Deid::Configuration config;
  DeidResult r = Deid::DeidConfigStore::LoadFile(settings.config_path, &config);
  if (!r.success) {
    std::cerr << "Error: " << r.ToString() << "\n";
    return EXIT_USAGE;
  }

  Deid::RunReport report;
  r = anonymizer->Anonymize(settings.inputs, settings.outputs, &config, &report);
  if (!r.success) {
    std::cerr << "Error: " << r.ToString() << "\n";
    return EXIT_USAGE;
  }

  if (report.ConfigChanged()) {
    if (settings.save_config) {
      r = Deid::DeidConfigStore::SaveFile(settings.config_path, config);
      if (!r.success) {
        std::cerr << "Error: " << r.ToString() << "\n";
        return EXIT_FILE_FAILURE;
      }
      LOG_INFO("Main", "Configuration updated: " + settings.config_path);
    } else {
      LOG_WARN("Main", "New entities were assigned ids that are not saved; rerun with "
               "--save-config to keep them stable");
    }
  }

  r = WriteMapping(settings, config);
  if (!r.success) {
    std::cerr << "Error: " << r.ToString() << "\n";
    return EXIT_FILE_FAILURE;
  }

  for (const auto& file : report.files) {
    if (file.result.success) {
      std::cout << file.input << " -> " << file.output << ": " << file.stats.ToString() << "\n";
    }
  }
  std::cout << report.Summary() << "\n";
  PrintFileFailures(report);
  return ExitFor(report);
}

}  // namespace

int main(int argc, char* argv[]) {
  Deid::DeidSettings settings;

  DeidResult r = Deid::ApplyEnvironment(&settings);
  if (r.success) r = Deid::ParseCommandLine(argc, argv, &settings);
  if (r.success) r = Deid::FinalizeSettings(&settings);
  if (!r.success) {
    std::cerr << "Error: " << r.message << "\n\n";
    PrintUsage(argv[0]);
    return EXIT_USAGE;
  }

  if (settings.command == Deid::Command::HELP) {
    PrintUsage(argv[0]);
    return EXIT_OK;
  }
  if (settings.command == Deid::Command::VERSION) {
    std::cout << "deid " << DEID_VERSION << "\n";
    return EXIT_OK;
  }

  if (settings.log_file.empty()) {
    DeidLogger::Logger::Init();
  } else {
    DeidLogger::Logger::Init(settings.log_file);
  }
  DeidLogger::Logger::SetLevel(settings.log_level);

  Deid::ClusterOptions options;
  options.threshold = settings.threshold;

  Deid::DeidBuiltinSegmenter segmenter;
  std::unique_ptr<Deid::DeidRuleRecognizer> recognizer;
  if (settings.command == Deid::Command::EXTRACT || settings.detect) {
    recognizer = std::make_unique<Deid::DeidRuleRecognizer>();
  }

  Deid::DeidAnonymizer anonymizer(recognizer.get(), &segmenter, options, settings.language);

  LOG_INFO("Main", std::string("deid ") + DEID_VERSION + ", language " +
           Deid::LanguageToCode(settings.language));

  if (settings.command == Deid::Command::EXTRACT) {
    return RunExtract(settings, &anonymizer);
  }
  return RunAnonymize(settings, &anonymizer);
}
