#ifndef DEID_RULE_RECOGNIZER_H_
#define DEID_RULE_RECOGNIZER_H_

#include <regex>
#include <set>
#include <string>
#include <vector>

#include "ai/deid_recognizer.h"

namespace Deid {

/**
 * DeidRuleRecognizer - regex based recognizer for English and Danish text.
 *
 * Rules, in priority order (a higher rule wins any overlap):
 * - CPR numbers (DDMMYY-SSSS)
 * - Email addresses
 * - Street addresses (US forms for en, Danish "...gade 14, 1.tv, 7300 By" for da)
 * - Phone numbers (7-15 digits with single separators, including DD DD DD DD)
 * - Person names (2-3 capitalized words; sentence words and honorifics trimmed)
 *
 * Usage:
 *   DeidRuleRecognizer recognizer;
 *   std::vector<Span> spans;
 *   DeidResult r = recognizer.Detect(text, Language::EN, &spans);
 */
class DeidRuleRecognizer : public DeidRecognizer {
 public:
  DeidRuleRecognizer();
  ~DeidRuleRecognizer() override = default;

  DeidResult Detect(const std::string& text, Language language,
                    std::vector<Span>* spans) override;

  std::string Name() const override { return "rule"; }

 private:
  struct Candidate {
    Span span;
    int priority = 0;  // lower wins
  };

  /**
   * Initialize all regex patterns. Leaves init_error_ set on failure.
   */
  void InitializePatterns();

  void FindAll(const std::string& text, const std::regex& pattern, EntityKind kind,
               int priority, std::vector<Candidate>* out) const;

  void FindNames(const std::string& text, Language language,
                 std::vector<Candidate>* out) const;

  bool IsStopWord(const std::string& word, Language language) const;

  // Byte before start and byte after end are not word characters
  static bool HasWordBoundaries(const std::string& text, size_t start, size_t end);

  std::regex email_pattern_;
  std::regex cpr_pattern_;
  std::regex phone_pattern_;
  std::regex iso_date_pattern_;
  std::regex us_address_pattern_;
  std::regex street_address_pattern_;
  std::regex danish_address_pattern_;
  std::regex name_run_pattern_;

  std::set<std::string> english_stop_words_;
  std::set<std::string> danish_stop_words_;

  std::string init_error_;
};

}  // namespace Deid

#endif  // DEID_RULE_RECOGNIZER_H_
