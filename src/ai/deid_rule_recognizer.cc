#include "ai/deid_rule_recognizer.h"
#include "util/logger.h"
#include <algorithm>
#include <cctype>

namespace Deid {

bool ParseLanguage(const std::string& code, Language* language) {
  std::string lower;
  for (char c : code) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "en") {
    *language = Language::EN;
    return true;
  }
  if (lower == "da") {
    *language = Language::DA;
    return true;
  }
  return false;
}

const char* LanguageToCode(Language language) {
  switch (language) {
    case Language::EN: return "en";
    case Language::DA: return "da";
    default: return "en";
  }
}

DeidRuleRecognizer::DeidRuleRecognizer() {
  english_stop_words_ = {
    "the", "a", "an", "and", "or", "but", "hello", "hi", "hey", "dear",
    "contact", "call", "email", "phone", "mobile", "tel", "fax", "lives",
    "address", "name", "mr", "mrs", "ms", "miss", "dr", "prof", "sir", "madam",
    "in", "on", "at", "from", "to", "with", "by", "for", "of", "via",
    "please", "thanks", "regards", "best", "sincerely", "yours", "kind",
    "i", "we", "he", "she", "they", "it", "this", "that", "my", "our",
    "his", "her", "their", "street", "road", "avenue",
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday",
    "january", "february", "march", "april", "may", "june", "july",
    "august", "september", "october", "november", "december"
  };

  danish_stop_words_ = {
    "hej", "kære", "kontakt", "ring", "bor", "og", "eller", "den", "det", "de",
    "med", "venlig", "hilsen", "mvh", "hr", "fru", "til", "fra", "på", "i",
    "af", "hos", "tlf", "adresse", "navn", "jeg", "vi", "han", "hun",
    "mandag", "tirsdag", "onsdag", "torsdag", "fredag", "lørdag", "søndag",
    "januar", "februar", "marts", "april", "maj", "juni", "juli",
    "august", "september", "oktober", "november", "december"
  };

  InitializePatterns();
}

void DeidRuleRecognizer::InitializePatterns() {
  try {
    email_pattern_ = std::regex(
      R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})"
    );

    // Danish CPR number: DDMMYY-SSSS
    cpr_pattern_ = std::regex(
      R"(\d{6}-\d{4})"
    );

    // 7-15 digits with at most one separator between digits.
    // Matches: 1234567890, +45 12 34 56 78, 12 34 56 78, 555-123-4567
    phone_pattern_ = std::regex(
      R"(\+?\d(?:[ \-.]?\d){6,14})"
    );

    iso_date_pattern_ = std::regex(
      R"(\d{4}-\d{2}-\d{2})"
    );

    // Matches: 123 Main Street, Springfield, IL
    us_address_pattern_ = std::regex(
      R"(\d{1,5}\s[A-Za-z]+(?:\s[A-Za-z]+)*,\s*[A-Za-z]+(?:\s[A-Za-z]+)*,\s*[A-Z]{2}\b(?:\s+\d{5})?)"
    );

    // Matches: 42 Baker Street, 7 Elm Rd.
    // Only an abbreviation takes the dot; after "Street" it ends the sentence.
    street_address_pattern_ = std::regex(
      R"(\d{1,5}\s+(?:[A-Z][a-z]+\s+){1,3}(?:(?:Street|Avenue|Road|Boulevard|Lane|Drive|Court|Way|Place)\b|(?:St|Ave|Rd|Blvd|Ln|Ct|Pl)\b\.?))"
    );

    // Matches: Langelandsgade 14, 1.tv, 7300 Jelling
    danish_address_pattern_ = std::regex(
      "(?:[A-Z]|Æ|Ø|Å)(?:[a-z]|æ|ø|å|é)*"
      "(?:gade|vej|allé|alle|plads|stræde|torv|vænge|boulevard)"
      "\\s+\\d{1,4}[A-Za-z]?"
      "(?:,\\s*(?:\\d{1,2}\\.?\\s*(?:tv|th|mf|sal)\\.?|st\\.?(?:\\s*(?:tv|th|mf)\\.?)?))?"
      "(?:,\\s*\\d{4}\\s+(?:[A-Z]|Æ|Ø|Å)(?:[a-z]|æ|ø|å)+)?"
    );

    // Run of capitalized words on one line
    name_run_pattern_ = std::regex(
      "(?:[A-Z]|Æ|Ø|Å|É)(?:[a-z]|æ|ø|å|é|ö|ü|ä)(?:[A-Za-z]|æ|ø|å|é|ö|ü|ä)*"
      "(?:-(?:[A-Z]|Æ|Ø|Å)(?:[a-z]|æ|ø|å|é|ö|ü|ä)+)?"
      "(?:[ \\t]+(?:[A-Z]|Æ|Ø|Å|É)(?:[a-z]|æ|ø|å|é|ö|ü|ä)(?:[A-Za-z]|æ|ø|å|é|ö|ü|ä)*"
      "(?:-(?:[A-Z]|Æ|Ø|Å)(?:[a-z]|æ|ø|å|é|ö|ü|ä)+)?)*"
    );
  } catch (const std::regex_error& e) {
    init_error_ = std::string("pattern initialization failed: ") + e.what();
    LOG_ERROR("RuleRecognizer", init_error_);
  }
}

bool DeidRuleRecognizer::HasWordBoundaries(const std::string& text, size_t start, size_t end) {
  auto is_word = [](char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || uc >= 0x80;
  };
  if (start > 0 && is_word(text[start - 1])) return false;
  if (end < text.size() && is_word(text[end])) return false;
  return true;
}

bool DeidRuleRecognizer::IsStopWord(const std::string& word, Language language) const {
  std::string lower;
  for (char c : word) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (english_stop_words_.count(lower) > 0) return true;
  return language == Language::DA && danish_stop_words_.count(lower) > 0;
}

void DeidRuleRecognizer::FindAll(const std::string& text, const std::regex& pattern,
                                 EntityKind kind, int priority,
                                 std::vector<Candidate>* out) const {
  std::sregex_iterator it(text.begin(), text.end(), pattern);
  std::sregex_iterator end;
  for (; it != end; ++it) {
    size_t start = static_cast<size_t>(it->position());
    size_t stop = start + static_cast<size_t>(it->length());
    if (stop == start || !HasWordBoundaries(text, start, stop)) continue;

    Candidate candidate;
    candidate.span.start = start;
    candidate.span.end = stop;
    candidate.span.kind = kind;
    candidate.span.text = it->str();
    candidate.priority = priority;
    out->push_back(std::move(candidate));
  }
}

void DeidRuleRecognizer::FindNames(const std::string& text, Language language,
                                   std::vector<Candidate>* out) const {
  std::sregex_iterator it(text.begin(), text.end(), name_run_pattern_);
  std::sregex_iterator end;
  for (; it != end; ++it) {
    const size_t run_start = static_cast<size_t>(it->position());
    const size_t run_end = run_start + static_cast<size_t>(it->length());
    if (!HasWordBoundaries(text, run_start, run_end)) continue;

    // Split the run into words
    std::vector<std::pair<size_t, size_t>> words;
    size_t pos = run_start;
    while (pos < run_end) {
      while (pos < run_end && (text[pos] == ' ' || text[pos] == '\t')) pos++;
      size_t word_start = pos;
      while (pos < run_end && text[pos] != ' ' && text[pos] != '\t') pos++;
      if (pos > word_start) words.emplace_back(word_start, pos);
    }

    size_t first = 0;
    size_t last = words.size();
    auto word_text = [&](size_t i) {
      return text.substr(words[i].first, words[i].second - words[i].first);
    };
    while (first < last && IsStopWord(word_text(first), language)) first++;
    while (last > first && IsStopWord(word_text(last - 1), language)) last--;

    const size_t count = last - first;
    if (count < 2 || count > 3) continue;

    Candidate candidate;
    candidate.span.start = words[first].first;
    candidate.span.end = words[last - 1].second;
    candidate.span.kind = EntityKind::PERSON;
    candidate.span.text = text.substr(candidate.span.start,
                                      candidate.span.end - candidate.span.start);
    candidate.priority = 4;
    out->push_back(std::move(candidate));
  }
}

DeidResult DeidRuleRecognizer::Detect(const std::string& text, Language language,
                                      std::vector<Span>* spans) {
  spans->clear();
  if (!init_error_.empty()) {
    return DeidResult::RecognitionError(init_error_);
  }

  std::vector<Candidate> candidates;
  try {
    FindAll(text, cpr_pattern_, EntityKind::CPR_NUMBER, 0, &candidates);
    FindAll(text, email_pattern_, EntityKind::EMAIL, 1, &candidates);
    if (language == Language::DA) {
      FindAll(text, danish_address_pattern_, EntityKind::ADDRESS, 2, &candidates);
    } else {
      FindAll(text, us_address_pattern_, EntityKind::ADDRESS, 2, &candidates);
      FindAll(text, street_address_pattern_, EntityKind::ADDRESS, 2, &candidates);
    }

    std::vector<Candidate> phones;
    FindAll(text, phone_pattern_, EntityKind::PHONE_NUMBER, 3, &phones);
    for (auto& phone : phones) {
      if (!std::regex_match(phone.span.text, iso_date_pattern_)) {
        candidates.push_back(std::move(phone));
      }
    }

    FindNames(text, language, &candidates);
  } catch (const std::regex_error& e) {
    LOG_ERROR("RuleRecognizer", std::string("Detection failed: ") + e.what());
    return DeidResult::RecognitionError(e.what());
  }

  // Higher priority first, then earlier, then longer
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate& a, const Candidate& b) {
                     if (a.priority != b.priority) return a.priority < b.priority;
                     if (a.span.start != b.span.start) return a.span.start < b.span.start;
                     return a.span.length() > b.span.length();
                   });

  for (const auto& candidate : candidates) {
    bool overlaps = false;
    for (const auto& kept : *spans) {
      if (candidate.span.start < kept.end && kept.start < candidate.span.end) {
        overlaps = true;
        break;
      }
    }
    if (!overlaps) spans->push_back(candidate.span);
  }

  std::sort(spans->begin(), spans->end(),
            [](const Span& a, const Span& b) { return a.start < b.start; });

  LOG_DEBUG("RuleRecognizer", "Detected " + std::to_string(spans->size()) + " span(s) [" +
            LanguageToCode(language) + "]");
  return DeidResult::Success();
}

}  // namespace Deid
