#ifndef DEID_RECOGNIZER_H_
#define DEID_RECOGNIZER_H_

#include <string>
#include <vector>

#include "core/deid_result.h"
#include "core/deid_types.h"

namespace Deid {

enum class Language {
  EN,
  DA
};

// "en" / "da", case-insensitive
bool ParseLanguage(const std::string& code, Language* language);
const char* LanguageToCode(Language language);

/**
 * DeidRecognizer - named-entity detection over a text blob.
 *
 * Implementations return spans with offsets relative to `text`; file_id is
 * left empty for the caller to fill in. Spans must not overlap.
 */
class DeidRecognizer {
 public:
  virtual ~DeidRecognizer() = default;

  /**
   * @param text Document text
   * @param language Detection language
   * @param spans Receives the detected spans, ordered by start
   * @return RECOGNITION_ERROR on failure
   */
  virtual DeidResult Detect(const std::string& text, Language language,
                            std::vector<Span>* spans) = 0;

  virtual std::string Name() const = 0;
};

}  // namespace Deid

#endif  // DEID_RECOGNIZER_H_
