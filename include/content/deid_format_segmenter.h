#pragma once

#include <string>
#include <vector>

#include "core/deid_result.h"

namespace Deid {

enum class FormatKind {
  TEXT,
  MARKDOWN,
  TEX,
  BIBTEX,
  UNKNOWN
};

// Format from the file extension (.txt, .md/.markdown, .tex, .bib), case-insensitive
FormatKind DetectFormat(const std::string& path);
const char* FormatKindToString(FormatKind format);

// Lower-cased extension including the dot, empty if none
std::string FileExtension(const std::string& path);

// A byte range of a document; replacement is allowed only in content regions
struct Region {
  size_t start = 0;
  size_t end = 0;
  bool is_content = true;
};

// Regions are ordered, adjacent and cover the whole document
class DeidFormatSegmenter {
 public:
  virtual ~DeidFormatSegmenter() = default;

  virtual DeidResult Segment(const std::string& document, FormatKind format,
                             std::vector<Region>* regions) const = 0;
};

/**
 * DeidBuiltinSegmenter - content/syntax segmentation for txt, md, tex, bib.
 *
 * Markdown: link and image destinations, reference definitions, HTML tags
 * and URL autolinks are syntax. Never fails.
 *
 * TeX: control sequences, braces and the arguments of structural commands
 * (\begin, \label, \cite..., \includegraphics, ...) are syntax. Comments and
 * math stay content. Unbalanced braces and mismatched environments fail with
 * the offending line.
 *
 * BibTeX: entry types, delimiters, citation keys, field names, '=' and '#'
 * are syntax; field values and text between entries are content.
 */
class DeidBuiltinSegmenter : public DeidFormatSegmenter {
 public:
  DeidResult Segment(const std::string& document, FormatKind format,
                     std::vector<Region>* regions) const override;

  // Coalesce a per-byte syntax mask into regions
  static std::vector<Region> BuildRegions(const std::vector<bool>& syntax);

  // 1-based line number of a byte offset
  static int LineAt(const std::string& document, size_t pos);

 private:
  static void SegmentMarkdown(const std::string& doc, std::vector<bool>* syntax);
  static DeidResult SegmentTex(const std::string& doc, std::vector<bool>* syntax);
  static DeidResult SegmentBibtex(const std::string& doc, std::vector<bool>* syntax);

  static void Mark(std::vector<bool>* syntax, size_t start, size_t end);
  static bool IsStructuralCommand(const std::string& name);

  // Index of the '}' closing the '{' at open, npos if unbalanced
  static size_t FindClosingBrace(const std::string& doc, size_t open);
};

}  // namespace Deid
