#include "content/deid_format_segmenter.h"
#include "util/logger.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <set>

namespace Deid {

namespace {

bool IsBlank(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsAlpha(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool IsAlnum(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string ToLower(const std::string& text) {
  std::string lower;
  for (char c : text) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lower;
}

}  // namespace

std::string FileExtension(const std::string& path) {
  size_t slash = path.find_last_of("/\\");
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return "";
  }
  return ToLower(path.substr(dot));
}

FormatKind DetectFormat(const std::string& path) {
  const std::string ext = FileExtension(path);
  if (ext == ".txt") return FormatKind::TEXT;
  if (ext == ".md" || ext == ".markdown") return FormatKind::MARKDOWN;
  if (ext == ".tex") return FormatKind::TEX;
  if (ext == ".bib") return FormatKind::BIBTEX;
  return FormatKind::UNKNOWN;
}

const char* FormatKindToString(FormatKind format) {
  switch (format) {
    case FormatKind::TEXT: return "text";
    case FormatKind::MARKDOWN: return "markdown";
    case FormatKind::TEX: return "tex";
    case FormatKind::BIBTEX: return "bibtex";
    default: return "unknown";
  }
}

DeidResult DeidBuiltinSegmenter::Segment(const std::string& document, FormatKind format,
                                         std::vector<Region>* regions) const {
  regions->clear();
  std::vector<bool> syntax(document.size(), false);

  switch (format) {
    case FormatKind::TEXT:
      break;
    case FormatKind::MARKDOWN:
      SegmentMarkdown(document, &syntax);
      break;
    case FormatKind::TEX: {
      DeidResult r = SegmentTex(document, &syntax);
      if (!r.success) return r;
      break;
    }
    case FormatKind::BIBTEX: {
      DeidResult r = SegmentBibtex(document, &syntax);
      if (!r.success) return r;
      break;
    }
    default:
      return DeidResult::Failure(DeidStatus::UNSUPPORTED_FORMAT,
                                 std::string("No segmenter for format ") +
                                 FormatKindToString(format));
  }

  *regions = BuildRegions(syntax);
  LOG_DEBUG("FormatSegmenter", std::string(FormatKindToString(format)) + ": " +
            std::to_string(regions->size()) + " region(s)");
  return DeidResult::Success();
}

std::vector<Region> DeidBuiltinSegmenter::BuildRegions(const std::vector<bool>& syntax) {
  std::vector<Region> regions;
  size_t i = 0;
  while (i < syntax.size()) {
    size_t j = i;
    while (j < syntax.size() && syntax[j] == syntax[i]) j++;
    Region region;
    region.start = i;
    region.end = j;
    region.is_content = !syntax[i];
    regions.push_back(region);
    i = j;
  }
  return regions;
}

int DeidBuiltinSegmenter::LineAt(const std::string& document, size_t pos) {
  pos = std::min(pos, document.size());
  return 1 + static_cast<int>(std::count(document.begin(), document.begin() + pos, '\n'));
}

void DeidBuiltinSegmenter::Mark(std::vector<bool>* syntax, size_t start, size_t end) {
  end = std::min(end, syntax->size());
  for (size_t i = start; i < end; i++) {
    (*syntax)[i] = true;
  }
}

size_t DeidBuiltinSegmenter::FindClosingBrace(const std::string& doc, size_t open) {
  int depth = 0;
  size_t i = open;
  while (i < doc.size()) {
    char c = doc[i];
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (c == '{') {
      depth++;
    } else if (c == '}') {
      depth--;
      if (depth == 0) return i;
    }
    i++;
  }
  return std::string::npos;
}

// ============================================================================
// Markdown
// ============================================================================

void DeidBuiltinSegmenter::SegmentMarkdown(const std::string& doc, std::vector<bool>* syntax) {
  const size_t n = doc.size();
  size_t i = 0;
  bool line_start = true;

  while (i < n) {
    // Reference definition: [label]: url "title"
    if (line_start) {
      size_t j = i;
      int indent = 0;
      while (j < n && doc[j] == ' ' && indent < 3) {
        j++;
        indent++;
      }
      if (j < n && doc[j] == '[') {
        size_t eol = doc.find('\n', j);
        if (eol == std::string::npos) eol = n;
        size_t close = doc.find(']', j);
        if (close != std::string::npos && close + 1 < eol && doc[close + 1] == ':') {
          size_t url = close + 2;
          while (url < eol && (doc[url] == ' ' || doc[url] == '\t')) url++;
          size_t url_end = url;
          while (url_end < eol && !IsBlank(doc[url_end])) url_end++;
          if (url_end > url) {
            Mark(syntax, j, url_end);
            i = url_end;
            line_start = false;
            continue;
          }
        }
      }
    }

    const char c = doc[i];
    if (c == '\n') {
      line_start = true;
      i++;
      continue;
    }
    line_start = false;

    // Link or image destination: ](url "title")
    if (c == ']' && i + 1 < n && doc[i + 1] == '(') {
      size_t j = i + 2;
      int depth = 1;
      while (j < n && doc[j] != '\n') {
        if (doc[j] == '(') {
          depth++;
        } else if (doc[j] == ')') {
          depth--;
          if (depth == 0) break;
        }
        j++;
      }
      if (j < n && depth == 0) {
        Mark(syntax, i + 1, j + 1);
        i = j + 1;
        continue;
      }
    }

    // HTML tags and autolinks
    if (c == '<') {
      size_t eol = doc.find('\n', i);
      size_t close = doc.find('>', i);
      if (close != std::string::npos && (eol == std::string::npos || close < eol) &&
          close > i + 1) {
        const std::string inner = doc.substr(i + 1, close - i - 1);
        const bool has_space = inner.find_first_of(" \t") != std::string::npos;

        if (inner.compare(0, 7, "mailto:") == 0 && !has_space) {
          // Keep the mailbox replaceable
          Mark(syntax, i, i + 8);
          Mark(syntax, close, close + 1);
          i = close + 1;
          continue;
        }
        if (inner.find('@') != std::string::npos && !has_space &&
            inner.find(':') == std::string::npos) {
          Mark(syntax, i, i + 1);
          Mark(syntax, close, close + 1);
          i = close + 1;
          continue;
        }
        if (IsAlpha(inner[0]) || inner[0] == '/' || inner[0] == '!') {
          Mark(syntax, i, close + 1);
          i = close + 1;
          continue;
        }
      }
    }

    i++;
  }
}

// ============================================================================
// TeX
// ============================================================================

bool DeidBuiltinSegmenter::IsStructuralCommand(const std::string& name) {
  static const std::set<std::string> commands = {
    "documentclass", "usepackage", "RequirePackage", "begin", "end",
    "label", "ref", "eqref", "pageref", "autoref", "cref", "Cref",
    "nocite", "input", "include", "includegraphics",
    "bibliography", "bibliographystyle", "addbibresource", "url", "href"
  };
  return commands.count(name) > 0 || name.compare(0, 4, "cite") == 0 ||
         name.compare(0, 4, "Cite") == 0;
}

DeidResult DeidBuiltinSegmenter::SegmentTex(const std::string& doc, std::vector<bool>* syntax) {
  const size_t n = doc.size();
  std::vector<std::pair<std::string, size_t>> environments;
  std::vector<size_t> open_braces;
  size_t i = 0;

  while (i < n) {
    const char c = doc[i];

    if (c == '%') {
      size_t eol = doc.find('\n', i);
      i = eol == std::string::npos ? n : eol;
      continue;
    }

    if (c == '{') {
      open_braces.push_back(i);
      Mark(syntax, i, i + 1);
      i++;
      continue;
    }

    if (c == '}') {
      if (open_braces.empty()) {
        return DeidResult::FormatParseError("unmatched '}'", LineAt(doc, i));
      }
      open_braces.pop_back();
      Mark(syntax, i, i + 1);
      i++;
      continue;
    }

    if (c != '\\') {
      i++;
      continue;
    }

    // Control word or control symbol
    const size_t command_start = i;
    size_t j = i + 1;
    if (j < n && IsAlpha(doc[j])) {
      while (j < n && IsAlpha(doc[j])) j++;
    } else if (j < n) {
      j++;
    }
    const std::string name = doc.substr(i + 1, j - i - 1);
    if (j < n && doc[j] == '*' && !name.empty() && IsAlpha(name[0])) j++;
    Mark(syntax, i, j);
    i = j;

    if (!IsStructuralCommand(name)) continue;

    // Optional arguments
    size_t k = i;
    while (true) {
      size_t p = k;
      while (p < n && (doc[p] == ' ' || doc[p] == '\t')) p++;
      if (p >= n || doc[p] != '[') break;
      size_t close = doc.find(']', p);
      if (close == std::string::npos) {
        return DeidResult::FormatParseError("unterminated optional argument of \\" + name,
                                            LineAt(doc, p));
      }
      Mark(syntax, k, close + 1);
      k = close + 1;
    }

    size_t p = k;
    while (p < n && (doc[p] == ' ' || doc[p] == '\t')) p++;
    if (p >= n || doc[p] != '{') {
      i = k;
      continue;
    }

    size_t close = FindClosingBrace(doc, p);
    if (close == std::string::npos) {
      return DeidResult::FormatParseError("unbalanced braces in argument of \\" + name,
                                          LineAt(doc, p));
    }
    Mark(syntax, k, close + 1);
    const std::string argument = doc.substr(p + 1, close - p - 1);

    if (name == "begin") {
      environments.emplace_back(argument, command_start);
    } else if (name == "end") {
      if (environments.empty()) {
        return DeidResult::FormatParseError("\\end{" + argument + "} without \\begin",
                                            LineAt(doc, command_start));
      }
      if (environments.back().first != argument) {
        return DeidResult::FormatParseError(
            "\\end{" + argument + "} does not match \\begin{" + environments.back().first +
            "} on line " + std::to_string(LineAt(doc, environments.back().second)),
            LineAt(doc, command_start));
      }
      environments.pop_back();
    }
    i = close + 1;
  }

  if (!open_braces.empty()) {
    return DeidResult::FormatParseError("unclosed '{'", LineAt(doc, open_braces.back()));
  }
  if (!environments.empty()) {
    return DeidResult::FormatParseError("\\begin{" + environments.back().first + "} is never closed",
                                        LineAt(doc, environments.back().second));
  }
  return DeidResult::Success();
}

// ============================================================================
// BibTeX
// ============================================================================

DeidResult DeidBuiltinSegmenter::SegmentBibtex(const std::string& doc, std::vector<bool>* syntax) {
  const size_t n = doc.size();
  size_t i = 0;

  while (i < n) {
    if (doc[i] != '@') {
      i++;
      continue;
    }

    const size_t entry_start = i;
    const int entry_line = LineAt(doc, entry_start);
    auto unterminated = [&]() {
      return DeidResult::FormatParseError("unterminated entry", entry_line);
    };
    auto skip_blank = [&](size_t* pos) {
      while (*pos < n && IsBlank(doc[*pos])) (*pos)++;
    };

    size_t k = i + 1;
    while (k < n && IsAlnum(doc[k])) k++;
    const std::string type = ToLower(doc.substr(i + 1, k - i - 1));
    if (type.empty()) {
      // A stray '@' between entries
      i++;
      continue;
    }
    Mark(syntax, i, k);

    skip_blank(&k);
    if (k >= n || (doc[k] != '{' && doc[k] != '(')) {
      return DeidResult::FormatParseError("expected '{' after @" + type, LineAt(doc, k));
    }
    const char close_delim = doc[k] == '{' ? '}' : ')';
    const size_t open = k;
    Mark(syntax, k, k + 1);
    k++;

    if (type == "comment") {
      size_t end = close_delim == '}' ? FindClosingBrace(doc, open) : doc.find(')', k);
      if (end == std::string::npos) return unterminated();
      Mark(syntax, end, end + 1);
      i = end + 1;
      continue;
    }

    // One value: "..." or {...} or a bare word, joined by '#'
    auto parse_value = [&](const std::string& field) -> DeidResult {
      while (true) {
        skip_blank(&k);
        if (k >= n) return unterminated();
        const char c = doc[k];
        if (c == '{') {
          size_t close = FindClosingBrace(doc, k);
          if (close == std::string::npos) {
            return DeidResult::FormatParseError("unbalanced braces in field '" + field + "'",
                                                LineAt(doc, k));
          }
          Mark(syntax, k, k + 1);
          Mark(syntax, close, close + 1);
          k = close + 1;
        } else if (c == '"') {
          size_t j = k + 1;
          int depth = 0;
          while (j < n) {
            if (doc[j] == '\\') {
              j += 2;
              continue;
            }
            if (doc[j] == '{') depth++;
            if (doc[j] == '}') {
              if (--depth < 0) {
                return DeidResult::FormatParseError("unbalanced braces in field '" + field + "'",
                                                    LineAt(doc, j));
              }
            }
            if (doc[j] == '"' && depth == 0) break;
            j++;
          }
          if (j >= n) return unterminated();
          Mark(syntax, k, k + 1);
          Mark(syntax, j, j + 1);
          k = j + 1;
        } else if (IsAlnum(c)) {
          while (k < n && (IsAlnum(doc[k]) || std::strchr("_-:.+/", doc[k]) != nullptr)) k++;
        } else {
          return DeidResult::FormatParseError("missing value for field '" + field + "'",
                                              LineAt(doc, k));
        }

        skip_blank(&k);
        if (k < n && doc[k] == '#') {
          Mark(syntax, k, k + 1);
          k++;
          continue;
        }
        return DeidResult::Success();
      }
    };

    if (type == "preamble") {
      DeidResult r = parse_value("preamble");
      if (!r.success) return r;
      skip_blank(&k);
      if (k >= n || doc[k] != close_delim) return unterminated();
      Mark(syntax, k, k + 1);
      i = k + 1;
      continue;
    }

    if (type != "string") {
      // Citation key
      skip_blank(&k);
      size_t key_start = k;
      while (k < n && doc[k] != ',' && doc[k] != close_delim && !IsBlank(doc[k])) k++;
      Mark(syntax, key_start, k);
      skip_blank(&k);
      if (k >= n) return unterminated();
      if (doc[k] == close_delim) {
        Mark(syntax, k, k + 1);
        i = k + 1;
        continue;
      }
      if (doc[k] != ',') {
        return DeidResult::FormatParseError("expected ',' after citation key", LineAt(doc, k));
      }
      Mark(syntax, k, k + 1);
      k++;
    }

    // Fields
    bool closed = false;
    while (!closed) {
      skip_blank(&k);
      if (k >= n) return unterminated();
      if (doc[k] == close_delim) {
        Mark(syntax, k, k + 1);
        k++;
        break;
      }

      size_t name_start = k;
      while (k < n && (IsAlnum(doc[k]) || std::strchr("_-:.+/", doc[k]) != nullptr)) k++;
      if (k == name_start) {
        return DeidResult::FormatParseError(std::string("unexpected character '") + doc[k] +
                                            "' in entry", LineAt(doc, k));
      }
      const std::string field = doc.substr(name_start, k - name_start);
      Mark(syntax, name_start, k);

      skip_blank(&k);
      if (k >= n) return unterminated();
      if (doc[k] != '=') {
        return DeidResult::FormatParseError("missing '=' after field '" + field + "'",
                                            LineAt(doc, k));
      }
      Mark(syntax, k, k + 1);
      k++;

      DeidResult r = parse_value(field);
      if (!r.success) return r;

      skip_blank(&k);
      if (k >= n) return unterminated();
      if (doc[k] == ',') {
        Mark(syntax, k, k + 1);
        k++;
      } else if (doc[k] == close_delim) {
        Mark(syntax, k, k + 1);
        k++;
        closed = true;
      } else {
        return DeidResult::FormatParseError("expected ',' after field '" + field + "'",
                                            LineAt(doc, k));
      }
    }
    i = k;
  }

  return DeidResult::Success();
}

}  // namespace Deid
