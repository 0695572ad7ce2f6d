#pragma once

#include <string>
#include <sstream>

// Status codes returned by every stage of the pipeline.
// File-level statuses abort one document; run-level statuses abort the batch.
enum class DeidStatus {
  OK,                        // Operation completed successfully

  // Collaborator errors (file-level)
  RECOGNITION_ERROR,         // Recognizer failed on a document
  FORMAT_PARSE_ERROR,        // Document structure could not be segmented
  UNSUPPORTED_FORMAT,        // File extension has no segmenter

  // Configuration errors (run-level)
  CONFIG_VALIDATION_ERROR,   // Duplicate id, empty variants, unknown section, ...
  PATTERN_COMPILE_ERROR,     // User-authored regex does not compile

  // I/O errors
  FILE_NOT_FOUND,            // Input or config file missing
  IO_ERROR,                  // Read/write failed

  // Caller errors
  INVALID_PARAMETER,         // Bad CLI argument or setting

  // System errors
  INTERNAL_ERROR,            // Unexpected internal error

  UNKNOWN
};

// Convert DeidStatus to string code
inline const char* DeidStatusToCode(DeidStatus status) {
  switch (status) {
    case DeidStatus::OK: return "ok";
    case DeidStatus::RECOGNITION_ERROR: return "recognition_error";
    case DeidStatus::FORMAT_PARSE_ERROR: return "format_parse_error";
    case DeidStatus::UNSUPPORTED_FORMAT: return "unsupported_format";
    case DeidStatus::CONFIG_VALIDATION_ERROR: return "config_validation_error";
    case DeidStatus::PATTERN_COMPILE_ERROR: return "pattern_compile_error";
    case DeidStatus::FILE_NOT_FOUND: return "file_not_found";
    case DeidStatus::IO_ERROR: return "io_error";
    case DeidStatus::INVALID_PARAMETER: return "invalid_parameter";
    case DeidStatus::INTERNAL_ERROR: return "internal_error";
    default: return "unknown";
  }
}

// Human-readable message for DeidStatus
inline const char* DeidStatusToMessage(DeidStatus status) {
  switch (status) {
    case DeidStatus::OK: return "Completed successfully";
    case DeidStatus::RECOGNITION_ERROR: return "Entity recognition failed";
    case DeidStatus::FORMAT_PARSE_ERROR: return "Document could not be parsed";
    case DeidStatus::UNSUPPORTED_FORMAT: return "Unsupported file type";
    case DeidStatus::CONFIG_VALIDATION_ERROR: return "Invalid configuration";
    case DeidStatus::PATTERN_COMPILE_ERROR: return "Invalid pattern";
    case DeidStatus::FILE_NOT_FOUND: return "File not found";
    case DeidStatus::IO_ERROR: return "I/O error";
    case DeidStatus::INVALID_PARAMETER: return "Invalid parameter";
    case DeidStatus::INTERNAL_ERROR: return "Internal error";
    default: return "Unknown status";
  }
}

// True for statuses that invalidate the whole run rather than a single file
inline bool DeidStatusIsRunLevel(DeidStatus status) {
  return status == DeidStatus::CONFIG_VALIDATION_ERROR ||
         status == DeidStatus::PATTERN_COMPILE_ERROR;
}

struct DeidResult {
  bool success;               // True if operation completed successfully
  DeidStatus status;          // Detailed status code
  std::string message;        // Human-readable message

  // Optional context for error reporting
  std::string file;           // Document or config file involved
  std::string entity;         // Offending id, variant or pattern
  int line;                   // 1-based line for parse errors, 0 if unknown

  DeidResult() : success(false), status(DeidStatus::UNKNOWN), line(0) {}

  static DeidResult Success() {
    DeidResult r;
    r.success = true;
    r.status = DeidStatus::OK;
    r.message = DeidStatusToMessage(DeidStatus::OK);
    return r;
  }

  static DeidResult Failure(DeidStatus status, const std::string& msg = "") {
    DeidResult r;
    r.success = false;
    r.status = status;
    r.message = msg.empty() ? DeidStatusToMessage(status) : msg;
    return r;
  }

  static DeidResult RecognitionError(const std::string& detail) {
    DeidResult r = Failure(DeidStatus::RECOGNITION_ERROR,
                           "Entity recognition failed: " + detail);
    return r;
  }

  static DeidResult FormatParseError(const std::string& detail, int line = 0) {
    DeidResult r;
    r.success = false;
    r.status = DeidStatus::FORMAT_PARSE_ERROR;
    r.message = "Malformed document" +
                (line > 0 ? " (line " + std::to_string(line) + ")" : std::string()) +
                ": " + detail;
    r.line = line;
    return r;
  }

  static DeidResult UnsupportedFormat(const std::string& file, const std::string& extension) {
    DeidResult r = Failure(DeidStatus::UNSUPPORTED_FORMAT,
                           "Unsupported file type: " + (extension.empty() ? "(none)" : extension));
    r.file = file;
    return r;
  }

  static DeidResult ConfigValidationError(const std::string& entity, const std::string& detail) {
    DeidResult r = Failure(DeidStatus::CONFIG_VALIDATION_ERROR,
                           "Invalid configuration entry '" + entity + "': " + detail);
    r.entity = entity;
    return r;
  }

  static DeidResult PatternCompileError(const std::string& id, const std::string& pattern,
                                        const std::string& detail) {
    DeidResult r = Failure(DeidStatus::PATTERN_COMPILE_ERROR,
                           "Pattern for " + id + " does not compile (" + pattern + "): " + detail);
    r.entity = id;
    return r;
  }

  static DeidResult FileNotFound(const std::string& file) {
    DeidResult r = Failure(DeidStatus::FILE_NOT_FOUND, "File not found: " + file);
    r.file = file;
    return r;
  }

  static DeidResult IoError(const std::string& file, const std::string& detail) {
    DeidResult r = Failure(DeidStatus::IO_ERROR, "I/O error on " + file + ": " + detail);
    r.file = file;
    return r;
  }

  static DeidResult InvalidParameter(const std::string& name, const std::string& detail) {
    DeidResult r = Failure(DeidStatus::INVALID_PARAMETER,
                           "Invalid value for " + name + ": " + detail);
    r.entity = name;
    return r;
  }

  // Attach the file being processed; keeps an already-set file
  DeidResult& InFile(const std::string& path) {
    if (file.empty()) {
      file = path;
    }
    return *this;
  }

  std::string ToString() const {
    std::ostringstream oss;
    oss << "[" << DeidStatusToCode(status) << "] ";
    if (!file.empty() && message.find(file) == std::string::npos) {
      oss << file << ": ";
    }
    oss << message;
    return oss.str();
  }
};
