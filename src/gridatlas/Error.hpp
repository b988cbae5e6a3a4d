#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gridatlas {

// -----------------------------------------------------------------------------
// Structured errors and warnings.
//
// Fallible functions return bool and fill an AtlasError out-parameter. The
// error carries enough context (resolution, cell, item, offending rows) for a
// caller to diagnose a failure without re-running with verbose output.
//
// Non-fatal conditions are collected as AtlasWarning entries in results.
// -----------------------------------------------------------------------------

enum class ErrorKind : std::uint8_t {
  None = 0,
  InputValidation,
  Configuration,
  Serialization,
};

const char* ErrorKindName(ErrorKind k);

// One offending input row (1-based row number in the source table, or the
// 0-based item index for programmatic input).
struct RowIssue {
  int row = -1;
  std::string itemId;
  std::string reason;
};

struct AtlasError {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  // Optional context; negative / empty means "not applicable".
  int resolution = -1;
  int col = -1;
  int row = -1;
  std::string itemId;
  std::string path;

  // Enumerated offending rows (truncated to a configured maximum).
  std::vector<RowIssue> rows;
  int totalRowIssues = 0;

  bool ok() const { return kind == ErrorKind::None; }
  void clear() { *this = AtlasError{}; }
};

// Helpers that set kind + message and return false, so call sites can write
// `return FailConfig(err, "...")`.
bool FailInput(AtlasError& err, std::string msg);
bool FailConfig(AtlasError& err, std::string msg);
bool FailSerialization(AtlasError& err, std::string msg, std::string path = {});

// Human-readable multi-line rendering (kind, message, context, rows).
std::string FormatAtlasError(const AtlasError& err);

enum class WarningKind : std::uint8_t {
  DegenerateInput = 0,
  RejectedRow,
};

const char* WarningKindName(WarningKind k);

struct AtlasWarning {
  WarningKind kind = WarningKind::DegenerateInput;
  std::string message;
  int row = -1;
  std::string itemId;
};

std::string FormatAtlasWarning(const AtlasWarning& w);

} // namespace gridatlas
