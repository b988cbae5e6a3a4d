#include "gridatlas/Error.hpp"

#include <sstream>
#include <utility>

namespace gridatlas {

const char* ErrorKindName(ErrorKind k)
{
  switch (k) {
  case ErrorKind::None: return "none";
  case ErrorKind::InputValidation: return "input_validation";
  case ErrorKind::Configuration: return "configuration";
  case ErrorKind::Serialization: return "serialization";
  default: return "unknown";
  }
}

const char* WarningKindName(WarningKind k)
{
  switch (k) {
  case WarningKind::DegenerateInput: return "degenerate_input";
  case WarningKind::RejectedRow: return "rejected_row";
  default: return "unknown";
  }
}

bool FailInput(AtlasError& err, std::string msg)
{
  err.kind = ErrorKind::InputValidation;
  err.message = std::move(msg);
  return false;
}

bool FailConfig(AtlasError& err, std::string msg)
{
  err.kind = ErrorKind::Configuration;
  err.message = std::move(msg);
  return false;
}

bool FailSerialization(AtlasError& err, std::string msg, std::string path)
{
  err.kind = ErrorKind::Serialization;
  err.message = std::move(msg);
  if (!path.empty()) err.path = std::move(path);
  return false;
}

std::string FormatAtlasError(const AtlasError& err)
{
  std::ostringstream oss;
  oss << ErrorKindName(err.kind) << " error: " << err.message;

  if (err.resolution >= 0) oss << " [resolution=" << err.resolution << "]";
  if (err.col >= 0 || err.row >= 0) oss << " [cell=" << err.col << "," << err.row << "]";
  if (!err.itemId.empty()) oss << " [item=" << err.itemId << "]";
  if (!err.path.empty()) oss << " [path=" << err.path << "]";

  for (const RowIssue& r : err.rows) {
    oss << "\n  row " << r.row;
    if (!r.itemId.empty()) oss << " (" << r.itemId << ")";
    oss << ": " << r.reason;
  }
  const int shown = static_cast<int>(err.rows.size());
  if (err.totalRowIssues > shown) {
    oss << "\n  ... and " << (err.totalRowIssues - shown) << " more";
  }
  return oss.str();
}

std::string FormatAtlasWarning(const AtlasWarning& w)
{
  std::ostringstream oss;
  oss << "warning (" << WarningKindName(w.kind) << "): " << w.message;
  if (w.row >= 0) oss << " [row=" << w.row << "]";
  if (!w.itemId.empty()) oss << " [item=" << w.itemId << "]";
  return oss.str();
}

} // namespace gridatlas
