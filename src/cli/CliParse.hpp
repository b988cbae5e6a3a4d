#pragma once

// Small CLI parsing helpers shared by the gridatlas tool and its tests.
//
// All parsers are strict: the whole token must parse, floats must be finite,
// and nothing is written to the output on failure.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace gridatlas::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  // strtod accepts the same spellings on every platform; keep it strict.
  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0) return false;
  if (!end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseBool01(std::string_view text, bool* out)
{
  if (!out) return false;
  std::string s(text);
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  if (s == "0" || s == "false" || s == "off" || s == "no") {
    *out = false;
    return true;
  }
  if (s == "1" || s == "true" || s == "on" || s == "yes") {
    *out = true;
    return true;
  }
  return false;
}

// Comma separated tokens; whitespace is dropped and empty tokens are skipped.
inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

// "64,128,256" -> {64, 128, 256}. Every entry must be a positive integer.
inline bool ParseResolutionList(std::string_view s, std::vector<int>* out)
{
  if (!out) return false;
  const std::vector<std::string> parts = SplitCommaList(s);
  if (parts.empty()) return false;

  std::vector<int> res;
  res.reserve(parts.size());
  for (const std::string& p : parts) {
    int v = 0;
    if (!ParseI32(p, &v) || v <= 0) return false;
    res.push_back(v);
  }
  *out = std::move(res);
  return true;
}

inline std::string HexU64(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
  return oss.str();
}

} // namespace gridatlas::cli
