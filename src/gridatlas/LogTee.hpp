#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace gridatlas {

// RAII helper that copies std::cout / std::cerr output into a log file while
// it is active. Console output is unchanged.
//
// Log file lines are prefixed with a UTC timestamp and the stream tag:
//   2026-03-02T09:14:55.120Z [OUT] grid_256.json 1843 cells
//
// Existing logs are rotated: <log> -> <log>.1 -> ... up to keepFiles.

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep (0 truncates the existing file instead).
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;
  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging (stops a previous session first).
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers and close the file.
  void stop();

  bool active() const { return m_impl != nullptr; }

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace gridatlas
