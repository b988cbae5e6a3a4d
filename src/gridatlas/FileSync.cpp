#include "gridatlas/FileSync.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <system_error>
#include <thread>

#if defined(_WIN32)
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #include <windows.h>
#else
  #include <fcntl.h>
  #include <unistd.h>
#endif

namespace gridatlas {

namespace {

#if defined(_WIN32)

bool FlushPath(const std::filesystem::path& p, DWORD flags, const char* what, std::string& outError)
{
  HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                         FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr, OPEN_EXISTING, flags,
                         nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    outError = std::string("Unable to open ") + what + " for sync: " + p.string() + " (error " +
               std::to_string(GetLastError()) + ")";
    return false;
  }
  const BOOL ok = FlushFileBuffers(h);
  const DWORD e = ok ? 0 : GetLastError();
  CloseHandle(h);
  if (!ok) {
    outError = std::string("FlushFileBuffers failed for ") + what + ": " + p.string() + " (error " +
               std::to_string(e) + ")";
    return false;
  }
  return true;
}

#else

bool FsyncPath(const std::filesystem::path& p, int flags, const char* what, std::string& outError)
{
  const int fd = ::open(p.c_str(), flags);
  if (fd < 0) {
    outError = std::string("Unable to open ") + what + " for sync: " + p.string() + ": " + std::strerror(errno);
    return false;
  }
  if (::fsync(fd) != 0) {
    outError = std::string("fsync failed for ") + what + ": " + p.string() + ": " + std::strerror(errno);
    ::close(fd);
    return false;
  }
  ::close(fd);
  return true;
}

#endif

bool IsTransientErrno(int e)
{
  if (e == EINTR || e == EAGAIN || e == EBUSY) return true;
#ifdef ETXTBSY
  if (e == ETXTBSY) return true;
#endif
  return false;
}

// One write attempt. outTransient reports whether a retry may help.
bool TryWriteOnce(const std::filesystem::path& path, const std::filesystem::path& tmp, const std::string& bytes,
                  std::string& outError, bool& outTransient)
{
  outTransient = false;
  errno = 0;
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      outTransient = IsTransientErrno(errno);
      outError = "unable to open temp file for writing: " + tmp.string();
      return false;
    }
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f) {
      outTransient = IsTransientErrno(errno);
      outError = "write failed: " + tmp.string();
      return false;
    }
  }

  if (!SyncFile(tmp, outError)) {
    outTransient = IsTransientErrno(errno);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  std::error_code typeEc;
  if (ec && std::filesystem::is_regular_file(path, typeEc)) {
    // Some platforms refuse to rename over an existing file. Park it as .bak
    // and put it back if the second rename fails too.
    std::filesystem::path bak = path;
    bak += ".bak";
    std::error_code bakEc;
    std::filesystem::remove(bak, bakEc);
    bakEc.clear();
    std::filesystem::rename(path, bak, bakEc);
    if (!bakEc) {
      ec.clear();
      std::filesystem::rename(tmp, path, ec);
      std::error_code restoreEc;
      if (ec) {
        std::filesystem::rename(bak, path, restoreEc);
      } else {
        std::filesystem::remove(bak, restoreEc);
      }
    }
  }
  if (ec) {
    outTransient = IsTransientErrno(ec.value());
    outError = "rename failed: " + tmp.string() + " -> " + path.string() + ": " + ec.message();
    return false;
  }
  return true;
}

} // namespace

bool SyncFile(const std::filesystem::path& path, std::string& outError)
{
  outError.clear();
  if (path.empty()) {
    outError = "SyncFile path is empty";
    return false;
  }
#if defined(_WIN32)
  return FlushPath(path, FILE_ATTRIBUTE_NORMAL, "file", outError);
#else
  return FsyncPath(path, O_RDWR, "file", outError) || FsyncPath(path, O_RDONLY, "file", outError);
#endif
}

bool SyncDirectory(const std::filesystem::path& dir, std::string& outError)
{
  outError.clear();
  if (dir.empty()) {
    outError = "SyncDirectory path is empty";
    return false;
  }
#if defined(_WIN32)
  return FlushPath(dir, FILE_FLAG_BACKUP_SEMANTICS, "directory", outError);
#else
  int flags = O_RDONLY;
#ifdef O_DIRECTORY
  flags |= O_DIRECTORY;
#endif
  return FsyncPath(dir, flags, "directory", outError);
#endif
}

bool WriteFileAtomic(const std::filesystem::path& path, const std::string& bytes, int attempts, AtlasError& err)
{
  if (path.empty()) return FailSerialization(err, "output path is empty");

  std::filesystem::path tmp = path;
  tmp += ".tmp";

  const int maxAttempts = std::max(1, attempts);
  std::string lastError;
  for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
    bool transient = false;
    if (TryWriteOnce(path, tmp, bytes, lastError, transient)) {
      const std::filesystem::path parent = path.parent_path();
      std::string syncErr;
      (void)SyncDirectory(parent.empty() ? std::filesystem::path(".") : parent, syncErr);
      return true;
    }

    std::string rmErr;
    (void)RemoveFileIfExists(tmp, rmErr);

    if (!transient) break;
    if (attempt < maxAttempts) std::this_thread::sleep_for(std::chrono::milliseconds(25 * attempt));
  }

  return FailSerialization(err, lastError, path.string());
}

bool RemoveFileIfExists(const std::filesystem::path& path, std::string& outError)
{
  outError.clear();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::filesystem::remove(path, ec);
  if (ec) {
    outError = "unable to remove " + path.string() + ": " + ec.message();
    return false;
  }
  return true;
}

} // namespace gridatlas
