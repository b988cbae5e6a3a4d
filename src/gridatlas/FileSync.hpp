#pragma once

#include "gridatlas/Error.hpp"

#include <filesystem>
#include <string>

namespace gridatlas {

// Durable file replacement.
//
// Every output file is committed as:
//   1) write <path>.tmp
//   2) fsync(tmp)
//   3) rename(tmp -> path)
//   4) fsync(parent directory)
// so readers only ever observe the previous file or the complete new one.

// Flush file contents/metadata to stable storage.
bool SyncFile(const std::filesystem::path& path, std::string& outError);

// Flush directory metadata to stable storage. Some filesystems do not support
// this; callers treat a failure as non-fatal.
bool SyncDirectory(const std::filesystem::path& dir, std::string& outError);

// Atomically replace `path` with `bytes`. Transient failures (EINTR, EAGAIN,
// EBUSY, ETXTBSY) are retried up to `attempts` times in total with a short
// backoff. The temp file is removed on every failure path.
//
// On failure err.kind == ErrorKind::Serialization and err.path == path.
bool WriteFileAtomic(const std::filesystem::path& path, const std::string& bytes, int attempts, AtlasError& err);

// Remove a file if present. Returns false only when it exists and could not
// be removed.
bool RemoveFileIfExists(const std::filesystem::path& path, std::string& outError);

} // namespace gridatlas
