// src/io/FileOps.h
//
// Thin wrappers over std::filesystem for the handful of operations the
// profile manager performs. All of them use the error_code overloads and
// report failures as core::Status (ErrorKind::IOError) instead of throwing.

#pragma once

#include "core/Status.h"

#include <filesystem>

namespace gw2util::io {

namespace fs = std::filesystem;

/// True if `p` exists.
///
/// When the existence check itself fails (e.g. permission denied on a parent
/// directory) this also returns true, so the follow-up operation runs and
/// reports the real error instead of silently skipping a step.
[[nodiscard]] bool Exists(const fs::path& p) noexcept;

/// Copy `src` over `dst` byte-for-byte, replacing `dst` if present.
[[nodiscard]] core::Status Copy(const fs::path& src, const fs::path& dst);

/// Rename `from` to `to`, replacing `to` if present.
[[nodiscard]] core::Status Rename(const fs::path& from, const fs::path& to);

/// Remove `p`. Removing a path that does not exist is not an error.
[[nodiscard]] core::Status Remove(const fs::path& p);

/// Create `dir` and any missing parents.
[[nodiscard]] core::Status EnsureDirectory(const fs::path& dir);

} // namespace gw2util::io
