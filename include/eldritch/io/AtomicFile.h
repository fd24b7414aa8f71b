// include/eldritch/io/AtomicFile.h
//
// Durable, atomic file writes and whole-file reads (std::filesystem).
//
//  - Data is written to a sibling temp file, flushed, then renamed over the
//    destination. A crash mid-write leaves the previous file intact.
//  - With make_backup, an existing destination is first copied to "<final>.bak".

#pragma once

#include <filesystem>
#include <string>

namespace eldritch::io {

namespace fs = std::filesystem;

/// Atomically write the full contents of `bytes` to `final_path`.
/// Missing parent directories are created.
///
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                const std::string& bytes,
                                std::string* err = nullptr,
                                bool make_backup = false);

/// Read the entire file at `path` into `out`.
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

} // namespace eldritch::io
