// src/core/AtomicFile.h
//
// Durable whole-file writes: data goes to a sibling "<final>.tmp", is flushed,
// then renamed over the destination, so readers never see a half-written file.
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace brazier::io {

namespace fs = std::filesystem;

/// Atomically write `bytes` to `final_path`, creating parent directories.
///
/// @param err  Optional: receives a human-readable error on failure.
/// @return true on success.
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr);

/// Read the entire file at `path` into `out`. False if it cannot be opened.
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

} // namespace brazier::io
