//! # Scoped Temporary File
//!
//! Owns a uniquely named file in the system temp directory holding the
//! source text of one benchmark. The file is removed when the guard is
//! destroyed, whichever way the owning scope is left.

#pragma once

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace compbench::bench {

class ScopedTempFile {
public:
    /// Creates `<tmpdir>/compbench-XXXXXX<suffix>` and writes `contents` to it.
    static Result<ScopedTempFile, std::string> create(std::string_view contents,
                                                      std::string_view suffix = ".js");

    ScopedTempFile(ScopedTempFile&& other) noexcept;
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    ~ScopedTempFile();

    const std::filesystem::path& path() const {
        return path_;
    }

private:
    explicit ScopedTempFile(std::filesystem::path path) : path_(std::move(path)) {}

    void remove() noexcept;

    std::filesystem::path path_;
};

} // namespace compbench::bench
