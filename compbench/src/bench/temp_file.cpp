#include "bench/temp_file.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace compbench::bench {

namespace {

// write(2) until everything is out or a real error occurs
bool write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

} // namespace

Result<ScopedTempFile, std::string> ScopedTempFile::create(std::string_view contents,
                                                           std::string_view suffix) {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        return "cannot locate temp directory: " + ec.message();
    }

    std::string pattern = (dir / "compbench-XXXXXX").string();
    pattern.append(suffix);

    // mkstemps rewrites the X's in place
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return "cannot create temp file " + pattern + ": " + std::strerror(errno);
    }

    // Owned from here on: any early return below deletes the file.
    ScopedTempFile file{fs::path(buf.data())};

    bool written = write_all(fd, contents);
    int write_errno = errno;
    if (::close(fd) != 0 && written) {
        written = false;
        write_errno = errno;
    }
    if (!written) {
        return "cannot write temp file " + file.path_.string() + ": " +
               std::strerror(write_errno);
    }

    COMPBENCH_LOG_DEBUG("bench", "Materialized " << contents.size() << " bytes at " << file.path_);
    return file;
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScopedTempFile::~ScopedTempFile() {
    remove();
}

void ScopedTempFile::remove() noexcept {
    if (path_.empty())
        return;

    std::error_code ec;
    if (!fs::remove(path_, ec) && ec) {
        COMPBENCH_LOG_WARN("bench", "Failed to remove temp file " << path_ << ": "
                                                                  << ec.message());
    } else {
        COMPBENCH_LOG_TRACE("bench", "Removed temp file " << path_);
    }
    path_.clear();
}

} // namespace compbench::bench
