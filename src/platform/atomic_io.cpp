#include "dfy/platform.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <process.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace dfy {

namespace fs = std::filesystem;

namespace {

Result<void> write_error(const std::string& path, const std::string& what) {
    return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to write " + path + ": " + what));
}

// "<path>.<pid>.<n>.tmp" stays in the target's directory so the rename never
// crosses filesystems; the counter keeps concurrent writers in one process apart.
std::string staging_path(const std::string& path) {
    static std::atomic<unsigned> counter{0};
#ifdef _WIN32
    auto pid = _getpid();
#else
    auto pid = getpid();
#endif
    return path + "." + std::to_string(pid) + "." + std::to_string(counter++) + ".tmp";
}

// Removes the staged file unless it was renamed into place.
struct StagedFile {
    std::string path;
    bool committed = false;

    ~StagedFile() {
        if (!committed) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
};

#ifndef _WIN32
std::string errno_text() {
    return std::strerror(errno);
}

bool flush_to_disk(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// Writes all of `content`, resuming after short writes and EINTR
bool write_all(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}
#endif

} // namespace

Result<void> atomic_write_file(const std::string& path, const std::string& content) {
    StagedFile staged{staging_path(path)};

#ifdef _WIN32
    {
        std::ofstream out(staged.path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return write_error(path, "cannot create " + staged.path);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            return write_error(path, "short write to " + staged.path);
        }
    }

    if (!MoveFileExA(staged.path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        return write_error(path, "cannot replace target (error " + std::to_string(GetLastError()) + ")");
    }
    staged.committed = true;
#else
    int fd = ::open(staged.path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return write_error(path, "cannot create " + staged.path + ": " + errno_text());
    }

    bool written = write_all(fd, content) && flush_to_disk(fd);
    std::string failure = written ? std::string() : errno_text();
    if (::close(fd) != 0 && written) {
        written = false;
        failure = errno_text();
    }
    if (!written) {
        return write_error(path, failure);
    }

    if (std::rename(staged.path.c_str(), path.c_str()) != 0) {
        return write_error(path, "cannot replace target: " + errno_text());
    }
    staged.committed = true;

    // Persist the directory entry; the content is already in place, so a
    // failure here is not reported.
    std::string dir = get_parent_directory(path);
    int dir_fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_CLOEXEC);
    if (dir_fd >= 0) {
        flush_to_disk(dir_fd);
        ::close(dir_fd);
    }
#endif

    return Result<void>::ok();
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

} // namespace dfy
