#include "lock_file.hpp"
#include "platform.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

#ifdef _WIN32
#  include <io.h>
#  include <fcntl.h>
#  include <sys/stat.h>
#else
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace platform {

static bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
#ifdef _WIN32
        int n = _write(fd, data.data() + written,
                       static_cast<unsigned>(data.size() - written));
#else
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
#endif
        if (n <= 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

static bool sync_fd(int fd) {
#ifdef _WIN32
    return _commit(fd) == 0;
#else
    return fsync(fd) == 0;
#endif
}

LockFile::LockFile(const std::string& lock_path) : path_(lock_path) {
    std::error_code ec;
    auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

#ifdef _WIN32
    fd_ = _open(lock_path.c_str(), _O_CREAT | _O_EXCL | _O_WRONLY | _O_NOINHERIT, _S_IREAD | _S_IWRITE);
#else
    fd_ = ::open(lock_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
#endif
    if (fd_ < 0) {
        int err = errno;
        if (err == EEXIST) {
            contended_ = true;
        } else {
            error_ = std::strerror(err);
            hubwarden_log(fmt::format("LockFile: open {} failed: {}", path_, error_));
        }
        return;
    }

    auto written = write_owner(current_pid());
    if (written.is_err()) {
        // An empty lock file would be indistinguishable from a crashed
        // writer, so give the lock back instead.
        error_ = written.error;
#ifdef _WIN32
        _close(fd_);
#else
        ::close(fd_);
#endif
        fd_ = -1;
        std::filesystem::remove(path_, ec);
        hubwarden_log(fmt::format("LockFile: {} dropped, owner write failed: {}", path_, error_));
    }
}

LockFile::~LockFile() {
    if (fd_ < 0) return;
#ifdef _WIN32
    _close(fd_);
#else
    ::close(fd_);
#endif
}

Result<void> LockFile::write_owner(int pid) {
    if (fd_ < 0) {
        return Result<void>::Err("lock not held: " + path_);
    }
#ifdef _WIN32
    if (_chsize(fd_, 0) != 0 || _lseek(fd_, 0, SEEK_SET) < 0) {
#else
    if (ftruncate(fd_, 0) != 0 || lseek(fd_, 0, SEEK_SET) < 0) {
#endif
        return Result<void>::Err(fmt::format("truncate {}: {}", path_, std::strerror(errno)));
    }
    if (!write_all(fd_, fmt::format("{}\n", pid))) {
        return Result<void>::Err(fmt::format("write {}: {}", path_, std::strerror(errno)));
    }
    if (!sync_fd(fd_)) {
        return Result<void>::Err(fmt::format("sync {}: {}", path_, std::strerror(errno)));
    }
    return Result<void>::Ok();
}

Result<void> LockFile::release(const std::string& lock_path) {
    std::error_code ec;
    std::filesystem::remove(lock_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Result<void>::Err(fmt::format("remove {}: {}", lock_path, ec.message()));
    }
    return Result<void>::Ok();
}

std::optional<int> LockFile::read_owner(const std::string& lock_path) {
    std::error_code ec;
    if (!std::filesystem::exists(lock_path, ec)) return std::nullopt;
    std::string content = read_file(lock_path);
    trim(content);
    int pid = safe_stoi(content, -1);
    if (pid <= 0) return std::nullopt;
    return pid;
}

} // namespace platform
