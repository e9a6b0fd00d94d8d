#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

namespace platform {

// Exclusive lock file. Acquisition is a single atomic create-if-absent
// (O_CREAT | O_EXCL), so any number of racing processes get exactly one
// winner. The file holds the owner's pid in decimal.
//
// Destroying a LockFile closes its descriptor but leaves the file in
// place; the lock only goes away through release().
class LockFile {
public:
    // Attempts to acquire the lock and record the calling process's pid.
    // Check held() / contended() after construction. Never blocks or retries.
    explicit LockFile(const std::string& lock_path);
    ~LockFile();

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    // True if this object created the file.
    bool held() const { return fd_ >= 0; }

    // True if the file already existed (someone else holds the lock).
    bool contended() const { return contended_; }

    // OS error text when acquisition failed for any reason other than contention.
    const std::string& error() const { return error_; }

    const std::string& path() const { return path_; }

    // Replace the recorded pid and flush it to disk.
    Result<void> write_owner(int pid);

    // Delete the lock file. Missing file is not an error.
    static Result<void> release(const std::string& lock_path);

    // Pid recorded in the lock file, if the file exists and parses.
    static std::optional<int> read_owner(const std::string& lock_path);

private:
    std::string path_;
    int fd_ = -1;
    bool contended_ = false;
    std::string error_;
};

} // namespace platform
