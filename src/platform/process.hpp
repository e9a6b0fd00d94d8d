#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/types.hpp>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

struct SpawnOptions {
    std::string workdir;                          // "" = inherit
    std::string output_log;                       // stdout+stderr appended here; "" = /dev/null
    std::map<std::string, std::string> environment;  // added to / overriding the inherited env
    bool detach = false;                          // own session + process group (setsid)
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Process id of the child, -1 if invalid.
    int pid() const;

    // Wait for the process to exit. Returns the exit code; a child killed by
    // a signal reports 128 + signal number, like a shell does.
    // timeout_ms = -1 means indefinite wait. Returns -1 on timeout.
    int wait(int timeout_ms = -1);

    // True once wait() has observed the exit.
    bool exited() const { return exited_; }

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
    int win_pid_ = -1;
#else
    int pid_ = -1;
#endif
    bool exited_ = false;
    int exit_code_ = -1;

    friend Result<ProcessHandle> spawn(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const SpawnOptions& options);
};

// Spawn a child process. Errors that happen before the program starts
// running (program not found, fork/chdir/redirect/exec failure) are
// returned as Err with the OS error text.
Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options = SpawnOptions());

} // namespace platform
