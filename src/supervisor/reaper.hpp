#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>
#include <platform/process.hpp>

// Waits for spawned backends to exit and removes their spawn lock.
// One background thread per child; no restart.
class Reaper {
public:
    using ExitCallback = std::function<void(int pid, int exit_code)>;

    Reaper() = default;
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    // Take ownership of child and release lock_path once it exits, whatever
    // the exit code. on_exit runs on the reaper thread after the release and
    // must stay callable for as long as the child may run.
    void watch(platform::ProcessHandle child,
               const std::string& lock_path,
               ExitCallback on_exit = nullptr);

    // Block until every watched child has exited and been reaped.
    void join_all();

    // Children still running.
    size_t active() const;

private:
    struct Entry {
        platform::ProcessHandle proc;
        std::string lock_path;
        std::thread thread;
        std::atomic<bool> done{false};
    };
    std::vector<std::shared_ptr<Entry>> entries_;
    mutable std::mutex mutex_;

    static void reap(std::shared_ptr<Entry> entry, ExitCallback on_exit);
};
