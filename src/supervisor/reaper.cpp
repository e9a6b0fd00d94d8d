#include "reaper.hpp"
#include <core/log.hpp>
#include <platform/lock_file.hpp>
#include <fmt/format.h>
#include <algorithm>

Reaper::~Reaper() {
    std::vector<std::shared_ptr<Entry>> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(entries_);
    }
    // A backend outlives its supervisor: threads still waiting are left
    // running on their own and keep their Entry alive.
    for (auto& e : local) {
        if (!e->thread.joinable()) continue;
        if (e->done.load()) {
            e->thread.join();
        } else {
            hubwarden_log(fmt::format("Reaper: detaching watch on pid {}", e->proc.pid()));
            e->thread.detach();
        }
    }
}

void Reaper::watch(platform::ProcessHandle child,
                   const std::string& lock_path,
                   ExitCallback on_exit) {
    auto entry = std::make_shared<Entry>();
    entry->proc = std::move(child);
    entry->lock_path = lock_path;
    int pid = entry->proc.pid();

    std::lock_guard<std::mutex> lock(mutex_);

    // Drop watches that already finished.
    for (auto& e : entries_) {
        if (e->done.load() && e->thread.joinable()) e->thread.join();
    }
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const std::shared_ptr<Entry>& e) {
                                      return e->done.load() && !e->thread.joinable();
                                  }),
                   entries_.end());

    entry->thread = std::thread(&Reaper::reap, entry, std::move(on_exit));
    entries_.push_back(std::move(entry));
    hubwarden_log(fmt::format("Reaper: watching pid {} (lock {})", pid, lock_path));
}

void Reaper::join_all() {
    std::vector<std::shared_ptr<Entry>> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(entries_);
    }
    for (auto& e : local) {
        if (e->thread.joinable()) e->thread.join();
    }
}

size_t Reaper::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const std::shared_ptr<Entry>& e) { return !e->done.load(); }));
}

void Reaper::reap(std::shared_ptr<Entry> entry, ExitCallback on_exit) {
    int pid = entry->proc.pid();
    int code = entry->proc.wait();
    hubwarden_log(fmt::format("Reaper: pid {} exited with {}", pid, code));

    auto released = platform::LockFile::release(entry->lock_path);
    if (released.is_err()) {
        hubwarden_log(fmt::format("Reaper: {}", released.error));
    } else {
        hubwarden_log(fmt::format("Reaper: released {}", entry->lock_path));
    }

    if (on_exit) on_exit(pid, code);
    entry->done.store(true);
}
