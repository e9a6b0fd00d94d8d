#pragma once

#include <string>
#include <memory>
#include <functional>
#include <core/config.hpp>
#include <platform/lock_file.hpp>
#include "outcome.hpp"
#include "liveness_probe.hpp"
#include "backend_launcher.hpp"
#include "reaper.hpp"

// Runs the two startup protocols of the supervisor:
//
//   claim_instance()  at most one supervisor per instance lock path.
//   ensure_backend()  probe the endpoint and, if nothing answers, become the
//                     sole process that launches the backend. Contended spawn
//                     locks are treated as stale when the endpoint is still
//                     down, removed, and retried after a backoff, up to
//                     timing.max_attempts cycles.
//
// Both calls are synchronous and run on the caller's thread. The only shared
// state with other processes is the two lock files and the backend port.
class Coordinator {
public:
    // (event, payload), e.g. ("backend-started", "spawned"),
    // ("already-running", "another-instance") or
    // ("instance-lock-error", <OS error text>).
    using EventCallback = std::function<void(const std::string& event,
                                             const std::string& payload)>;

    Coordinator(const Config& config,
                LivenessProbe& prober,
                BackendLauncher& launcher,
                Reaper& reaper);

    void on_event(EventCallback cb) { on_event_ = std::move(cb); }

    InstanceClaim claim_instance();
    bool holds_instance() const { return instance_lock_ != nullptr; }

    // Remove the instance lock if this object holds it.
    Result<void> release_instance();

    // Emits exactly one backend-started event and returns the same outcome.
    SupervisorOutcome ensure_backend();

    // Number of launcher invocations made by ensure_backend().
    int launches() const { return launches_; }

    const std::string& instance_lock_path() const { return instance_lock_path_; }
    const std::string& spawn_lock_path() const { return spawn_lock_path_; }

private:
    Endpoint endpoint_;
    TimingConfig timing_;
    std::string instance_lock_path_;
    std::string spawn_lock_path_;

    LivenessProbe& prober_;
    BackendLauncher& launcher_;
    Reaper& reaper_;
    EventCallback on_event_;

    std::unique_ptr<platform::LockFile> instance_lock_;
    int launches_ = 0;

    bool backend_reachable();
    SupervisorOutcome launch_backend(platform::LockFile& spawn_lock);
    SupervisorOutcome finish(SupervisorOutcome outcome);
    void emit(const std::string& event, const std::string& payload);
};
