#include "coordinator.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

Coordinator::Coordinator(const Config& config,
                         LivenessProbe& prober,
                         BackendLauncher& launcher,
                         Reaper& reaper)
    : endpoint_(config.backend().endpoint),
      timing_(config.timing()),
      instance_lock_path_(config.instance_lock_path().string()),
      spawn_lock_path_(config.spawn_lock_path().string()),
      prober_(prober),
      launcher_(launcher),
      reaper_(reaper) {}

// ── Supervisor singleton ──────────────────────────────────

InstanceClaim Coordinator::claim_instance() {
    if (instance_lock_) return InstanceClaim::Acquired;

    auto lock = std::make_unique<platform::LockFile>(instance_lock_path_);
    if (lock->held()) {
        instance_lock_ = std::move(lock);
        hubwarden_log(fmt::format("Coordinator: instance lock {} acquired (pid {})",
                                  instance_lock_path_, platform::current_pid()));
        return InstanceClaim::Acquired;
    }

    if (lock->contended()) {
        auto owner = platform::LockFile::read_owner(instance_lock_path_);
        hubwarden_log(fmt::format("Coordinator: another supervisor holds {} (pid {})",
                                  instance_lock_path_,
                                  owner ? std::to_string(*owner) : "?"));
        emit(EVENT_ALREADY_RUNNING, PAYLOAD_ANOTHER_INSTANCE);
        return InstanceClaim::AlreadyRunning;
    }

    hubwarden_log(fmt::format("Coordinator: instance lock {} unusable: {}",
                              instance_lock_path_, lock->error()));
    emit(EVENT_INSTANCE_LOCK_ERROR, lock->error());
    return InstanceClaim::Error;
}

Result<void> Coordinator::release_instance() {
    if (!instance_lock_) return Result<void>::Ok();
    instance_lock_.reset();
    auto released = platform::LockFile::release(instance_lock_path_);
    hubwarden_log(released.is_ok()
        ? fmt::format("Coordinator: instance lock {} released", instance_lock_path_)
        : fmt::format("Coordinator: {}", released.error));
    return released;
}

// ── Backend spawn protocol ────────────────────────────────

bool Coordinator::backend_reachable() {
    bool up = prober_.probe(endpoint_, timing_.probe_timeout_ms);
    hubwarden_log(fmt::format("Coordinator: probe {}:{} -> {}",
                              endpoint_.host, endpoint_.port, up ? "open" : "closed"));
    return up;
}

SupervisorOutcome Coordinator::ensure_backend() {
    if (backend_reachable()) {
        return finish(SupervisorOutcome::AlreadyRunning);
    }

    for (int attempt = 1; attempt <= timing_.max_attempts; ++attempt) {
        hubwarden_log(fmt::format("Coordinator: attempt {}/{}", attempt, timing_.max_attempts));

        // Someone else may have brought it up in the meantime.
        if (backend_reachable()) {
            return finish(SupervisorOutcome::StartedByOther);
        }

        platform::LockFile spawn_lock(spawn_lock_path_);
        if (spawn_lock.held()) {
            return launch_backend(spawn_lock);
        }

        if (spawn_lock.contended()) {
            if (backend_reachable()) {
                return finish(SupervisorOutcome::StartedByOther);
            }
            // Holder is presumed dead before the backend bound its port. This
            // can also remove a live holder's lock that is still starting up.
            auto owner = platform::LockFile::read_owner(spawn_lock_path_);
            hubwarden_log(fmt::format("Coordinator: removing stale spawn lock {} (pid {})",
                                      spawn_lock_path_,
                                      owner ? std::to_string(*owner) : "?"));
            auto removed = platform::LockFile::release(spawn_lock_path_);
            if (removed.is_err()) {
                hubwarden_log(fmt::format("Coordinator: {}", removed.error));
            }
        } else {
            hubwarden_log(fmt::format("Coordinator: spawn lock {} unusable: {}",
                                      spawn_lock_path_, spawn_lock.error()));
        }

        if (attempt < timing_.max_attempts) {
            platform::sleep_ms(timing_.backoff_ms);
        }
    }

    hubwarden_log(fmt::format("Coordinator: gave up after {} attempts", timing_.max_attempts));
    return finish(SupervisorOutcome::SpawnFailed);
}

SupervisorOutcome Coordinator::launch_backend(platform::LockFile& spawn_lock) {
    ++launches_;
    auto child = launcher_.launch();
    if (child.is_err()) {
        hubwarden_log(fmt::format("Coordinator: launch failed: {}", child.error));
        auto released = platform::LockFile::release(spawn_lock_path_);
        if (released.is_err()) {
            hubwarden_log(fmt::format("Coordinator: {}", released.error));
        }
        return finish(SupervisorOutcome::SpawnFailed);
    }

    int pid = child.value.pid();
    auto recorded = spawn_lock.write_owner(pid);
    if (recorded.is_err()) {
        hubwarden_log(fmt::format("Coordinator: could not record backend pid: {}", recorded.error));
    }

    SupervisorOutcome outcome = finish(SupervisorOutcome::Spawned);
    reaper_.watch(std::move(child.value), spawn_lock_path_);
    return outcome;
}

SupervisorOutcome Coordinator::finish(SupervisorOutcome outcome) {
    hubwarden_log(fmt::format("Coordinator: outcome {}", outcome_name(outcome)));
    emit(EVENT_BACKEND_STARTED, outcome_name(outcome));
    return outcome;
}

void Coordinator::emit(const std::string& event, const std::string& payload) {
    if (on_event_) on_event_(event, payload);
}
