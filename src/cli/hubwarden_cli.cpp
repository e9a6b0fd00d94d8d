#include "hubwarden_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/lock_file.hpp>
#include <platform/platform.hpp>
#include <supervisor/coordinator.hpp>
#include <fmt/format.h>
#include <csignal>
#include <iostream>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
    g_stop_requested = 1;
}

void install_stop_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
#else
    struct sigaction sa {};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

std::string owner_text(const std::string& lock_path) {
    auto owner = platform::LockFile::read_owner(lock_path);
    if (owner) return fmt::format("pid {}", *owner);
    std::error_code ec;
    return std::filesystem::exists(lock_path, ec) ? "held (no pid)" : "free";
}

} // namespace

HubwardenCLI::HubwardenCLI(std::filesystem::path config_path)
    : config_path_(config_path.empty() ? get_global_config_path() : std::move(config_path)) {}

bool HubwardenCLI::require_config() {
    if (config_) return true;
    auto result = Config::load(config_path_);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config_ = result.value;
    set_hubwarden_log_path(config_->debug_log_path().string());
    return true;
}

void HubwardenCLI::print_outcome(SupervisorOutcome outcome) const {
    const auto& ep = config_->backend().endpoint;
    std::string where = fmt::format("{}:{}", ep.host, ep.port);
    switch (outcome) {
        case SupervisorOutcome::AlreadyRunning:
            std::cout << theme::ok("Backend already running on " + where);
            break;
        case SupervisorOutcome::StartedByOther:
            std::cout << theme::ok("Backend started by another launcher on " + where);
            break;
        case SupervisorOutcome::Spawned: {
            auto owner = platform::LockFile::read_owner(config_->spawn_lock_path().string());
            std::cout << theme::ok(fmt::format("Backend spawned{} for {}",
                owner ? fmt::format(" (pid {})", *owner) : "", where));
            break;
        }
        case SupervisorOutcome::SpawnFailed:
            std::cout << theme::fail("Backend could not be started; continuing without it");
            std::cout << theme::step("See " + config_->debug_log_path().string());
            break;
    }
}

int HubwardenCLI::run(bool once) {
    if (!require_config()) return 1;
    const Config& config = *config_;

    LivenessProbe prober;
    BackendLauncher launcher(config.backend());
    Reaper reaper;
    Coordinator coordinator(config, prober, launcher, reaper);
    coordinator.on_event([](const std::string& event, const std::string& payload) {
        hubwarden_log(fmt::format("Event: {} {}", event, payload));
    });

    auto claim = coordinator.claim_instance();
    if (claim != InstanceClaim::Acquired) {
        if (claim == InstanceClaim::AlreadyRunning) {
            std::cout << theme::info(fmt::format("Another supervisor is already running ({})",
                owner_text(coordinator.instance_lock_path())));
        } else {
            std::cout << theme::fail("Cannot create " + coordinator.instance_lock_path());
        }
        std::cout.flush();
        // Let collaborators observe the diagnostic before this instance goes away.
        platform::sleep_ms(config.timing().exit_grace_ms);
        return claim == InstanceClaim::AlreadyRunning ? 0 : 1;
    }

    SupervisorOutcome outcome = coordinator.ensure_backend();
    print_outcome(outcome);

    if (!once) {
        install_stop_handlers();
        std::cout << theme::step("Supervising. Press Ctrl-C to exit (the backend keeps running).");
        std::cout.flush();
        while (!g_stop_requested) {
            platform::sleep_ms(RESIDENT_POLL_MS);
        }
        std::cout << "\n";
    }

    auto released = coordinator.release_instance();
    if (released.is_err()) {
        std::cout << theme::fail(released.error);
        return 1;
    }
    return 0;
}

int HubwardenCLI::run_status() {
    if (!require_config()) return 1;
    const Config& config = *config_;
    const auto& ep = config.backend().endpoint;

    LivenessProbe prober;
    bool up = prober.probe(ep, config.timing().probe_timeout_ms);

    std::cout << theme::section("Status");
    std::cout << theme::kv("backend", fmt::format("{}:{} {}", ep.host, ep.port,
        up ? theme::green("reachable") : theme::red("unreachable")));
    std::cout << theme::kv("instance", fmt::format("{} ({})",
        config.instance_lock_path().string(), owner_text(config.instance_lock_path().string())));
    std::cout << theme::kv("spawn", fmt::format("{} ({})",
        config.spawn_lock_path().string(), owner_text(config.spawn_lock_path().string())));
    std::cout << theme::kv("config", config.source().string());
    std::cout << theme::kv("log", config.debug_log_path().string());
    std::cout << "\n";
    return 0;
}

int HubwardenCLI::run_unlock() {
    if (!require_config()) return 1;
    int rc = 0;
    for (const auto& path : {config_->instance_lock_path(), config_->spawn_lock_path()}) {
        auto released = platform::LockFile::release(path.string());
        if (released.is_err()) {
            std::cout << theme::fail(released.error);
            rc = 1;
        } else {
            std::cout << theme::ok("Released " + path.string());
            hubwarden_log(fmt::format("CLI: released {}", path.string()));
        }
    }
    return rc;
}

int HubwardenCLI::run_init() {
    if (std::filesystem::exists(config_path_)) {
        std::cout << theme::info(config_path_.string() + " already exists");
        return 0;
    }
    auto result = create_default_config(config_path_);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + config_path_.string());
    return 0;
}
