#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".hubwarden";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    std::string default_config = fmt::format(R"(# hubwarden configuration

backend:
  host: "{}"
  port: {}
  # Shell command that starts the backend (run with /bin/sh -c).
  # Leave unset to use the built-in venv + uvicorn command.
  # command: ""
  workdir: ""                      # "" = directory hubwarden was started from
  log: ""                          # "" = <temp>/{}
  environment: {{}}

locks:
  dir: ""                          # "" = system temp directory
  instance: "{}"
  spawn: "{}"

timing:
  probe_timeout_ms: {}
  backoff_ms: {}
  max_attempts: {}
  exit_grace_ms: {}

log: ""                            # "" = <temp>/{}
)",
        DEFAULT_BACKEND_HOST, DEFAULT_BACKEND_PORT, BACKEND_LOG_NAME,
        INSTANCE_LOCK_NAME, SPAWN_LOCK_NAME,
        PROBE_TIMEOUT_MS, SPAWN_BACKOFF_MS, SPAWN_MAX_ATTEMPTS, EXIT_GRACE_MS,
        DEBUG_LOG_NAME);

    try {
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static BackendConfig parse_backend_config(const YAML::Node& node) {
    BackendConfig backend;
    backend.endpoint.host = node["host"].as<std::string>(DEFAULT_BACKEND_HOST);
    backend.endpoint.port = node["port"].as<int>(DEFAULT_BACKEND_PORT);
    backend.command = node["command"].as<std::string>("");
    backend.workdir = node["workdir"].as<std::string>("");
    backend.log_file = node["log"].as<std::string>("");

    if (node["environment"] && node["environment"].IsMap()) {
        for (const auto& kv : node["environment"]) {
            backend.environment[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }

    if (backend.command.empty()) {
        backend.command = fmt::format(DEFAULT_BACKEND_COMMAND,
                                      backend.endpoint.host, backend.endpoint.port);
    }
    return backend;
}

static LockConfig parse_lock_config(const YAML::Node& node) {
    LockConfig locks;
    locks.dir = node["dir"].as<std::string>("");
    locks.instance = node["instance"].as<std::string>(INSTANCE_LOCK_NAME);
    locks.spawn = node["spawn"].as<std::string>(SPAWN_LOCK_NAME);
    return locks;
}

static TimingConfig parse_timing_config(const YAML::Node& node) {
    TimingConfig timing;
    timing.probe_timeout_ms = node["probe_timeout_ms"].as<int>(PROBE_TIMEOUT_MS);
    timing.backoff_ms = node["backoff_ms"].as<int>(SPAWN_BACKOFF_MS);
    timing.max_attempts = node["max_attempts"].as<int>(SPAWN_MAX_ATTEMPTS);
    timing.exit_grace_ms = node["exit_grace_ms"].as<int>(EXIT_GRACE_MS);
    return timing;
}

static Result<void> validate(const BackendConfig& backend, const LockConfig& locks,
                             const TimingConfig& timing) {
    if (backend.endpoint.port <= 0 || backend.endpoint.port > 65535) {
        return Result<void>::Err(fmt::format("backend.port out of range: {}", backend.endpoint.port));
    }
    if (backend.endpoint.host.empty()) {
        return Result<void>::Err("backend.host is empty");
    }
    if (locks.instance.empty() || locks.spawn.empty()) {
        return Result<void>::Err("locks.instance and locks.spawn must be set");
    }
    if (locks.instance == locks.spawn) {
        return Result<void>::Err("locks.instance and locks.spawn must differ");
    }
    if (timing.max_attempts < 1) {
        return Result<void>::Err(fmt::format("timing.max_attempts must be >= 1, got {}", timing.max_attempts));
    }
    if (timing.probe_timeout_ms < 0 || timing.backoff_ms < 0 || timing.exit_grace_ms < 0) {
        return Result<void>::Err("timing values must not be negative");
    }
    return Result<void>::Ok();
}

Config Config::defaults() {
    Config config;
    config.backend_ = parse_backend_config(YAML::Node());
    return config;
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        Config config = defaults();
        config.source_ = path;
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.backend_ = parse_backend_config(root["backend"] ? root["backend"] : YAML::Node());
        config.locks_ = parse_lock_config(root["locks"] ? root["locks"] : YAML::Node());
        config.timing_ = parse_timing_config(root["timing"] ? root["timing"] : YAML::Node());
        config.log_ = root["log"].as<std::string>("");
        config.source_ = path;

        auto valid = validate(config.backend_, config.locks_, config.timing_);
        if (valid.is_err()) {
            return Result<Config>::Err(fmt::format("Invalid config {}: {}", path.string(), valid.error));
        }
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

static fs::path lock_dir(const LockConfig& locks) {
    return locks.dir.empty() ? platform::temp_dir() : fs::path(locks.dir);
}

fs::path Config::instance_lock_path() const {
    return lock_dir(locks_) / locks_.instance;
}

fs::path Config::spawn_lock_path() const {
    return lock_dir(locks_) / locks_.spawn;
}

fs::path Config::debug_log_path() const {
    if (!log_.empty()) return fs::path(log_);
    return platform::temp_dir() / DEBUG_LOG_NAME;
}
