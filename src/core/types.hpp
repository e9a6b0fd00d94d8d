#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Host/port pair the backend listens on. Probe target only.
struct Endpoint {
    std::string host = DEFAULT_BACKEND_HOST;
    int port = DEFAULT_BACKEND_PORT;
};

// Configuration structures
struct BackendConfig {
    Endpoint endpoint;
    std::string command;                         // run with /bin/sh -c
    std::string workdir;                         // "" = inherit supervisor's cwd
    std::string log_file;                        // child stdout/stderr, appended
    std::map<std::string, std::string> environment;
};

struct LockConfig {
    std::string dir;                             // "" = system temp directory
    std::string instance = INSTANCE_LOCK_NAME;
    std::string spawn = SPAWN_LOCK_NAME;
};

struct TimingConfig {
    int probe_timeout_ms = PROBE_TIMEOUT_MS;
    int backoff_ms = SPAWN_BACKOFF_MS;
    int max_attempts = SPAWN_MAX_ATTEMPTS;
    int exit_grace_ms = EXIT_GRACE_MS;
};

