#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file. A missing file yields the defaults.
    static Result<Config> load(const fs::path& path);

    // Built-in defaults, identical to loading an empty file.
    static Config defaults();

    // Accessors
    const BackendConfig& backend() const { return backend_; }
    const TimingConfig& timing() const { return timing_; }
    const fs::path& source() const { return source_; }

    // Resolved paths ("" settings fall back to the system temp directory).
    fs::path instance_lock_path() const;
    fs::path spawn_lock_path() const;
    fs::path debug_log_path() const;

public:
    Config() = default;

private:
    BackendConfig backend_;
    LockConfig locks_;
    TimingConfig timing_;
    std::string log_;
    fs::path source_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Write a commented default config. Never overwrites an existing file.
Result<void> create_default_config(const fs::path& path);
