#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <supervisor/outcome.hpp>

class HubwardenCLI {
public:
    // config_path empty = ~/.hubwarden/config.yaml
    explicit HubwardenCLI(std::filesystem::path config_path = {});

    // Claim the instance, ensure the backend, then stay resident until
    // SIGINT/SIGTERM (or return right away when once is set).
    // Returns the process exit code.
    int run(bool once);

    // Probe the endpoint and show both lock files.
    int run_status();

    // Remove both lock files.
    int run_unlock();

    // Write the default config file.
    int run_init();

private:
    std::filesystem::path config_path_;
    std::optional<Config> config_;

    bool require_config();
    void print_outcome(SupervisorOutcome outcome) const;
};
