#pragma once

#include <core/types.hpp>
#include <platform/process.hpp>

// Starts the sidecar backend as an independent process. The child gets its
// own session, so it keeps running after the supervisor exits.
class BackendLauncher {
public:
    explicit BackendLauncher(BackendConfig config);
    virtual ~BackendLauncher() = default;

    // Run the configured command with /bin/sh -c. Err carries the reason the
    // child could not be started (empty command, missing interpreter,
    // bad working directory, unwritable log).
    virtual Result<platform::ProcessHandle> launch();

    const BackendConfig& config() const { return config_; }

    // Where the child's stdout/stderr go.
    std::string output_log() const;

private:
    BackendConfig config_;
};
