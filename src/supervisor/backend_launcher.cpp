#include "backend_launcher.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>

BackendLauncher::BackendLauncher(BackendConfig config)
    : config_(std::move(config)) {}

std::string BackendLauncher::output_log() const {
    if (!config_.log_file.empty()) return config_.log_file;
    return (platform::temp_dir() / BACKEND_LOG_NAME).string();
}

Result<platform::ProcessHandle> BackendLauncher::launch() {
    if (config_.command.empty()) {
        return Result<platform::ProcessHandle>::Err("no backend command configured");
    }

    platform::SpawnOptions opts;
    opts.workdir = config_.workdir;
    opts.output_log = output_log();
    opts.environment = config_.environment;
    opts.detach = true;

    std::error_code ec;
    auto log_dir = std::filesystem::path(opts.output_log).parent_path();
    if (!log_dir.empty()) std::filesystem::create_directories(log_dir, ec);

    hubwarden_log(fmt::format("Launcher: sh -c '{}' (cwd={}, log={})",
                              config_.command,
                              opts.workdir.empty() ? "." : opts.workdir,
                              opts.output_log));

    auto result = platform::spawn("/bin/sh", {"-c", config_.command}, opts);
    if (result.is_err()) {
        hubwarden_log(fmt::format("Launcher: spawn failed: {}", result.error));
        return result;
    }
    hubwarden_log(fmt::format("Launcher: backend pid {}", result.value.pid()));
    return result;
}
