#include "process.hpp"
#include "platform.hpp"
#include <fmt/format.h>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/stat.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <cerrno>
#endif

#include <cstdlib>
#include <cstring>
#include <sstream>

#ifndef _WIN32
extern char** environ;
#endif

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    win_pid_ = other.win_pid_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
    other.win_pid_ = -1;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
    exited_ = other.exited_;
    exit_code_ = other.exit_code_;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        win_pid_ = other.win_pid_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
        other.win_pid_ = -1;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
        exited_ = other.exited_;
        exit_code_ = other.exit_code_;
    }
    return *this;
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

int ProcessHandle::pid() const {
#ifdef _WIN32
    return win_pid_;
#else
    return pid_;
#endif
}

#ifndef _WIN32
static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}
#endif

int ProcessHandle::wait(int timeout_ms) {
    if (exited_) return exit_code_;
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    DWORD ms = (timeout_ms < 0) ? INFINITE : static_cast<DWORD>(timeout_ms);
    if (WaitForSingleObject(handle_, ms) != WAIT_OBJECT_0) return -1;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    exited_ = true;
    exit_code_ = static_cast<int>(code);
    return exit_code_;
#else
    if (pid_ <= 0) return -1;
    if (timeout_ms < 0) {
        int status = 0;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret != pid_) return -1;
        exited_ = true;
        exit_code_ = decode_status(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (true) {
        int status = 0;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            exited_ = true;
            exit_code_ = decode_status(status);
            return exit_code_;
        }
        if (ret < 0 && errno != EINTR) return -1;
        if (elapsed >= timeout_ms) break;
        sleep_ms(10);
        elapsed += 10;
    }
    return -1;  // timed out
#endif
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

static std::string build_environment_block(const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> vars;
    LPCH env = GetEnvironmentStringsA();
    if (env) {
        for (LPCH p = env; *p; p += std::strlen(p) + 1) {
            std::string entry(p);
            auto eq = entry.find('=', 1);
            if (eq == std::string::npos) continue;
            vars[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        FreeEnvironmentStringsA(env);
    }
    for (const auto& [k, v] : extra) vars[k] = v;

    std::string block;
    for (const auto& [k, v] : vars) {
        block += k + "=" + v;
        block.push_back('\0');
    }
    block.push_back('\0');
    return block;
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options) {
    ProcessHandle handle;

    // Build command line
    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    HANDLE hOut = INVALID_HANDLE_VALUE;
    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    hOut = CreateFileA(options.output_log.empty() ? "NUL" : options.output_log.c_str(),
                       FILE_APPEND_DATA, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                       OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (hOut == INVALID_HANDLE_VALUE) {
        return Result<ProcessHandle>::Err(
            fmt::format("open {} failed (error {})", options.output_log, GetLastError()));
    }
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdError = hOut;
    si.hStdOutput = hOut;
    si.hStdInput = nullptr;

    std::string env_block;
    if (!options.environment.empty()) env_block = build_environment_block(options.environment);

    DWORD flags = options.detach ? (DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP) : 0;
    BOOL ok = CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE, flags,
                             env_block.empty() ? nullptr : env_block.data(),
                             options.workdir.empty() ? nullptr : options.workdir.c_str(),
                             &si, &pi);
    DWORD err = GetLastError();
    CloseHandle(hOut);

    if (!ok) {
        return Result<ProcessHandle>::Err(
            fmt::format("CreateProcess {} failed (error {})", program, err));
    }
    handle.handle_ = pi.hProcess;
    handle.thread_ = pi.hThread;
    handle.win_pid_ = static_cast<int>(pi.dwProcessId);
    return Result<ProcessHandle>::Ok(std::move(handle));
}

#else // Unix

// Child-side setup stages, reported back over the error pipe.
enum class ChildStage : int { Session, Chdir, Stdin, Output, Exec };

struct ChildFailure {
    ChildStage stage;
    int err;
};

static const char* stage_name(ChildStage stage) {
    switch (stage) {
        case ChildStage::Session: return "setsid";
        case ChildStage::Chdir:   return "chdir";
        case ChildStage::Stdin:   return "open /dev/null";
        case ChildStage::Output:  return "open output log";
        case ChildStage::Exec:    return "exec";
    }
    return "spawn";
}

// Resolve a bare program name against PATH, like execvp would.
static std::string resolve_program(const std::string& program) {
    if (program.find('/') != std::string::npos) return program;
    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/bin:/bin";
    std::istringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return "";
}

static std::vector<std::string> build_environment(const std::map<std::string, std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && extra.count(entry.substr(0, eq))) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [k, v] : extra) env.push_back(k + "=" + v);
    return env;
}

static void report_and_exit(int fd, ChildStage stage) {
    ChildFailure f{stage, errno};
    ssize_t n = write(fd, &f, sizeof(f));
    (void)n;
    _exit(127);
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options) {
    ProcessHandle handle;

    std::string exec_path = resolve_program(program);
    if (exec_path.empty()) {
        return Result<ProcessHandle>::Err(fmt::format("{}: command not found", program));
    }

    // Everything the child touches is prepared before fork(); between fork
    // and exec only async-signal-safe calls are allowed.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env = build_environment(options.environment);
    std::vector<const char*> envp;
    for (const auto& e : env) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    const char* output = options.output_log.empty() ? "/dev/null" : options.output_log.c_str();
    const char* workdir = options.workdir.empty() ? nullptr : options.workdir.c_str();

    int err_pipe[2];
#ifdef __linux__
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessHandle>::Err(fmt::format("pipe: {}", std::strerror(errno)));
    }
#else
    if (pipe(err_pipe) != 0) {
        return Result<ProcessHandle>::Err(fmt::format("pipe: {}", std::strerror(errno)));
    }
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);
#endif

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        return Result<ProcessHandle>::Err(fmt::format("fork: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child process
        close(err_pipe[0]);

        if (options.detach && setsid() < 0) report_and_exit(err_pipe[1], ChildStage::Session);
        if (workdir && chdir(workdir) != 0) report_and_exit(err_pipe[1], ChildStage::Chdir);

        int in = open("/dev/null", O_RDONLY);
        if (in < 0) report_and_exit(err_pipe[1], ChildStage::Stdin);
        dup2(in, STDIN_FILENO);
        if (in != STDIN_FILENO) close(in);

        int out = open(output, O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (out < 0) report_and_exit(err_pipe[1], ChildStage::Output);
        dup2(out, STDOUT_FILENO);
        dup2(out, STDERR_FILENO);
        if (out != STDOUT_FILENO && out != STDERR_FILENO) close(out);

        execve(exec_path.c_str(), const_cast<char* const*>(argv.data()),
               const_cast<char* const*>(envp.data()));
        report_and_exit(err_pipe[1], ChildStage::Exec);
    }

    // Parent
    close(err_pipe[1]);
    ChildFailure failure{};
    ssize_t n;
    do {
        n = read(err_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        // Exec never happened: collect the child so it does not linger as a zombie.
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return Result<ProcessHandle>::Err(fmt::format("{} {}: {}",
            stage_name(failure.stage), program, std::strerror(failure.err)));
    }

    handle.pid_ = pid;
    return Result<ProcessHandle>::Ok(std::move(handle));
}

#endif

} // namespace platform
