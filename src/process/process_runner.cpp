//! # Process Runner
//!
//! Child process execution with output capture, per-child environment
//! overrides, timeouts and interrupt forwarding.
//!
//! ## Platform Support
//!
//! - **Unix**: fork + execve, both pipes drained with poll() so a chatty
//!   child (pip, the freezer) cannot fill one pipe and stall. The child leads
//!   its own process group, and timeouts and forwarded signals go to the
//!   whole group so compilers started by pip stop with it
//! - **Windows**: CreateProcess with an explicit environment block inside a
//!   Job Object; both pipes are drained on helper threads while the caller
//!   waits with the timeout, and the job is terminated as a whole

#include "log/log.hpp"
#include "process/process.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <thread>
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;
#endif

namespace lspack::proc {

using Clock = std::chrono::steady_clock;

#ifndef _WIN32
constexpr auto kPipeGrace = std::chrono::seconds(2);
#endif

namespace {

std::atomic<bool> g_interrupted{false};

#ifdef _WIN32
std::atomic<HANDLE> g_child_job{nullptr};
#else
std::atomic<pid_t> g_child_pid{0};
struct sigaction g_prev_sigint;
struct sigaction g_prev_sigterm;
#endif

std::string last_nonempty_line(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t") != std::string::npos)
            last = line;
    }
    return last;
}

} // namespace

// ============================================================================
// ProcessSpec / ProcessResult
// ============================================================================

std::string ProcessSpec::command_line() const {
    std::ostringstream oss;
    auto append = [&oss](const std::string& word) {
        if (word.empty() || word.find_first_of(" \t\"'") != std::string::npos) {
            oss << '\'' << word << '\'';
        } else {
            oss << word;
        }
    };
    append(program);
    for (const auto& arg : args) {
        oss << ' ';
        append(arg);
    }
    return oss.str();
}

std::string ProcessResult::failure_summary() const {
    if (!launched) {
        return "could not launch: " + last_nonempty_line(stderr_output);
    }
    if (interrupted) {
        return "interrupted";
    }
    if (timed_out) {
        return "timed out";
    }

    std::string summary = "exit code " + std::to_string(exit_code);
    std::string detail = last_nonempty_line(stderr_output);
    if (detail.empty()) {
        detail = last_nonempty_line(stdout_output);
    }
    if (!detail.empty()) {
        summary += ": " + detail;
    }
    return summary;
}

// ============================================================================
// Environment Helpers
// ============================================================================

char path_list_separator() {
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
#ifdef _WIN32
    LPCH block = GetEnvironmentStringsA();
    if (block == nullptr) {
        return env;
    }
    for (LPCH p = block; *p != '\0'; p += std::strlen(p) + 1) {
        std::string entry(p);
        size_t eq = entry.find('=', 1); // entries like "=C:=C:\\" start with '='
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    FreeEnvironmentStringsA(block);
#else
    for (char** p = environ; p != nullptr && *p != nullptr; ++p) {
        std::string entry(*p);
        size_t eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
#endif
    return env;
}

std::map<std::string, std::string>
compose_environment(std::map<std::string, std::string> base,
                    const std::map<std::string, std::string>& overrides,
                    const std::vector<std::string>& unset) {
    for (const auto& name : unset) {
        base.erase(name);
    }
    for (const auto& [name, value] : overrides) {
        base[name] = value;
    }
    return base;
}

static bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

std::optional<fs::path> find_program(const std::string& name, const std::string& path_value) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto check = [](const fs::path& candidate) -> std::optional<fs::path> {
        if (is_executable_file(candidate)) {
            return candidate;
        }
#ifdef _WIN32
        if (!candidate.has_extension()) {
            fs::path with_exe = candidate;
            with_exe += ".exe";
            if (is_executable_file(with_exe)) {
                return with_exe;
            }
        }
#endif
        return std::nullopt;
    };

    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return check(fs::path(name));
    }

    const char sep = path_list_separator();
    size_t pos = 0;
    while (pos <= path_value.size()) {
        size_t next = path_value.find(sep, pos);
        if (next == std::string::npos) {
            next = path_value.size();
        }
        std::string dir = path_value.substr(pos, next - pos);
        if (!dir.empty()) {
            if (auto found = check(fs::path(dir) / name)) {
                return found;
            }
        }
        pos = next + 1;
    }

    return std::nullopt;
}

// ============================================================================
// Interrupt Forwarding
// ============================================================================

bool interrupt_requested() {
    return g_interrupted.load();
}

void clear_interrupt() {
    g_interrupted.store(false);
}

void request_interrupt() {
    g_interrupted.store(true);
}

#ifdef _WIN32

static BOOL WINAPI forward_console_event(DWORD event) {
    if (event == CTRL_C_EVENT || event == CTRL_BREAK_EVENT || event == CTRL_CLOSE_EVENT) {
        g_interrupted.store(true);
        HANDLE job = g_child_job.load();
        if (job != nullptr) {
            TerminateJobObject(job, 130);
        }
        return TRUE;
    }
    return FALSE;
}

InterruptGuard::InterruptGuard() {
    SetConsoleCtrlHandler(forward_console_event, TRUE);
}

InterruptGuard::~InterruptGuard() {
    SetConsoleCtrlHandler(forward_console_event, FALSE);
}

#else

extern "C" void lspack_forward_signal(int sig) {
    g_interrupted.store(true);
    pid_t pid = g_child_pid.load();
    if (pid > 0) {
        kill(-pid, sig);
    }
}

InterruptGuard::InterruptGuard() {
    struct sigaction action {};
    action.sa_handler = lspack_forward_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, &g_prev_sigint);
    sigaction(SIGTERM, &action, &g_prev_sigterm);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &g_prev_sigint, nullptr);
    sigaction(SIGTERM, &g_prev_sigterm, nullptr);
}

#endif

// ============================================================================
// SystemProcessRunner
// ============================================================================

#ifdef _WIN32

static std::string quote_windows_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
        } else if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out += '"';
            backslashes = 0;
        } else {
            out.append(backslashes, '\\');
            out += c;
            backslashes = 0;
        }
    }
    out.append(backslashes * 2, '\\');
    out += '"';
    return out;
}

static std::string read_pipe(HANDLE pipe) {
    std::string result;
    char buffer[4096];
    DWORD bytes_read = 0;
    while (ReadFile(pipe, buffer, sizeof(buffer), &bytes_read, nullptr) && bytes_read > 0) {
        result.append(buffer, bytes_read);
    }
    return result;
}

ProcessResult SystemProcessRunner::run(const ProcessSpec& spec) {
    auto start = Clock::now();
    ProcessResult result;

    if (interrupt_requested()) {
        result.interrupted = true;
        return result;
    }

    auto env = compose_environment(current_environment(), spec.env_overrides, spec.env_unset);
    auto path_it = env.find("PATH");
    if (path_it == env.end()) {
        path_it = env.find("Path");
    }
    auto exe = find_program(spec.program, path_it != env.end() ? path_it->second : "");
    if (!exe) {
        result.exit_code = 127;
        result.stderr_output = "program not found: " + spec.program;
        return result;
    }

    std::string cmdline = quote_windows_arg(exe->string());
    for (const auto& arg : spec.args) {
        cmdline += ' ';
        cmdline += quote_windows_arg(arg);
    }
    std::vector<char> cmd_buf(cmdline.begin(), cmdline.end());
    cmd_buf.push_back('\0');

    std::string env_block;
    for (const auto& [name, value] : env) {
        env_block += name + "=" + value;
        env_block.push_back('\0');
    }
    env_block.push_back('\0');

    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    HANDLE out_read = nullptr, out_write = nullptr, err_read = nullptr, err_write = nullptr;
    if (!CreatePipe(&out_read, &out_write, &sa, 0) || !CreatePipe(&err_read, &err_write, &sa, 0)) {
        result.stderr_output = "failed to create pipes";
        return result;
    }
    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = out_write;
    si.hStdError = err_write;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);

    HANDLE job = CreateJobObjectA(nullptr, nullptr);
    if (job == nullptr) {
        CloseHandle(out_read);
        CloseHandle(out_write);
        CloseHandle(err_read);
        CloseHandle(err_write);
        result.stderr_output = "CreateJobObject failed with error " + std::to_string(GetLastError());
        return result;
    }
    JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
    limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
    SetInformationJobObject(job, JobObjectExtendedLimitInformation, &limits, sizeof(limits));

    PROCESS_INFORMATION pi{};
    std::string cwd = spec.working_dir.string();
    // Suspended until it is inside the job, so nothing it starts can escape
    BOOL created = CreateProcessA(nullptr, cmd_buf.data(), nullptr, nullptr, TRUE,
                                  CREATE_SUSPENDED, env_block.data(),
                                  cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);
    CloseHandle(out_write);
    CloseHandle(err_write);

    if (!created) {
        CloseHandle(out_read);
        CloseHandle(err_read);
        CloseHandle(job);
        result.stderr_output = "CreateProcess failed with error " + std::to_string(GetLastError());
        return result;
    }
    if (!AssignProcessToJobObject(job, pi.hProcess)) {
        LSPACK_LOG_WARN("process", "Could not place '" << spec.program
                                                       << "' in a job object, error "
                                                       << GetLastError());
    }
    ResumeThread(pi.hThread);

    result.launched = true;
    g_child_job.store(job);

    std::string out_text;
    std::string err_text;
    std::thread out_reader([&out_text, out_read] { out_text = read_pipe(out_read); });
    std::thread err_reader([&err_text, err_read] { err_text = read_pipe(err_read); });

    DWORD wait_ms = spec.timeout_seconds > 0 ? static_cast<DWORD>(spec.timeout_seconds) * 1000
                                             : INFINITE;
    if (WaitForSingleObject(pi.hProcess, wait_ms) == WAIT_TIMEOUT) {
        LSPACK_LOG_WARN("process", "Killing '" << spec.program << "' after "
                                               << spec.timeout_seconds << "s timeout");
        TerminateJobObject(job, 1);
        WaitForSingleObject(pi.hProcess, INFINITE);
        result.timed_out = true;
    } else {
        // Descendants left behind would keep the pipes open
        TerminateJobObject(job, 1);
    }
    out_reader.join();
    err_reader.join();
    result.stdout_output = std::move(out_text);
    result.stderr_output = std::move(err_text);

    DWORD exit_code = 1;
    GetExitCodeProcess(pi.hProcess, &exit_code);
    result.exit_code = static_cast<int>(exit_code);

    g_child_job.store(nullptr);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    CloseHandle(out_read);
    CloseHandle(err_read);
    CloseHandle(job);

    result.interrupted = interrupt_requested();
    result.duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    return result;
}

#else // Unix

ProcessResult SystemProcessRunner::run(const ProcessSpec& spec) {
    auto start = Clock::now();
    ProcessResult result;

    if (interrupt_requested()) {
        result.interrupted = true;
        return result;
    }

    auto env = compose_environment(current_environment(), spec.env_overrides, spec.env_unset);
    auto path_it = env.find("PATH");
    auto exe = find_program(spec.program, path_it != env.end() ? path_it->second : "");
    if (!exe) {
        result.exit_code = 127;
        result.stderr_output = "program not found: " + spec.program;
        return result;
    }

    // Everything the child needs is built before fork().
    std::string exe_path = exe->string();
    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto& [name, value] : env) {
        env_strings.push_back(name + "=" + value);
    }
    std::vector<char*> c_env;
    for (auto& entry : env_strings) {
        c_env.push_back(entry.data());
    }
    c_env.push_back(nullptr);

    std::vector<std::string> argv_strings;
    argv_strings.push_back(spec.program);
    argv_strings.insert(argv_strings.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> c_args;
    for (auto& arg : argv_strings) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    std::string cwd = spec.working_dir.string();

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        result.stderr_output = "failed to create pipes";
        return result;
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        result.stderr_output = "failed to create pipes";
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_output = "failed to fork";
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }

        execve(exe_path.c_str(), c_args.data(), c_env.data());
        _exit(127);
    }

    // Also set from the parent so the group exists before any signal is sent
    setpgid(pid, pid);
    result.launched = true;
    g_child_pid.store(pid);

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    struct pollfd fds[2];
    fds[0] = {stdout_pipe[0], POLLIN, 0};
    fds[1] = {stderr_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_output, &result.stderr_output};
    int open_fds = 2;

    auto deadline = Clock::now() + std::chrono::seconds(spec.timeout_seconds);
    char buffer[4096];

    while (open_fds > 0) {
        int rc = poll(fds, 2, 200);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }

        if (spec.timeout_seconds > 0 && !result.timed_out && Clock::now() > deadline) {
            LSPACK_LOG_WARN("process", "Killing '" << spec.program << "' after "
                                                   << spec.timeout_seconds << "s timeout");
            kill(-pid, SIGKILL);
            result.timed_out = true;
        }
        // A descendant that left the group may still hold the pipes open
        if (result.timed_out && Clock::now() > deadline + kPipeGrace) {
            break;
        }
    }

    for (auto& fd : fds) {
        if (fd.fd >= 0)
            close(fd.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    g_child_pid.store(0);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    // execve failures surface as 127 from the child
    if (result.exit_code == 127 && result.stdout_output.empty() &&
        result.stderr_output.empty()) {
        result.launched = false;
        result.stderr_output = "failed to execute " + exe_path;
    }

    result.interrupted = interrupt_requested();
    result.duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    return result;
}

#endif // _WIN32

} // namespace lspack::proc
