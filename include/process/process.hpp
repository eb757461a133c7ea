//! # External Process Execution
//!
//! Every external tool the pipeline drives (venv creation, pip, the freezer,
//! hdiutil, appimagetool, codesign, docker) runs through `ProcessRunner`.
//! The orchestrator never shells out directly, which keeps environment
//! overrides scoped to a single child and lets tests substitute a scripted
//! runner.
//!
//! ## Environment overrides
//!
//! `ProcessSpec::env_overrides` and `env_unset` are applied to the child's
//! environment only. The orchestrator's own environment is never modified.
//!
//! ## Interrupts
//!
//! While an `InterruptGuard` is alive, SIGINT/SIGTERM (Ctrl+C/Ctrl+Break on
//! Windows) are forwarded to the running child and recorded; the child's
//! result is then reported with `interrupted = true`.

#ifndef LSPACK_PROCESS_PROCESS_HPP
#define LSPACK_PROCESS_PROCESS_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lspack::proc {

namespace fs = std::filesystem;

struct ProcessSpec {
    /// Program name (looked up on the child's PATH) or a path to it.
    std::string program;
    std::vector<std::string> args;
    std::map<std::string, std::string> env_overrides;
    std::vector<std::string> env_unset;
    /// Working directory for the child; empty inherits ours.
    fs::path working_dir;
    /// 0 = no timeout.
    int timeout_seconds = 0;

    /// Renders the command for logs ("prog arg1 'arg with space'").
    std::string command_line() const;
};

struct ProcessResult {
    bool launched = false;
    int exit_code = -1;
    bool interrupted = false;
    bool timed_out = false;
    std::string stdout_output;
    std::string stderr_output;
    int64_t duration_ms = 0;

    bool succeeded() const {
        return launched && !interrupted && !timed_out && exit_code == 0;
    }

    /// One-line description of a failure, ending with the last line of stderr.
    std::string failure_summary() const;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const ProcessSpec& spec) = 0;
};

/// Runs real child processes (fork/execve on POSIX, CreateProcess on Windows).
class SystemProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const ProcessSpec& spec) override;
};

// ============================================================================
// Environment Helpers
// ============================================================================

/// Path-list separator of the host (':' or ';').
char path_list_separator();

/// Reads a variable from the current process environment.
std::optional<std::string> get_env(const std::string& name);

/// Snapshot of the current process environment as NAME -> value.
std::map<std::string, std::string> current_environment();

/// Applies overrides and removals to a base environment.
std::map<std::string, std::string>
compose_environment(std::map<std::string, std::string> base,
                    const std::map<std::string, std::string>& overrides,
                    const std::vector<std::string>& unset);

/// Finds an executable by name on a PATH-style list. Names containing a
/// directory separator are checked as given.
std::optional<fs::path> find_program(const std::string& name, const std::string& path_value);

// ============================================================================
// Interrupt Forwarding
// ============================================================================

/// Installs interrupt handlers for its lifetime and restores the previous
/// ones on destruction.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;
};

/// True once an interrupt has been received under an InterruptGuard.
bool interrupt_requested();

/// Clears the interrupt flag (tests and repeated runs in one process).
void clear_interrupt();

/// Marks an interrupt as received, as the signal handler would.
void request_interrupt();

} // namespace lspack::proc

#endif // LSPACK_PROCESS_PROCESS_HPP
