//! # Test Support
//!
//! Scripted stand-ins for everything the pipeline reaches outside the
//! process: external tools, host inspection, network reachability and log
//! output.
//!
//! `FakeToolRunner` simulates the tools the pipeline invokes and creates the
//! files the real tool would have created:
//!
//! | Invocation              | Effect                                          |
//! |-------------------------|-------------------------------------------------|
//! | `<py> -m venv DIR`      | DIR/bin/python and lib/python3.11/site-packages |
//! | `<py> -m pip install`   | package files in site-packages                  |
//! | `<py> -m PyInstaller`   | dist/<name> executable                          |
//! | `appimagetool IN OUT`   | OUT                                             |
//! | `hdiutil create ... OUT`| OUT                                             |
//! | `nvidia-smi`            | not installed                                   |

#ifndef LSPACK_TESTS_TEST_SUPPORT_HPP
#define LSPACK_TESTS_TEST_SUPPORT_HPP

#include "log/log.hpp"
#include "platform/host_inspector.hpp"
#include "process/network_checker.hpp"
#include "process/process.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace lspack::test {

namespace fs = std::filesystem;

proc::ProcessResult ok_result(const std::string& out = "");
proc::ProcessResult fail_result(int exit_code, const std::string& err);
proc::ProcessResult not_found_result(const std::string& program);

void write_file(const fs::path& path, const std::string& content);
std::string read_file(const fs::path& path);

/// Distribution name of a requirement ("llama-cpp-python>=0.2" -> "llama-cpp-python").
std::string dist_name(const std::string& requirement);

class FakeToolRunner : public proc::ProcessRunner {
public:
    using Matcher = std::function<bool(const proc::ProcessSpec&)>;
    using Handler = std::function<proc::ProcessResult(const proc::ProcessSpec&)>;

    FakeToolRunner();

    proc::ProcessResult run(const proc::ProcessSpec& spec) override;

    /// Overrides the simulation for matching invocations. Later overrides
    /// take precedence.
    void on(Matcher matcher, Handler handler);

    /// Invocations whose command line contains `needle`.
    std::vector<proc::ProcessSpec> calls_with(const std::string& needle) const;

    std::vector<proc::ProcessSpec> calls;

    /// Distributions whose prebuilt (or source) install fails.
    std::set<std::string> fail_prebuilt;
    std::set<std::string> fail_source;
    /// Files created relative to site-packages when a distribution installs.
    std::map<std::string, std::vector<std::string>> package_files;

    bool venv_fails = false;
    bool freezer_writes_nothing = false;
    bool image_tool_writes_nothing = false;
    /// Appended to the frozen executable name (".exe" for Windows targets).
    std::string exe_suffix;
    std::string last_freezer_spec;

private:
    proc::ProcessResult simulate(const proc::ProcessSpec& spec);
    proc::ProcessResult simulate_pip(const proc::ProcessSpec& spec);
    proc::ProcessResult simulate_freezer(const proc::ProcessSpec& spec);

    std::vector<std::pair<Matcher, Handler>> overrides_;
};

class FakeHostInspector : public HostInspector {
public:
    FakeHostInspector(std::string os, std::string machine,
                      GpuRuntimeStatus gpu = GpuRuntimeStatus::Absent)
        : os_(std::move(os)), machine_(std::move(machine)), gpu_(gpu) {}

    std::string os_name() override {
        return os_;
    }
    std::string machine() override {
        return machine_;
    }
    GpuRuntimeInfo gpu_runtime() override {
        ++gpu_queries;
        return {gpu_, gpu_ == GpuRuntimeStatus::Present ? "NVIDIA RTX 4090" : "fake"};
    }

    int gpu_queries = 0;

private:
    std::string os_;
    std::string machine_;
    GpuRuntimeStatus gpu_;
};

class FakeNetworkChecker : public proc::NetworkChecker {
public:
    explicit FakeNetworkChecker(bool online = true) : online(online) {}

    bool reachable(const std::string& url) override {
        checked.push_back(url);
        return online;
    }

    bool online;
    std::vector<std::string> checked;
};

/// Captures log records for assertions; installed for the lifetime of the
/// object, restores a silent logger afterwards.
class CaptureLog {
public:
    CaptureLog();
    ~CaptureLog();

    bool contains(const std::string& needle) const;
    std::vector<std::string> messages() const;

private:
    struct Sink;
    std::shared_ptr<std::vector<std::string>> lines_;
    std::shared_ptr<std::mutex> mutex_;
};

/// Creates a fresh directory under the system temp dir, removed on
/// destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "lspack_test");
    ~TempDir();

    const fs::path& path() const {
        return path_;
    }

private:
    fs::path path_;
};

/// Writes a minimal LocalLLM Studio checkout (entry script, ui/, backends/,
/// models/, utils/, assets/) under `root`.
void write_sample_project(const fs::path& root);

} // namespace lspack::test

#endif // LSPACK_TESTS_TEST_SUPPORT_HPP
