//! # Isolated Environment Manager
//!
//! Each build target gets its own virtual environment under
//! `<work>/env/<target-key>`. `create()` always starts from scratch, so no
//! state leaks between builds or between targets.

#ifndef LSPACK_ENV_ENVIRONMENT_HPP
#define LSPACK_ENV_ENVIRONMENT_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "config/project_config.hpp"
#include "deps/dependency_resolver.hpp"
#include "platform/build_target.hpp"
#include "process/network_checker.hpp"
#include "process/process.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace lspack::env {

namespace fs = std::filesystem;

class IsolatedEnvironment {
public:
    IsolatedEnvironment(fs::path root, BuildTarget target)
        : root_(std::move(root)), target_(target) {}

    const fs::path& root() const {
        return root_;
    }

    const BuildTarget& target() const {
        return target_;
    }

    /// Interpreter inside the environment (bin/python or Scripts\python.exe).
    fs::path python() const;

    /// The environment's site-packages directory, if it exists.
    std::optional<fs::path> site_packages() const;

private:
    fs::path root_;
    BuildTarget target_;
};

/// Interpreter path for an environment rooted at `root` on this host.
fs::path environment_python(const fs::path& root);

class EnvironmentManager {
public:
    EnvironmentManager(const config::EnvironmentConfig& config, proc::ProcessRunner& runner,
                       proc::NetworkChecker& network, bool offline = false)
        : config_(config), runner_(runner), network_(network), offline_(offline) {}

    /// Destroys any previous environment at `dir` and creates a fresh one.
    Result<IsolatedEnvironment, PackError> create(const fs::path& dir, const BuildTarget& target);

    /// Installs a dependency into `env` through the dependency resolver.
    Result<deps::InstalledDependency, PackError> install(const IsolatedEnvironment& env,
                                                         const deps::DependencySpec& spec);

    /// Every acquisition attempt made through `install`.
    const std::vector<deps::AttemptRecord>& attempts() const {
        return attempts_;
    }

private:
    const config::EnvironmentConfig& config_;
    proc::ProcessRunner& runner_;
    proc::NetworkChecker& network_;
    bool offline_;
    std::vector<deps::AttemptRecord> attempts_;
};

} // namespace lspack::env

#endif // LSPACK_ENV_ENVIRONMENT_HPP
