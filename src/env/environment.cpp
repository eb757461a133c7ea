#include "env/environment.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace lspack::env {

fs::path environment_python(const fs::path& root) {
#ifdef _WIN32
    return root / "Scripts" / "python.exe";
#else
    return root / "bin" / "python";
#endif
}

fs::path IsolatedEnvironment::python() const {
    return environment_python(root_);
}

std::optional<fs::path> IsolatedEnvironment::site_packages() const {
    std::error_code ec;

    fs::path windows_layout = root_ / "Lib" / "site-packages";
    if (fs::is_directory(windows_layout, ec)) {
        return windows_layout;
    }

    fs::path lib = root_ / "lib";
    if (!fs::is_directory(lib, ec)) {
        return std::nullopt;
    }

    std::vector<fs::path> candidates;
    for (const auto& entry : fs::directory_iterator(lib, ec)) {
        std::string name = entry.path().filename().string();
        if (entry.is_directory() && name.starts_with("python") &&
            fs::is_directory(entry.path() / "site-packages")) {
            candidates.push_back(entry.path() / "site-packages");
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates.back();
}

Result<IsolatedEnvironment, PackError> EnvironmentManager::create(const fs::path& dir,
                                                                  const BuildTarget& target) {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        LSPACK_LOG_DEBUG("env", "Removing previous environment " << dir.string());
        fs::remove_all(dir, ec);
        if (ec) {
            return PackError(ErrorKind::EnvironmentCreationFailed,
                             "cannot remove previous environment")
                .with("path", dir.string())
                .with("reason", ec.message());
        }
    }

    fs::create_directories(dir.parent_path(), ec);
    if (ec) {
        return PackError(ErrorKind::EnvironmentCreationFailed, "cannot create work directory")
            .with("path", dir.parent_path().string())
            .with("reason", ec.message());
    }

    proc::ProcessSpec spec;
    spec.program = config_.python;
    spec.args = {"-m", "venv", dir.string()};
    spec.timeout_seconds = 600;

    LSPACK_LOG_INFO("env", "Creating isolated environment for " << target.key());
    auto result = runner_.run(spec);

    if (result.interrupted) {
        return PackError(ErrorKind::Interrupted, "environment creation was interrupted");
    }
    if (!result.succeeded()) {
        return PackError(ErrorKind::EnvironmentCreationFailed,
                         "creating the virtual environment failed")
            .with("python", config_.python)
            .with("reason", result.failure_summary());
    }

    IsolatedEnvironment env(dir, target);
    if (!fs::exists(env.python(), ec)) {
        return PackError(ErrorKind::EnvironmentCreationFailed,
                         "virtual environment has no interpreter")
            .with("expected", env.python().string());
    }

    LSPACK_LOG_DEBUG("env", "Environment ready at " << dir.string());
    return env;
}

Result<deps::InstalledDependency, PackError>
EnvironmentManager::install(const IsolatedEnvironment& env, const deps::DependencySpec& spec) {
    deps::AcquisitionContext ctx{
        .python = env.python(),
        .target = env.target(),
        .runner = runner_,
        .network = network_,
        .environment = config_,
        .offline = offline_,
        .base_environment = proc::current_environment(),
    };

    deps::DependencyResolver resolver(ctx);
    auto result = resolver.resolve(spec);

    const auto& made = resolver.attempts();
    attempts_.insert(attempts_.end(), made.begin(), made.end());
    return result;
}

} // namespace lspack::env
