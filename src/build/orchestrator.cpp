#include "build/orchestrator.hpp"

#include "bundle/manifest_builder.hpp"
#include "log/log.hpp"

#include <sstream>

namespace lspack::build {

const char* to_string(BuildState state) {
    switch (state) {
    case BuildState::Init:
        return "Init";
    case BuildState::ProfileResolved:
        return "ProfileResolved";
    case BuildState::EnvironmentReady:
        return "EnvironmentReady";
    case BuildState::DependenciesInstalled:
        return "DependenciesInstalled";
    case BuildState::ManifestBuilt:
        return "ManifestBuilt";
    case BuildState::Packaged:
        return "Packaged";
    case BuildState::Done:
        return "Done";
    case BuildState::Failed:
        return "Failed";
    }
    return "Unknown";
}

BuildOrchestrator::BuildOrchestrator(const config::ProjectConfig& config, BuildServices services,
                                     BuildOptions options)
    : config_(config), services_(services), options_(std::move(options)),
      registry_(config, services.runner) {}

fs::path BuildOrchestrator::output_dir() const {
    return options_.output_dir.empty() ? config_.root / "dist" : options_.output_dir;
}

fs::path BuildOrchestrator::work_dir() const {
    return options_.work_dir.empty() ? config_.root / "build" : options_.work_dir;
}

// ============================================================================
// Steps
// ============================================================================

Result<Unit, PackError> BuildOrchestrator::validate_config() {
    return deps::validate_dependencies(config_.dependencies);
}

Result<Unit, PackError> BuildOrchestrator::resolve_profile() {
    auto resolved = lspack::resolve_profile(services_.host, options_.resolve);
    if (is_err(resolved)) {
        const PackError& error = unwrap_err(resolved);
        if (error.kind != ErrorKind::ProfileUnsupported)
            return error;
        // The profile is complete, only no packager exists for it
        LSPACK_LOG_WARN("build", error.describe());
        unsupported_host_ = error;
        return Unit{};
    }

    auto& profile = unwrap(resolved);
    target_ = profile.target;
    report_.target = profile.target;
    report_.warnings.insert(report_.warnings.end(), profile.warnings.begin(),
                            profile.warnings.end());
    return Unit{};
}

Result<Unit, PackError> BuildOrchestrator::prepare_environment() {
    if (unsupported_host_)
        return *unsupported_host_;
    auto found = registry_.lookup(*target_);
    if (is_err(found))
        return unwrap_err(found);
    packager_ = unwrap(found);

    std::string key = target_->key();
    auto locks = env::acquire_target_locks(work_dir(), output_dir(), key);
    if (is_err(locks))
        return unwrap_err(locks);
    locks_ = std::move(unwrap(locks));

    // Prior artifacts of this target go before anything new is produced
    std::error_code ec;
    fs::remove_all(output_dir() / key, ec);
    if (!ec)
        fs::remove_all(work_dir() / key, ec);
    if (ec) {
        return PackError(ErrorKind::EnvironmentCreationFailed,
                         "cannot remove previous build output")
            .with("detail", ec.message());
    }

    env_manager_.emplace(config_.environment, services_.runner, services_.network,
                         options_.offline);
    auto created = env_manager_->create(work_dir() / "env" / key, *target_);
    if (is_err(created))
        return unwrap_err(created);
    env_.emplace(std::move(unwrap(created)));
    return Unit{};
}

Result<Unit, PackError> BuildOrchestrator::install_dependencies() {
    for (const auto& spec : config_.dependencies) {
        if (!spec.applies_to(*target_)) {
            LSPACK_LOG_INFO("build", "Skipping " << spec.name << " (not used on "
                                                 << to_string(target_->os) << ")");
            report_.skipped.push_back(spec.name);
            continue;
        }

        auto installed = env_manager_->install(*env_, spec);
        report_.attempts = env_manager_->attempts();
        if (is_ok(installed)) {
            report_.installed.push_back(unwrap(installed));
            continue;
        }

        const PackError& error = unwrap_err(installed);
        if (spec.required || error.kind == ErrorKind::Interrupted)
            return error;

        std::string warning = "optional dependency " + spec.name +
                              " was not installed: " + error.describe();
        LSPACK_LOG_WARN("build", warning);
        report_.warnings.push_back(warning);
        report_.skipped.push_back(spec.name);
    }
    return Unit{};
}

Result<Unit, PackError> BuildOrchestrator::build_manifest() {
    auto site_packages = env_->site_packages();
    if (!site_packages) {
        return PackError(ErrorKind::ManifestIncomplete,
                         "the build environment has no site-packages directory")
            .with("env", env_->root().string());
    }

    bundle::ManifestBuilder builder(config_);
    auto built = builder.build(*site_packages, report_.installed, *target_);
    if (is_err(built))
        return unwrap_err(built);
    manifest_.emplace(std::move(unwrap(built)));

    fs::path path = work_dir() / target_->key() / "manifest.json";
    auto written = manifest_->write(path);
    if (is_err(written))
        return unwrap_err(written);

    report_.manifest_fingerprint = manifest_->fingerprint();
    report_.manifest_path = path;
    return Unit{};
}

Result<Unit, PackError> BuildOrchestrator::package() {
    pkg::PackageRequest request{*manifest_, *target_, env_->python(),
                                work_dir() / target_->key() / "staging",
                                output_dir() / target_->key()};
    auto artifact = packager_->package(request);
    if (is_err(artifact))
        return unwrap_err(artifact);
    report_.artifact = unwrap(artifact);
    return Unit{};
}

// ============================================================================
// Pipeline
// ============================================================================

namespace {

struct Step {
    BuildState state;
    const char* label;
    Result<Unit, PackError> (BuildOrchestrator::*action)();
};

} // namespace

PipelineReport BuildOrchestrator::run() {
    report_ = PipelineReport{};
    unsupported_host_.reset();
    report_.states.push_back(BuildState::Init);

    auto fail = [this](BuildState step, PackError error) {
        LSPACK_LOG_ERROR("build", "Build failed at " << to_string(step) << ": "
                                                     << error.describe());
        report_.failed_step = step;
        report_.error = std::move(error);
        report_.states.push_back(BuildState::Failed);
        locks_.clear();
        return report_;
    };

    auto valid = validate_config();
    if (is_err(valid))
        return fail(BuildState::Init, unwrap_err(valid));

    const Step steps[] = {
        {BuildState::ProfileResolved, "Detecting target platform",
         &BuildOrchestrator::resolve_profile},
        {BuildState::EnvironmentReady, "Setting up build environment",
         &BuildOrchestrator::prepare_environment},
        {BuildState::DependenciesInstalled, "Installing dependencies",
         &BuildOrchestrator::install_dependencies},
        {BuildState::ManifestBuilt, "Collecting bundle contents",
         &BuildOrchestrator::build_manifest},
        {BuildState::Packaged, "Packaging application", &BuildOrchestrator::package},
        {BuildState::Done, "Finishing", nullptr},
    };

    int number = 0;
    for (const auto& step : steps) {
        ++number;
        std::ostringstream line;
        line << "[" << number << "/" << PROGRESS_STEPS << "] " << step.label << "...";
        LSPACK_LOG_INFO("build", line.str());
        report_.progress.push_back(line.str());

        if (proc::interrupt_requested()) {
            return fail(step.state, PackError(ErrorKind::Interrupted, "build interrupted"));
        }
        if (step.action != nullptr) {
            auto result = (this->*step.action)();
            if (is_err(result))
                return fail(step.state, unwrap_err(result));
        }
        report_.states.push_back(step.state);
    }

    locks_.clear();
    if (report_.artifact) {
        LSPACK_LOG_INFO("build", "Build complete: " << report_.artifact->path.string());
    }
    return report_;
}

} // namespace lspack::build
