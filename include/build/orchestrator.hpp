//! # Build Orchestrator
//!
//! Sequences one build as a linear state machine:
//!
//! ```text
//! Init → ProfileResolved → EnvironmentReady → DependenciesInstalled
//!      → ManifestBuilt → Packaged → Done
//! ```
//!
//! Any step can end the run in `Failed(step, error)`, where `step` is the
//! state that was being entered. States are never skipped and the first
//! failure halts the pipeline.
//!
//! ## Directories
//!
//! | Path                              | Content                          |
//! |-----------------------------------|----------------------------------|
//! | `<work>/locks/<key>.lock`         | per-target lock on the work tree |
//! | `<output>/.<key>.lock`            | per-target lock on the output    |
//! | `<work>/env/<key>`                | isolated environment             |
//! | `<work>/<key>/manifest.json`      | persisted bundle manifest        |
//! | `<work>/<key>/staging`            | packager scratch space           |
//! | `<output>/<key>`                  | published artifact               |

#ifndef LSPACK_BUILD_ORCHESTRATOR_HPP
#define LSPACK_BUILD_ORCHESTRATOR_HPP

#include "bundle/manifest.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "config/project_config.hpp"
#include "deps/dependency_resolver.hpp"
#include "env/build_lock.hpp"
#include "env/environment.hpp"
#include "packager/packager.hpp"
#include "platform/host_inspector.hpp"
#include "platform/platform_resolver.hpp"
#include "process/network_checker.hpp"
#include "process/process.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lspack::build {

namespace fs = std::filesystem;

enum class BuildState {
    Init,
    ProfileResolved,
    EnvironmentReady,
    DependenciesInstalled,
    ManifestBuilt,
    Packaged,
    Done,
    Failed,
};

const char* to_string(BuildState state);

/// Number of progress steps reported for a full run.
constexpr int PROGRESS_STEPS = 6;

struct BuildOptions {
    ResolveOptions resolve;
    /// Empty = `<root>/dist`.
    fs::path output_dir;
    /// Empty = `<root>/build`.
    fs::path work_dir;
    /// Skip network acquisition strategies.
    bool offline = false;
};

/// External collaborators, injected so tests can script them.
struct BuildServices {
    proc::ProcessRunner& runner;
    HostInspector& host;
    proc::NetworkChecker& network;
};

struct PipelineReport {
    /// Every state entered, starting with `Init`; ends with `Done` or `Failed`.
    std::vector<BuildState> states;
    /// Numbered progress lines ("[2/6] Setting up build environment...").
    std::vector<std::string> progress;
    std::vector<std::string> warnings;

    std::optional<BuildTarget> target;
    std::vector<deps::InstalledDependency> installed;
    /// Dependencies left out (platform restriction or optional failure).
    std::vector<std::string> skipped;
    std::vector<deps::AttemptRecord> attempts;

    std::string manifest_fingerprint;
    fs::path manifest_path;
    std::optional<pkg::PackageArtifact> artifact;

    /// State being entered when the run failed.
    std::optional<BuildState> failed_step;
    std::optional<PackError> error;

    BuildState state() const {
        return states.empty() ? BuildState::Init : states.back();
    }

    bool succeeded() const {
        return state() == BuildState::Done;
    }
};

class BuildOrchestrator {
public:
    BuildOrchestrator(const config::ProjectConfig& config, BuildServices services,
                      BuildOptions options);

    /// Runs the whole pipeline. Never throws; failures are in the report.
    PipelineReport run();

    fs::path output_dir() const;
    fs::path work_dir() const;

private:
    Result<Unit, PackError> validate_config();
    Result<Unit, PackError> resolve_profile();
    Result<Unit, PackError> prepare_environment();
    Result<Unit, PackError> install_dependencies();
    Result<Unit, PackError> build_manifest();
    Result<Unit, PackError> package();

    const config::ProjectConfig& config_;
    BuildServices services_;
    BuildOptions options_;

    pkg::PackagerRegistry registry_;
    PipelineReport report_;
    std::optional<BuildTarget> target_;
    /// Host OS with no packaging procedure, reported by the packager lookup.
    std::optional<PackError> unsupported_host_;
    pkg::Packager* packager_ = nullptr;
    std::vector<env::BuildLock> locks_;
    std::optional<env::EnvironmentManager> env_manager_;
    std::optional<env::IsolatedEnvironment> env_;
    std::optional<bundle::BundleManifest> manifest_;
};

} // namespace lspack::build

#endif // LSPACK_BUILD_ORCHESTRATOR_HPP
