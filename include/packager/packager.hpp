//! # Packager
//!
//! Turns a sealed bundle manifest into the platform's installable artifact.
//!
//! ## Template
//!
//! `Packager::package()` is the same for every platform:
//!
//! 1. Reset a private staging directory
//! 2. `stage()` (per OS): freeze, assemble, run the platform tools
//! 3. Check that the staged artifact exists and is not empty; tool exit codes
//!    alone are never trusted
//! 4. Publish into the output directory by rename, replacing any previous
//!    artifact with the same name
//!
//! A failure before step 4 leaves the output directory untouched.

#ifndef LSPACK_PACKAGER_PACKAGER_HPP
#define LSPACK_PACKAGER_PACKAGER_HPP

#include "bundle/manifest.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "config/project_config.hpp"
#include "platform/build_target.hpp"
#include "process/process.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lspack::pkg {

namespace fs = std::filesystem;

enum class ArtifactKind { AppBundle, DiskImage, InstallerExe, FilesystemImage };

/// "app_bundle", "disk_image", "installer_exe", "filesystem_image".
const char* to_string(ArtifactKind kind);

struct PackageArtifact {
    BuildTarget target;
    ArtifactKind kind;
    fs::path path;
    uint64_t size_bytes = 0;
};

struct PackageRequest {
    const bundle::BundleManifest& manifest;
    BuildTarget target;
    /// Interpreter of the isolated environment; runs the freezer.
    fs::path python;
    /// Private scratch directory, wiped before staging.
    fs::path staging_dir;
    /// Where the finished artifact is published.
    fs::path output_dir;
};

class Packager {
public:
    Packager(const config::ProjectConfig& config, proc::ProcessRunner& runner)
        : config_(config), runner_(runner) {}
    virtual ~Packager() = default;

    Packager(const Packager&) = delete;
    Packager& operator=(const Packager&) = delete;

    virtual OsFamily os() const = 0;

    /// Stages, verifies and publishes the artifact.
    Result<PackageArtifact, PackError> package(const PackageRequest& request);

protected:
    struct Staged {
        fs::path path;
        ArtifactKind kind;
    };

    /// Builds the artifact inside `request.staging_dir`.
    virtual Result<Staged, PackError> stage(const PackageRequest& request) = 0;

    /// Runs after a successful publish. Failures here are warnings.
    virtual void after_publish(const PackageArtifact& /*artifact*/) {}

    /// Freezes the manifest into a one-file executable inside the staging dir.
    Result<fs::path, PackError> freeze(const PackageRequest& request);

    /// Runs an external tool; a failed run is `PackagingFailed`, an
    /// interrupted one `Interrupted`.
    Result<Unit, PackError> run_tool(const proc::ProcessSpec& spec, const std::string& what);

    const config::ProjectConfig& config_;
    proc::ProcessRunner& runner_;
};

/// Size of a file, or the total size of the regular files under a directory.
uint64_t artifact_size(const fs::path& path);

/// Writes `content` to `path`, creating parent directories.
Result<Unit, PackError> write_text_file(const fs::path& path, const std::string& content);

/**
 * Move a staged artifact (file or directory) to `published`
 *
 * A rename when both sides share a filesystem. Otherwise the artifact is
 * copied to a hidden `.<name>.partial` sibling of `published` and renamed
 * from there, so the final name never holds a half-written artifact. A
 * previous artifact under the final name is replaced.
 */
Result<Unit, PackError> publish_artifact(const fs::path& staged, const fs::path& published);

/// The copy and rename half of `publish_artifact`.
Result<Unit, PackError> copy_into_place(const fs::path& staged, const fs::path& published);

// ============================================================================
// Registry
// ============================================================================

class PackagerRegistry {
public:
    /// Registers the packagers of every OS family listed in `[app] platforms`.
    PackagerRegistry(const config::ProjectConfig& config, proc::ProcessRunner& runner);

    void add(Box<Packager> packager);

    /// The packager for `target.os`, or `ProfileUnsupported`.
    Result<Packager*, PackError> lookup(const BuildTarget& target) const;

private:
    std::vector<Box<Packager>> packagers_;
};

} // namespace lspack::pkg

#endif // LSPACK_PACKAGER_PACKAGER_HPP
