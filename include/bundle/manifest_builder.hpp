//! # Manifest Builder
//!
//! Turns the project source trees and the installed dependencies into a
//! sealed `BundleManifest` for one build target.
//!
//! ## Pipeline
//!
//! 1. Collect the entry script and every configured source tree
//! 2. Collect the native libraries and data files of each bundled dependency
//! 3. Drop what belongs to another OS family (GUI backends, foreign binaries)
//! 4. Apply the exclusion rules and excluded modules
//! 5. Check that every entry a required glob matched survived the filters,
//!    and that every required glob still matches an entry
//! 6. Seal (digest every file, compute the fingerprint)

#ifndef LSPACK_BUNDLE_MANIFEST_BUILDER_HPP
#define LSPACK_BUNDLE_MANIFEST_BUILDER_HPP

#include "bundle/manifest.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "config/project_config.hpp"
#include "deps/dependency_resolver.hpp"
#include "platform/build_target.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lspack::bundle {

namespace fs = std::filesystem;

/// True for shared libraries and extension modules (.so, .so.N, .dylib,
/// .dll, .pyd).
bool is_native_library(std::string_view file_name);

/// True if a native library with this name can be loaded on `os`.
bool native_library_fits(std::string_view file_name, OsFamily os);

class ManifestBuilder {
public:
    explicit ManifestBuilder(const config::ProjectConfig& config) : config_(config) {}

    /**
     * Build the manifest for `target`
     *
     * @param site_packages The isolated environment's site-packages directory
     * @param installed     Dependencies present in that environment
     * @return A sealed manifest, `ManifestIncomplete` when a required entry
     *         is missing, or `ManifestConflict` when two files collide
     */
    Result<BundleManifest, PackError> build(const fs::path& site_packages,
                                            const std::vector<deps::InstalledDependency>& installed,
                                            const BuildTarget& target) const;

private:
    Result<Unit, PackError> collect_sources(BundleManifest& manifest) const;
    Result<Unit, PackError> collect_dependency(BundleManifest& manifest,
                                               const fs::path& site_packages,
                                               const deps::DependencySpec& spec) const;
    void drop_foreign_platforms(BundleManifest& manifest, const BuildTarget& target) const;
    void apply_exclusions(BundleManifest& manifest) const;
    /// Destinations matched by a required glob, taken before the exclusion rules run.
    std::vector<std::string> required_entries(const BundleManifest& manifest) const;
    Result<Unit, PackError> check_required(const BundleManifest& manifest,
                                           const std::vector<std::string>& required) const;

    const config::ProjectConfig& config_;
};

} // namespace lspack::bundle

#endif // LSPACK_BUNDLE_MANIFEST_BUILDER_HPP
