//! # Freezer
//!
//! Drives PyInstaller: renders a spec file from the bundle manifest and runs
//! it with the isolated environment's interpreter. The result is a one-file,
//! windowed executable.

#ifndef LSPACK_PACKAGER_FREEZER_HPP
#define LSPACK_PACKAGER_FREEZER_HPP

#include "bundle/manifest.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "config/project_config.hpp"
#include "platform/build_target.hpp"
#include "process/process.hpp"

#include <filesystem>
#include <string>

namespace lspack::pkg {

namespace fs = std::filesystem;

/// Quotes a string as a Python string literal.
std::string py_literal(const std::string& s);

class Freezer {
public:
    Freezer(const config::ProjectConfig& config, proc::ProcessRunner& runner)
        : config_(config), runner_(runner) {}

    /// PyInstaller spec text for `manifest`.
    std::string render_spec(const bundle::BundleManifest& manifest,
                            const BuildTarget& target) const;

    /**
     * Freeze the manifest
     *
     * Writes `<work_dir>/<id>.spec` and runs the freezer with `dist/` and
     * `build/` under `work_dir`.
     *
     * @return Path of the produced executable
     */
    Result<fs::path, PackError> freeze(const bundle::BundleManifest& manifest,
                                       const BuildTarget& target, const fs::path& python,
                                       const fs::path& work_dir);

    /// File name of the frozen executable for `os`.
    std::string executable_file(OsFamily os) const;

private:
    fs::path icon_path(OsFamily os) const;

    const config::ProjectConfig& config_;
    proc::ProcessRunner& runner_;
};

} // namespace lspack::pkg

#endif // LSPACK_PACKAGER_FREEZER_HPP
