#include "packager/packager.hpp"

#include "log/log.hpp"
#include "packager/freezer.hpp"
#include "packager/linux_packager.hpp"
#include "packager/macos_packager.hpp"
#include "packager/windows_packager.hpp"

#include <fstream>

namespace lspack::pkg {

const char* to_string(ArtifactKind kind) {
    switch (kind) {
    case ArtifactKind::AppBundle:
        return "app_bundle";
    case ArtifactKind::DiskImage:
        return "disk_image";
    case ArtifactKind::InstallerExe:
        return "installer_exe";
    case ArtifactKind::FilesystemImage:
        return "filesystem_image";
    }
    return "unknown";
}

uint64_t artifact_size(const fs::path& path) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }
    if (!fs::is_directory(path, ec))
        return 0;

    uint64_t total = 0;
    for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            auto size = it->file_size(ec);
            if (!ec)
                total += size;
        }
    }
    return total;
}

Result<Unit, PackError> write_text_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (out) {
        out << content;
    }
    if (!out) {
        return PackError(ErrorKind::PackagingFailed, "cannot write file")
            .with("path", path.string());
    }
    return Unit{};
}

Result<Unit, PackError> copy_into_place(const fs::path& staged, const fs::path& published) {
    fs::path partial = published.parent_path() / ("." + published.filename().string() + ".partial");
    std::error_code ec;
    fs::remove_all(partial, ec);
    fs::copy(staged, partial, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (!ec) {
        fs::remove_all(published, ec);
    }
    if (!ec) {
        fs::rename(partial, published, ec);
    }
    if (ec) {
        std::error_code cleanup;
        fs::remove_all(partial, cleanup);
        return PackError(ErrorKind::PackagingFailed, "cannot publish artifact")
            .with("from", staged.string())
            .with("to", published.string())
            .with("detail", ec.message());
    }
    fs::remove_all(staged, ec);
    return Unit{};
}

Result<Unit, PackError> publish_artifact(const fs::path& staged, const fs::path& published) {
    std::error_code ec;
    fs::create_directories(published.parent_path(), ec);
    fs::remove_all(published, ec);
    fs::rename(staged, published, ec);
    if (ec == std::errc::cross_device_link) {
        LSPACK_LOG_DEBUG("package", "Copying " << staged.string() << " across filesystems");
        return copy_into_place(staged, published);
    }
    if (ec) {
        return PackError(ErrorKind::PackagingFailed, "cannot publish artifact")
            .with("from", staged.string())
            .with("to", published.string())
            .with("detail", ec.message());
    }
    return Unit{};
}

// ============================================================================
// Template
// ============================================================================

Result<fs::path, PackError> Packager::freeze(const PackageRequest& request) {
    Freezer freezer(config_, runner_);
    return freezer.freeze(request.manifest, request.target, request.python,
                          request.staging_dir / "freeze");
}

Result<Unit, PackError> Packager::run_tool(const proc::ProcessSpec& spec, const std::string& what) {
    LSPACK_LOG_DEBUG("package", "$ " << spec.command_line());
    auto result = runner_.run(spec);
    if (result.interrupted) {
        return PackError(ErrorKind::Interrupted, what + " interrupted");
    }
    if (!result.succeeded()) {
        return PackError(ErrorKind::PackagingFailed, what + " failed")
            .with("detail", result.failure_summary())
            .with("command", spec.command_line());
    }
    return Unit{};
}

Result<PackageArtifact, PackError> Packager::package(const PackageRequest& request) {
    std::error_code ec;
    fs::remove_all(request.staging_dir, ec);
    fs::create_directories(request.staging_dir, ec);
    if (ec) {
        return PackError(ErrorKind::PackagingFailed, "cannot create staging directory")
            .with("path", request.staging_dir.string())
            .with("detail", ec.message());
    }

    auto staged_result = stage(request);
    if (is_err(staged_result))
        return unwrap_err(staged_result);
    const Staged& staged = unwrap(staged_result);

    uint64_t size = artifact_size(staged.path);
    if (size == 0) {
        return PackError(ErrorKind::PackagingFailed, "packaging produced no artifact")
            .with("expected", staged.path.string());
    }

    fs::path published = request.output_dir / staged.path.filename();
    auto moved = publish_artifact(staged.path, published);
    if (is_err(moved))
        return unwrap_err(moved);

    PackageArtifact artifact{request.target, staged.kind, published, size};
    LSPACK_LOG_INFO("package", "Published " << to_string(artifact.kind) << " "
                                            << published.string() << " (" << size << " bytes)");

    fs::remove_all(request.staging_dir, ec);
    after_publish(artifact);
    return artifact;
}

// ============================================================================
// Registry
// ============================================================================

PackagerRegistry::PackagerRegistry(const config::ProjectConfig& config,
                                   proc::ProcessRunner& runner) {
    if (config.app.supports(OsFamily::MacOS))
        add(make_box<MacOsPackager>(config, runner));
    if (config.app.supports(OsFamily::Windows))
        add(make_box<WindowsPackager>(config, runner));
    if (config.app.supports(OsFamily::Linux))
        add(make_box<LinuxPackager>(config, runner));
}

void PackagerRegistry::add(Box<Packager> packager) {
    packagers_.push_back(std::move(packager));
}

Result<Packager*, PackError> PackagerRegistry::lookup(const BuildTarget& target) const {
    for (const auto& packager : packagers_) {
        if (packager->os() == target.os)
            return packager.get();
    }
    return PackError(ErrorKind::ProfileUnsupported,
                     std::string("no packaging procedure for ") + to_string(target.os))
        .with("target", target.describe());
}

} // namespace lspack::pkg
