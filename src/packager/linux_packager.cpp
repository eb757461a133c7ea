#include "packager/linux_packager.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace lspack::pkg {

// 1x1 transparent PNG, used when the project ships no Linux icon.
static const unsigned char DEFAULT_ICON_PNG[] = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D, 0x49, 0x48,
    0x44, 0x52, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x08, 0x06, 0x00, 0x00,
    0x00, 0x1F, 0x15, 0xC4, 0x89, 0x00, 0x00, 0x00, 0x0A, 0x49, 0x44, 0x41, 0x54, 0x78,
    0x9C, 0x63, 0x00, 0x01, 0x00, 0x00, 0x05, 0x00, 0x01, 0x0D, 0x0A, 0x2D, 0xB4, 0x00,
    0x00, 0x00, 0x00, 0x49, 0x45, 0x4E, 0x44, 0xAE, 0x42, 0x60, 0x82,
};

std::string render_app_run(const std::string& executable) {
    std::ostringstream out;
    out << "#!/bin/bash\n";
    out << "SELF=$(readlink -f \"$0\")\n";
    out << "HERE=${SELF%/*}\n";
    out << "exec \"$HERE/" << executable << "\" \"$@\"\n";
    return out.str();
}

std::string render_desktop_entry(const config::AppConfig& app) {
    std::ostringstream out;
    out << "[Desktop Entry]\n";
    out << "Type=Application\n";
    out << "Name=" << app.name << "\n";
    out << "Exec=AppRun\n";
    out << "Icon=" << app.id << "\n";
    out << "Categories=";
    for (const auto& category : app.categories) {
        out << category << ";";
    }
    out << "\n";
    out << "Comment=" << app.comment << "\n";
    out << "Terminal=false\n";
    return out.str();
}

const char* appimage_arch(Arch arch) {
    return arch == Arch::Arm64 ? "aarch64" : "x86_64";
}

Result<Unit, PackError> LinuxPackager::install_icon(const fs::path& app_dir) const {
    fs::path icon = app_dir / (config_.app.id + ".png");
    fs::path source = config_.root / config_.app.icon_linux;
    std::error_code ec;

    if (!config_.app.icon_linux.empty() && fs::is_regular_file(source, ec)) {
        fs::copy_file(source, icon, fs::copy_options::overwrite_existing, ec);
    } else {
        LSPACK_LOG_WARN("package", "No Linux icon at " << source.string()
                                                       << ", using a placeholder");
        std::ofstream out(icon, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(DEFAULT_ICON_PNG), sizeof(DEFAULT_ICON_PNG));
        if (!out)
            ec = std::make_error_code(std::errc::io_error);
    }
    if (!ec) {
        fs::copy_file(icon, app_dir / ".DirIcon", fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        return PackError(ErrorKind::PackagingFailed, "cannot install the application icon")
            .with("path", icon.string())
            .with("detail", ec.message());
    }
    return Unit{};
}

Result<Packager::Staged, PackError> LinuxPackager::stage(const PackageRequest& request) {
    auto frozen = freeze(request);
    if (is_err(frozen))
        return unwrap_err(frozen);
    const fs::path& exe = unwrap(frozen);

    const auto& app = config_.app;
    std::string exe_name = app.executable_name(OsFamily::Linux);
    fs::path app_dir = request.staging_dir / (app.artifact_stem() + ".AppDir");

    std::error_code ec;
    fs::create_directories(app_dir, ec);
    fs::copy_file(exe, app_dir / exe_name, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return PackError(ErrorKind::PackagingFailed, "cannot copy the executable into the AppDir")
            .with("detail", ec.message());
    }
    fs::permissions(app_dir / exe_name, fs::perms(0755), ec);

    auto app_run = write_text_file(app_dir / "AppRun", render_app_run(exe_name));
    if (is_err(app_run))
        return unwrap_err(app_run);
    fs::permissions(app_dir / "AppRun", fs::perms(0755), ec);
    if (ec) {
        return PackError(ErrorKind::PackagingFailed, "cannot make AppRun executable")
            .with("detail", ec.message());
    }

    auto desktop = write_text_file(app_dir / (app.id + ".desktop"), render_desktop_entry(app));
    if (is_err(desktop))
        return unwrap_err(desktop);

    auto icon = install_icon(app_dir);
    if (is_err(icon))
        return unwrap_err(icon);

    const char* arch = appimage_arch(request.target.arch);
    fs::path image = request.staging_dir /
                     (app.artifact_stem() + "-" + app.version + "-" + arch + ".AppImage");

    proc::ProcessSpec spec;
    spec.program = config_.package.image_tool;
    spec.args = {app_dir.string(), image.string()};
    spec.env_overrides["ARCH"] = arch;
    spec.timeout_seconds = config_.package.tool_timeout_seconds;
    LSPACK_LOG_INFO("package", "Creating AppImage " << image.filename().string());
    auto ran = run_tool(spec, config_.package.image_tool);
    if (is_err(ran))
        return unwrap_err(ran);

    return Staged{image, ArtifactKind::FilesystemImage};
}

} // namespace lspack::pkg
