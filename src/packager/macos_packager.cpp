#include "packager/macos_packager.hpp"

#include "log/log.hpp"

#include <sstream>

namespace lspack::pkg {

static std::string xml_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string render_info_plist(const config::AppConfig& app, const std::string& icon_file) {
    auto key = [](std::ostringstream& out, const std::string& k, const std::string& v) {
        out << "    <key>" << k << "</key>\n";
        out << "    <string>" << xml_escape(v) << "</string>\n";
    };
    auto flag = [](std::ostringstream& out, const std::string& k, bool v) {
        out << "    <key>" << k << "</key>\n";
        out << "    " << (v ? "<true/>" : "<false/>") << "\n";
    };

    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
           "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n";
    out << "<plist version=\"1.0\">\n";
    out << "<dict>\n";
    key(out, "CFBundleName", app.name);
    key(out, "CFBundleDisplayName", app.name);
    key(out, "CFBundleExecutable", app.executable_name(OsFamily::MacOS));
    key(out, "CFBundleIdentifier", app.identifier);
    key(out, "CFBundleVersion", app.version);
    key(out, "CFBundleShortVersionString", app.version);
    key(out, "CFBundlePackageType", "APPL");
    if (!icon_file.empty()) {
        key(out, "CFBundleIconFile", icon_file);
    }
    flag(out, "NSHighResolutionCapable", true);
    flag(out, "LSUIElement", false);
    // Follow the system dark mode setting
    flag(out, "NSRequiresAquaSystemAppearance", false);
    out << "</dict>\n";
    out << "</plist>\n";
    return out.str();
}

Result<fs::path, PackError> MacOsPackager::build_app(const PackageRequest& request,
                                                     const fs::path& exe) {
    const auto& app = config_.app;
    std::string exe_name = app.executable_name(OsFamily::MacOS);
    fs::path bundle = request.staging_dir / (app.name + ".app");
    fs::path contents = bundle / "Contents";

    std::error_code ec;
    fs::create_directories(contents / "MacOS", ec);
    fs::create_directories(contents / "Resources", ec);
    fs::copy_file(exe, contents / "MacOS" / exe_name, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return PackError(ErrorKind::PackagingFailed, "cannot assemble the application bundle")
            .with("path", bundle.string())
            .with("detail", ec.message());
    }
    fs::permissions(contents / "MacOS" / exe_name, fs::perms(0755), ec);

    std::string icon_file;
    fs::path icon = config_.root / app.icon_macos;
    if (!app.icon_macos.empty() && fs::is_regular_file(icon, ec)) {
        icon_file = icon.filename().string();
        fs::copy_file(icon, contents / "Resources" / icon_file,
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            LSPACK_LOG_WARN("package", "Could not copy icon: " << ec.message());
            icon_file.clear();
        }
    }

    auto plist = write_text_file(contents / "Info.plist", render_info_plist(app, icon_file));
    if (is_err(plist))
        return unwrap_err(plist);
    auto pkg_info = write_text_file(contents / "PkgInfo", "APPL????");
    if (is_err(pkg_info))
        return unwrap_err(pkg_info);

    if (config_.package.sign) {
        proc::ProcessSpec spec;
        spec.program = "codesign";
        spec.args = {"--force", "--deep", "--sign", config_.package.codesign_identity,
                     bundle.string()};
        spec.timeout_seconds = config_.package.tool_timeout_seconds;
        LSPACK_LOG_INFO("package", "Signing " << bundle.filename().string() << " as "
                                              << config_.package.codesign_identity);
        auto signed_result = run_tool(spec, "codesign");
        if (is_err(signed_result))
            return unwrap_err(signed_result);
    }
    return bundle;
}

Result<fs::path, PackError> MacOsPackager::build_disk_image(const PackageRequest& request,
                                                            const fs::path& app) {
    const auto& cfg = config_.app;
    fs::path dmg_dir = request.staging_dir / "dmg";
    fs::path image =
        request.staging_dir / (cfg.artifact_stem() + "-" + cfg.version + "-macOS.dmg");

    std::error_code ec;
    fs::create_directories(dmg_dir, ec);
    fs::rename(app, dmg_dir / app.filename(), ec);
    if (!ec) {
        fs::create_directory_symlink("/Applications", dmg_dir / "Applications", ec);
    }
    if (ec) {
        return PackError(ErrorKind::PackagingFailed, "cannot prepare the disk image folder")
            .with("path", dmg_dir.string())
            .with("detail", ec.message());
    }

    proc::ProcessSpec spec;
    spec.program = "hdiutil";
    spec.args = {"create", "-volname", cfg.name, "-srcfolder", dmg_dir.string(),
                 "-ov",    "-format",  "UDZO",   image.string()};
    spec.timeout_seconds = config_.package.tool_timeout_seconds;
    LSPACK_LOG_INFO("package", "Creating disk image " << image.filename().string());
    auto ran = run_tool(spec, "hdiutil");
    if (is_err(ran))
        return unwrap_err(ran);
    return image;
}

Result<Packager::Staged, PackError> MacOsPackager::stage(const PackageRequest& request) {
    auto frozen = freeze(request);
    if (is_err(frozen))
        return unwrap_err(frozen);

    auto app = build_app(request, unwrap(frozen));
    if (is_err(app))
        return unwrap_err(app);

    if (!config_.package.disk_image) {
        return Staged{unwrap(app), ArtifactKind::AppBundle};
    }

    auto image = build_disk_image(request, unwrap(app));
    if (is_err(image))
        return unwrap_err(image);
    return Staged{unwrap(image), ArtifactKind::DiskImage};
}

} // namespace lspack::pkg
