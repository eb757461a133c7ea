#include "packager/windows_packager.hpp"

#include "log/log.hpp"

namespace lspack::pkg {

// PowerShell single-quoted literal
static std::string ps_literal(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'')
            out += "''";
        else
            out += c;
    }
    out += "'";
    return out;
}

std::string shortcut_script(const fs::path& lnk, const fs::path& exe) {
    std::string out;
    out += "$s = (New-Object -ComObject WScript.Shell).CreateShortcut(" +
           ps_literal(lnk.string()) + "); ";
    out += "$s.TargetPath = " + ps_literal(exe.string()) + "; ";
    out += "$s.WorkingDirectory = " + ps_literal(exe.parent_path().string()) + "; ";
    out += "$s.IconLocation = " + ps_literal(exe.string()) + "; ";
    out += "$s.Save()";
    return out;
}

Result<Packager::Staged, PackError> WindowsPackager::stage(const PackageRequest& request) {
    auto frozen = freeze(request);
    if (is_err(frozen))
        return unwrap_err(frozen);
    return Staged{unwrap(frozen), ArtifactKind::InstallerExe};
}

fs::path WindowsPackager::shortcut_dir() const {
    if (!config_.package.shortcut_dir.empty())
        return fs::path(config_.package.shortcut_dir);
    auto profile = proc::get_env("USERPROFILE");
    if (!profile)
        return {};
    return fs::path(*profile) / "Desktop";
}

void WindowsPackager::after_publish(const PackageArtifact& artifact) {
    if (!config_.package.desktop_shortcut)
        return;

    fs::path dir = shortcut_dir();
    if (dir.empty()) {
        LSPACK_LOG_WARN("package", "No desktop folder found, skipping the shortcut");
        return;
    }
    fs::path lnk = dir / (config_.app.name + ".lnk");
    std::error_code ec;
    fs::path exe = fs::absolute(artifact.path, ec);
    if (ec)
        exe = artifact.path;

    proc::ProcessSpec spec;
    spec.program = "powershell";
    spec.args = {"-NoProfile", "-NonInteractive", "-Command",
                 shortcut_script(lnk, exe)};
    spec.timeout_seconds = 60;
    auto ran = run_tool(spec, "shortcut creation");
    if (is_err(ran)) {
        LSPACK_LOG_WARN("package", "Desktop shortcut not created: " << unwrap_err(ran).describe());
        return;
    }
    LSPACK_LOG_INFO("package", "Desktop shortcut created at " << lnk.string());
}

} // namespace lspack::pkg
