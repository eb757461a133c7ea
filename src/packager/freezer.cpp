#include "packager/freezer.hpp"

#include "log/log.hpp"
#include "packager/packager.hpp"

#include <sstream>

namespace lspack::pkg {

std::string py_literal(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\'':
            out += "\\'";
            break;
        case '\n':
            out += "\\n";
            break;
        default:
            out += c;
        }
    }
    out += "'";
    return out;
}

static std::string dest_dir(const std::string& dest) {
    size_t slash = dest.rfind('/');
    return slash == std::string::npos ? "." : dest.substr(0, slash);
}

std::string Freezer::executable_file(OsFamily os) const {
    std::string name = config_.app.executable_name(os);
    if (os == OsFamily::Windows)
        name += ".exe";
    return name;
}

fs::path Freezer::icon_path(OsFamily os) const {
    const std::string* icon = &config_.app.icon_linux;
    if (os == OsFamily::MacOS)
        icon = &config_.app.icon_macos;
    else if (os == OsFamily::Windows)
        icon = &config_.app.icon_windows;

    if (icon->empty())
        return {};
    fs::path path = config_.root / *icon;
    std::error_code ec;
    return fs::is_regular_file(path, ec) ? path : fs::path{};
}

std::string Freezer::render_spec(const bundle::BundleManifest& manifest,
                                 const BuildTarget& target) const {
    std::ostringstream out;
    out << "# -*- mode: python ; coding: utf-8 -*-\n";
    out << "# " << config_.app.name << " " << config_.app.version << " for " << target.key()
        << ", fingerprint " << manifest.fingerprint() << "\n\n";

    out << "a = Analysis(\n";
    out << "    [" << py_literal(manifest.entry_script.string()) << "],\n";
    out << "    pathex=[" << py_literal(config_.root.string()) << "],\n";

    out << "    binaries=[\n";
    for (const auto* entry : manifest.native_binaries()) {
        out << "        (" << py_literal(entry->source.string()) << ", "
            << py_literal(dest_dir(entry->dest)) << "),\n";
    }
    out << "    ],\n";

    out << "    datas=[\n";
    for (const auto* entry : manifest.regular_files()) {
        out << "        (" << py_literal(entry->source.string()) << ", "
            << py_literal(dest_dir(entry->dest)) << "),\n";
    }
    out << "    ],\n";

    out << "    hiddenimports=[\n";
    for (const auto& module : manifest.hidden_modules) {
        out << "        " << py_literal(module) << ",\n";
    }
    out << "    ],\n";
    out << "    hookspath=[],\n";
    out << "    runtime_hooks=[],\n";

    out << "    excludes=[\n";
    for (const auto& module : manifest.excluded_modules) {
        out << "        " << py_literal(module) << ",\n";
    }
    out << "    ],\n";
    out << "    noarchive=False,\n";
    out << ")\n";
    out << "pyz = PYZ(a.pure)\n\n";

    bool macos = target.os == OsFamily::MacOS;
    out << "exe = EXE(\n";
    out << "    pyz,\n";
    out << "    a.scripts,\n";
    out << "    a.binaries,\n";
    out << "    a.datas,\n";
    out << "    [],\n";
    out << "    name=" << py_literal(config_.app.executable_name(target.os)) << ",\n";
    out << "    debug=False,\n";
    out << "    strip=False,\n";
    out << "    upx=True,\n";
    out << "    console=False,\n";
    out << "    argv_emulation=" << (macos ? "True" : "False") << ",\n";
    if (macos) {
        out << "    target_arch=" << py_literal(to_string(target.arch)) << ",\n";
    }
    out << "    codesign_identity=None,\n";
    fs::path icon = icon_path(target.os);
    if (!icon.empty()) {
        out << "    icon=" << py_literal(icon.string()) << ",\n";
    }
    out << ")\n";
    return out.str();
}

Result<fs::path, PackError> Freezer::freeze(const bundle::BundleManifest& manifest,
                                            const BuildTarget& target, const fs::path& python,
                                            const fs::path& work_dir) {
    fs::path spec_path = work_dir / (config_.app.id + ".spec");
    auto written = write_text_file(spec_path, render_spec(manifest, target));
    if (is_err(written))
        return unwrap_err(written);

    fs::path dist = work_dir / "dist";
    proc::ProcessSpec spec;
    spec.program = python.string();
    spec.args = {"-m",         config_.package.freezer_module,
                 "--noconfirm", "--clean",
                 "--distpath", dist.string(),
                 "--workpath", (work_dir / "build").string(),
                 spec_path.string()};
    spec.working_dir = config_.root;
    spec.timeout_seconds = config_.package.tool_timeout_seconds;

    LSPACK_LOG_INFO("package", "Freezing " << manifest.entries().size() << " entries with "
                                           << config_.package.freezer_module);
    LSPACK_LOG_DEBUG("package", "$ " << spec.command_line());
    auto result = runner_.run(spec);
    if (result.interrupted) {
        return PackError(ErrorKind::Interrupted, "freezer interrupted");
    }
    if (!result.succeeded()) {
        return PackError(ErrorKind::PackagingFailed, "freezer failed")
            .with("detail", result.failure_summary())
            .with("spec", spec_path.string());
    }

    fs::path exe = dist / executable_file(target.os);
    std::error_code ec;
    if (!fs::is_regular_file(exe, ec)) {
        return PackError(ErrorKind::PackagingFailed, "freezer produced no executable")
            .with("expected", exe.string());
    }
    return exe;
}

} // namespace lspack::pkg
