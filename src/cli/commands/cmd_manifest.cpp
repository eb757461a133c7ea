//! # Manifest Check Command
//!
//! `lspack manifest-check --manifest FILE` compares a persisted manifest with
//! the files it lists and reports missing or modified entries.

#include "cmd_manifest.hpp"

#include "bundle/manifest.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>

namespace lspack::cli {

int run_manifest_check(int argc, char* argv[]) {
    std::string manifest_path;
    bool ok = true;
    for (int i = 2; i < argc && ok; ++i) {
        std::string arg = argv[i];
        if (take_value(argc, argv, i, "--manifest", manifest_path, ok))
            continue;
        if (manifest_path.empty() && !arg.starts_with("-")) {
            manifest_path = arg;
        } else if (!log::is_log_option(arg)) {
            std::cerr << "error: unknown option '" << arg << "' for 'manifest-check'\n";
            return 1;
        }
    }
    if (!ok)
        return 1;
    if (manifest_path.empty()) {
        std::cerr << "Usage: lspack manifest-check --manifest <manifest.json>\n";
        return 1;
    }

    auto verified = bundle::verify_manifest_file(manifest_path);
    if (is_err(verified)) {
        report_error(unwrap_err(verified));
        return 1;
    }

    const auto& report = unwrap(verified);
    for (const auto& dest : report.missing) {
        std::cout << "missing   " << dest << "\n";
    }
    for (const auto& dest : report.modified) {
        std::cout << "modified  " << dest << "\n";
    }
    if (report.ok()) {
        std::cout << "OK: " << report.checked << " entries match the recorded fingerprint\n";
        return 0;
    }
    std::cout << "FAILED: " << report.missing.size() << " missing, " << report.modified.size()
              << " modified of " << report.checked << " entries\n";
    return 1;
}

} // namespace lspack::cli
