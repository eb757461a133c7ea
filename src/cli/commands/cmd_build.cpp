//! # Build Commands
//!
//! `lspack build`, `lspack detect` and `lspack clean`. All three accept the
//! target selection options (`--project`, `--target`, `--arch`, `--accel`);
//! `build` and `clean` also take `--output` and `--work`.

#include "cmd_build.hpp"

#include "build/orchestrator.hpp"
#include "cli/utils.hpp"
#include "env/build_lock.hpp"
#include "log/log.hpp"
#include "platform/host_inspector.hpp"
#include "platform/platform_resolver.hpp"
#include "process/network_checker.hpp"
#include "process/process.hpp"

#include <iostream>

namespace lspack::cli {

namespace {

struct TargetArgs {
    std::string project;
    std::string output;
    std::string work;
    ResolveOptions resolve;
};

/// Consumes a target selection option at `argv[i]`. Returns true if the
/// argument was one; `ok` turns false on a bad value.
bool parse_target_arg(int argc, char* argv[], int& i, TargetArgs& args, bool& ok) {
    std::string value;
    if (take_value(argc, argv, i, "--project", args.project, ok))
        return true;
    if (take_value(argc, argv, i, "--output", args.output, ok))
        return true;
    if (take_value(argc, argv, i, "--work", args.work, ok))
        return true;

    if (take_value(argc, argv, i, "--target", value, ok)) {
        if (!ok || value == "host")
            return true;
        args.resolve.os = parse_os_family(value);
        if (!args.resolve.os) {
            std::cerr << "error: unknown target '" << value
                      << "' (expected host, macos, windows or linux)\n";
            ok = false;
        }
        return true;
    }
    if (take_value(argc, argv, i, "--arch", value, ok)) {
        if (!ok)
            return true;
        args.resolve.arch = parse_arch(value);
        if (!args.resolve.arch) {
            std::cerr << "error: unknown architecture '" << value << "'\n";
            ok = false;
        }
        return true;
    }
    if (take_value(argc, argv, i, "--accel", value, ok)) {
        if (!ok || value == "auto")
            return true;
        args.resolve.acceleration = parse_acceleration(value);
        if (!args.resolve.acceleration) {
            std::cerr << "error: unknown acceleration '" << value
                      << "' (expected auto, none, metal or cuda)\n";
            ok = false;
        }
        return true;
    }
    return false;
}

int unknown_option(const std::string& command, const std::string& arg) {
    std::cerr << "error: unknown option '" << arg << "' for '" << command << "'\n";
    std::cerr << "Run 'lspack --help' for usage.\n";
    return 1;
}

} // namespace

// ============================================================================
// build
// ============================================================================

int run_build(int argc, char* argv[]) {
    TargetArgs args;
    bool offline = false;
    bool no_disk_image = false;
    bool shortcut = false;
    std::string sign_identity;
    bool ok = true;

    for (int i = 2; i < argc && ok; ++i) {
        std::string arg = argv[i];
        if (parse_target_arg(argc, argv, i, args, ok))
            continue;
        if (take_value(argc, argv, i, "--sign", sign_identity, ok))
            continue;
        if (arg == "--offline") {
            offline = true;
        } else if (arg == "--no-disk-image") {
            no_disk_image = true;
        } else if (arg == "--shortcut") {
            shortcut = true;
        } else if (!log::is_log_option(arg)) {
            return unknown_option("build", arg);
        }
    }
    if (!ok)
        return 1;

    auto project = load_project(args.project);
    if (!project)
        return 1;
    config::ProjectConfig& config = *project;
    if (no_disk_image)
        config.package.disk_image = false;
    if (shortcut)
        config.package.desktop_shortcut = true;
    if (!sign_identity.empty()) {
        config.package.sign = true;
        config.package.codesign_identity = sign_identity;
    }

    build::BuildOptions options;
    options.resolve = args.resolve;
    options.output_dir = args.output;
    options.work_dir = args.work;
    options.offline = offline;

    proc::SystemProcessRunner runner;
    SystemHostInspector host(runner);
    proc::SocketNetworkChecker network;
    build::BuildOrchestrator orchestrator(config, {runner, host, network}, options);

    auto report = orchestrator.run();
    if (!report.succeeded()) {
        std::string step = to_string(report.failed_step.value_or(build::BuildState::Init));
        report_error(*report.error, "build failed at " + step + ": ");
        return report.error->kind == ErrorKind::Interrupted ? 130 : 1;
    }

    for (const auto& warning : report.warnings) {
        std::cerr << "warning: " << warning << "\n";
    }
    const auto& artifact = *report.artifact;
    std::cout << "Built " << pkg::to_string(artifact.kind) << " for "
              << artifact.target.describe() << "\n";
    std::cout << "  " << artifact.path.string() << " (" << artifact.size_bytes << " bytes)\n";
    std::cout << "  manifest " << report.manifest_fingerprint << "\n";
    return 0;
}

// ============================================================================
// detect
// ============================================================================

int run_detect(int argc, char* argv[]) {
    TargetArgs args;
    bool ok = true;
    for (int i = 2; i < argc && ok; ++i) {
        std::string arg = argv[i];
        if (parse_target_arg(argc, argv, i, args, ok))
            continue;
        if (!log::is_log_option(arg))
            return unknown_option("detect", arg);
    }
    if (!ok)
        return 1;

    proc::SystemProcessRunner runner;
    SystemHostInspector host(runner);
    auto resolved = resolve_profile(host, args.resolve);
    if (is_err(resolved)) {
        report_error(unwrap_err(resolved));
        return 1;
    }

    const auto& profile = unwrap(resolved);
    for (const auto& warning : profile.warnings) {
        std::cerr << "warning: " << warning << "\n";
    }
    std::cout << "os:           " << to_string(profile.target.os) << "\n";
    std::cout << "arch:         " << to_string(profile.target.arch) << "\n";
    std::cout << "acceleration: " << to_string(profile.target.acceleration) << "\n";
    std::cout << "key:          " << profile.target.key() << "\n";
    return 0;
}

// ============================================================================
// clean
// ============================================================================

int run_clean(int argc, char* argv[]) {
    TargetArgs args;
    bool ok = true;
    for (int i = 2; i < argc && ok; ++i) {
        std::string arg = argv[i];
        if (parse_target_arg(argc, argv, i, args, ok))
            continue;
        if (!log::is_log_option(arg))
            return unknown_option("clean", arg);
    }
    if (!ok)
        return 1;

    auto project = load_project(args.project);
    if (!project)
        return 1;

    proc::SystemProcessRunner runner;
    SystemHostInspector host(runner);
    auto target = resolve_build_target(host, args.resolve);
    if (is_err(target)) {
        report_error(unwrap_err(target));
        return 1;
    }
    std::string key = unwrap(target).key();

    fs::path output = args.output.empty() ? project->root / "dist" : fs::path(args.output);
    fs::path work = args.work.empty() ? project->root / "build" : fs::path(args.work);

    // A running build of the same target keeps its trees
    auto locks = env::acquire_target_locks(work, output, key);
    if (is_err(locks)) {
        report_error(unwrap_err(locks));
        return 1;
    }

    int failures = 0;
    for (const fs::path& dir : {output / key, work / "env" / key, work / key}) {
        std::error_code ec;
        auto removed = fs::remove_all(dir, ec);
        if (ec) {
            std::cerr << "error: cannot remove " << dir.string() << ": " << ec.message() << "\n";
            ++failures;
        } else if (removed > 0) {
            LSPACK_LOG_INFO("cli", "Removed " << dir.string());
        }
    }
    std::cout << "Cleaned " << key << "\n";
    return failures == 0 ? 0 : 1;
}

} // namespace lspack::cli
