//! # CLI Utilities
//!
//! Argument helpers, project loading, error reporting and help text.

#include "utils.hpp"

#include <iostream>

namespace lspack::cli {

bool take_value(int argc, char* argv[], int& i, const std::string& name, std::string& out,
                bool& ok) {
    std::string arg = argv[i];
    if (arg.starts_with(name + "=")) {
        out = arg.substr(name.size() + 1);
        return true;
    }
    if (arg != name)
        return false;
    if (i + 1 >= argc) {
        std::cerr << "error: " << name << " requires a value\n";
        ok = false;
        return true;
    }
    out = argv[++i];
    return true;
}

std::optional<config::ProjectConfig> load_project(const std::string& project_dir) {
    std::error_code ec;
    fs::path root = fs::absolute(project_dir.empty() ? fs::path(".") : fs::path(project_dir), ec);
    if (ec) {
        std::cerr << "error: invalid project directory '" << project_dir << "'\n";
        return std::nullopt;
    }
    auto loaded = config::ProjectConfig::load(root.lexically_normal());
    if (is_err(loaded)) {
        report_error(unwrap_err(loaded));
        return std::nullopt;
    }
    return std::move(unwrap(loaded));
}

void report_error(const PackError& error, const std::string& prefix) {
    std::cerr << "error: " << prefix << error_kind_name(error.kind) << ": " << error.message
              << "\n";
    for (const auto& line : error.context) {
        std::cerr << "  " << line << "\n";
    }
}

void print_version() {
    std::cout << "lspack " << VERSION << "\n";
}

void print_usage() {
    std::cout << "lspack " << VERSION << " - build and package LocalLLM Studio\n\n";
    std::cout << "Usage: lspack <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  build            Build the installable artifact for a target\n";
    std::cout << "  detect           Print the resolved build target\n";
    std::cout << "  clean            Remove the output, environment and staging of a target\n";
    std::cout << "  manifest-check   Verify a persisted bundle manifest against the files\n";
    std::cout << "  container        Generate (and optionally build) a container image\n\n";
    std::cout << "Common options:\n";
    std::cout << "  --project DIR         Project root (default: current directory)\n";
    std::cout << "  --target OS           host, macos, windows or linux\n";
    std::cout << "  --accel MODE          auto, none, metal or cuda\n";
    std::cout << "  --arch ARCH           x86_64 or arm64\n\n";
    std::cout << "Build options:\n";
    std::cout << "  --output DIR          Artifact directory (default: <project>/dist)\n";
    std::cout << "  --work DIR            Work directory (default: <project>/build)\n";
    std::cout << "  --offline             Skip network acquisition strategies\n";
    std::cout << "  --no-disk-image       macOS: publish the .app instead of a .dmg\n";
    std::cout << "  --shortcut            Windows: create a desktop shortcut\n";
    std::cout << "  --sign IDENTITY       macOS: codesign the application bundle\n\n";
    std::cout << "Container options:\n";
    std::cout << "  --flavor cpu|cuda     Base image flavor (default: cpu)\n";
    std::cout << "  --output FILE         Dockerfile path\n";
    std::cout << "  --build               Run docker build afterwards\n";
    std::cout << "  --tag TAG             Image tag\n\n";
    std::cout << "Logging:\n";
    std::cout << "  -v, -vv, -q           More or less output\n";
    std::cout << "  --log-level=LEVEL     trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=SPEC     Per-module levels, e.g. deps=debug,*=warn\n";
    std::cout << "  --log-file=PATH       Also write logs to a file\n";
    std::cout << "  --log-format=json     Structured log output\n";
}

} // namespace lspack::cli
