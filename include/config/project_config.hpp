//! # Project Configuration
//!
//! Loads `lspack.toml` from the project root. Every setting has a default that
//! reproduces the stock LocalLLM Studio build, so a project without the file
//! builds exactly as the upstream scripts do.
//!
//! ## Sections
//!
//! | Section          | Type                | Description                          |
//! |------------------|---------------------|--------------------------------------|
//! | `[app]`          | `AppConfig`         | Name, id, version, icons, platforms  |
//! | `[bundle]`       | `BundleConfig`      | Source trees, filters, required set  |
//! | `[[dependency]]` | `deps::DependencySpec` | Replaces the default table        |
//! | `[environment]`  | `EnvironmentConfig` | Interpreter, search-path hygiene     |
//! | `[package]`      | `PackageConfig`     | Disk image, signing, shortcuts       |
//! | `[container]`    | `ContainerConfig`   | Container image generation           |

#ifndef LSPACK_CONFIG_PROJECT_CONFIG_HPP
#define LSPACK_CONFIG_PROJECT_CONFIG_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "deps/dependency_spec.hpp"
#include "platform/build_target.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace lspack::config {

namespace fs = std::filesystem;

/// Name of the configuration file looked up in the project root.
constexpr const char* CONFIG_FILE_NAME = "lspack.toml";

struct AppConfig {
    std::string name = "LocalLLM Studio";
    std::string id = "localllm-studio";
    std::string version = "1.0.0";
    std::string identifier = "com.localllm.studio";
    /// Entry script, relative to the project root.
    std::string entry = "desktop.py";
    std::string comment = "Run AI models privately on your device";
    std::vector<std::string> categories = {"Utility", "Development"};
    std::string icon_macos = "assets/icon.icns";
    std::string icon_windows = "assets/icon.ico";
    std::string icon_linux = "assets/icon.png";
    /// OS families this project can be packaged for.
    std::vector<OsFamily> platforms = {OsFamily::MacOS, OsFamily::Windows, OsFamily::Linux};

    /// "LocalLLM Studio" on macOS and Windows, the app id on Linux.
    std::string executable_name(OsFamily os) const;

    /// Name with spaces replaced by dashes, used in artifact file names.
    std::string artifact_stem() const;

    bool supports(OsFamily os) const;
};

struct BundleConfig {
    std::vector<std::string> sources = {"ui", "backends", "models", "utils"};
    /// Exclusion rules applied to every entry.
    std::vector<std::string> exclude;
    /// Exclusion rules applied to native binaries only.
    std::vector<std::string> exclude_binaries = {"prefix:libQt", "substr:test"};
    std::vector<std::string> exclude_modules = {"matplotlib", "numpy.testing", "scipy", "pandas",
                                                "PIL",        "tkinter",       "PyQt5", "PyQt6"};
    /// Destination globs that must survive filtering.
    std::vector<std::string> required = {"ui/**", "backends/**", "llama_cpp/**"};
    /// Hidden modules added on top of those declared by dependencies.
    std::vector<std::string> hidden_modules;
    /// GUI-shell backend modules per OS; only the target's set is bundled.
    std::map<OsFamily, std::vector<std::string>> gui_backends = {
        {OsFamily::MacOS, {"webview.platforms.cocoa"}},
        {OsFamily::Windows, {"webview.platforms.winforms", "webview.platforms.edgechromium"}},
        {OsFamily::Linux, {"webview.platforms.gtk"}},
    };
};

struct EnvironmentConfig {
#ifdef _WIN32
    std::string python = "python";
#else
    std::string python = "python3";
#endif
    std::vector<std::string> conflict_markers = {"anaconda", "miniconda"};
    std::vector<std::string> search_path_vars = {"PATH", "CPATH", "LIBRARY_PATH"};
    std::vector<std::string> unset_vars = {"CONDA_PREFIX"};
    /// Index checked for reachability before network strategies when no index-url is declared.
    std::string index_check_url = "https://pypi.org/simple/";
    int install_timeout_seconds = 3600;
};

struct PackageConfig {
    bool disk_image = true;
    bool sign = false;
    std::string codesign_identity = "-";
    bool desktop_shortcut = false;
    /// Empty = the user's desktop.
    std::string shortcut_dir;
    std::string image_tool = "appimagetool";
    std::string freezer_module = "PyInstaller";
    int tool_timeout_seconds = 3600;
};

struct ContainerConfig {
    int ui_port = 7860;
    int api_port = 8000;
    std::string health_path = "/health";
    std::string cpu_base = "python:3.11-slim";
    std::string cuda_base = "nvidia/cuda:12.1.0-runtime-ubuntu22.04";
    /// Python package run by the container's default command.
    std::string module = "localllm_studio";
};

struct ProjectConfig {
    fs::path root;
    AppConfig app;
    BundleConfig bundle;
    std::vector<deps::DependencySpec> dependencies = deps::default_dependencies();
    EnvironmentConfig environment;
    PackageConfig package;
    ContainerConfig container;

    /// Built-in configuration for a project root.
    static ProjectConfig defaults(const fs::path& root);

    /// Reads `<root>/lspack.toml` if present, otherwise returns the defaults.
    static Result<ProjectConfig, PackError> load(const fs::path& root);

    /// Parses configuration text. Unset keys keep their defaults; a
    /// `[[dependency]]` section replaces the whole default dependency table.
    static Result<ProjectConfig, PackError> parse(const std::string& content,
                                                  const fs::path& root);
};

} // namespace lspack::config

#endif // LSPACK_CONFIG_PROJECT_CONFIG_HPP
