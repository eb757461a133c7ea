#include "config/project_config.hpp"

#include "config/toml_parser.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <set>

namespace lspack::config {

// ============================================================================
// AppConfig
// ============================================================================

std::string AppConfig::executable_name(OsFamily os) const {
    return os == OsFamily::Linux ? id : name;
}

std::string AppConfig::artifact_stem() const {
    std::string stem = name;
    std::replace(stem.begin(), stem.end(), ' ', '-');
    return stem;
}

bool AppConfig::supports(OsFamily os) const {
    return std::find(platforms.begin(), platforms.end(), os) != platforms.end();
}

// ============================================================================
// Table Reader
// ============================================================================

namespace {

/// Copies typed values out of a parsed table, remembering the first type
/// error and warning about keys it does not know.
class TableReader {
public:
    TableReader(const TomlTable& table, std::string section)
        : table_(table), section_(std::move(section)) {}

    void read(const std::string& key, std::string& out) {
        if (auto* v = lookup<std::string>(key, "a string"))
            out = *v;
    }

    void read(const std::string& key, int& out) {
        if (auto* v = lookup<int64_t>(key, "an integer")) {
            if (*v < 0 || *v > INT32_MAX) {
                fail(key, "is out of range");
                return;
            }
            out = static_cast<int>(*v);
        }
    }

    void read(const std::string& key, bool& out) {
        if (auto* v = lookup<bool>(key, "a boolean"))
            out = *v;
    }

    void read(const std::string& key, std::vector<std::string>& out) {
        if (auto* v = lookup<std::vector<std::string>>(key, "an array of strings"))
            out = *v;
    }

    void read_platforms(const std::string& key, std::vector<OsFamily>& out) {
        std::vector<std::string> names;
        if (!table_.has(key))
            return;
        read(key, names);
        if (error_)
            return;
        out.clear();
        for (const auto& name : names) {
            auto os = parse_os_family(name);
            if (!os) {
                fail(key, "contains unknown platform '" + name + "'");
                return;
            }
            out.push_back(*os);
        }
    }

    void warn_unknown(const std::set<std::string>& known) const {
        for (const auto& [key, _] : table_.values) {
            if (known.count(key) == 0) {
                LSPACK_LOG_WARN("config", "Ignoring unknown key '" << key << "' in [" << section_
                                                                   << "]");
            }
        }
    }

    void fail(const std::string& key, const std::string& what) {
        if (error_)
            return;
        PackError err(ErrorKind::ConfigInvalid, "[" + section_ + "] " + key + " " + what);
        auto line = table_.lines.find(key);
        if (line != table_.lines.end()) {
            err.with("line", std::to_string(line->second));
        }
        error_ = std::move(err);
    }

    const std::optional<PackError>& error() const {
        return error_;
    }

private:
    template <typename T> const T* lookup(const std::string& key, const char* expected) {
        auto it = table_.values.find(key);
        if (it == table_.values.end())
            return nullptr;
        const T* value = std::get_if<T>(&it->second);
        if (value == nullptr) {
            fail(key, std::string("must be ") + expected);
        }
        return value;
    }

    const TomlTable& table_;
    std::string section_;
    std::optional<PackError> error_;
};

std::optional<PackError> read_app(const TomlTable& table, AppConfig& app) {
    TableReader r(table, "app");
    r.read("name", app.name);
    r.read("id", app.id);
    r.read("version", app.version);
    r.read("identifier", app.identifier);
    r.read("entry", app.entry);
    r.read("comment", app.comment);
    r.read("categories", app.categories);
    r.read("icon-macos", app.icon_macos);
    r.read("icon-windows", app.icon_windows);
    r.read("icon-linux", app.icon_linux);
    r.read_platforms("platforms", app.platforms);
    r.warn_unknown({"name", "id", "version", "identifier", "entry", "comment", "categories",
                    "icon-macos", "icon-windows", "icon-linux", "platforms"});

    if (!r.error()) {
        if (app.name.empty())
            r.fail("name", "must not be empty");
        else if (app.id.empty() || app.id.find_first_of(" /\\") != std::string::npos)
            r.fail("id", "must be a non-empty name without spaces or slashes");
        else if (app.platforms.empty())
            r.fail("platforms", "must name at least one platform");
    }
    return r.error();
}

std::optional<PackError> read_bundle(const TomlTable& table, BundleConfig& bundle) {
    TableReader r(table, "bundle");
    r.read("sources", bundle.sources);
    r.read("exclude", bundle.exclude);
    r.read("exclude-binaries", bundle.exclude_binaries);
    r.read("exclude-modules", bundle.exclude_modules);
    r.read("required", bundle.required);
    r.read("hidden-modules", bundle.hidden_modules);
    r.read("gui-backends-macos", bundle.gui_backends[OsFamily::MacOS]);
    r.read("gui-backends-windows", bundle.gui_backends[OsFamily::Windows]);
    r.read("gui-backends-linux", bundle.gui_backends[OsFamily::Linux]);
    r.warn_unknown({"sources", "exclude", "exclude-binaries", "exclude-modules", "required",
                    "hidden-modules", "gui-backends-macos", "gui-backends-windows",
                    "gui-backends-linux"});
    return r.error();
}

std::optional<PackError> read_environment(const TomlTable& table, EnvironmentConfig& env) {
    TableReader r(table, "environment");
    r.read("python", env.python);
    r.read("conflict-markers", env.conflict_markers);
    r.read("search-path-vars", env.search_path_vars);
    r.read("unset-vars", env.unset_vars);
    r.read("index-check-url", env.index_check_url);
    r.read("install-timeout", env.install_timeout_seconds);
    r.warn_unknown({"python", "conflict-markers", "search-path-vars", "unset-vars",
                    "index-check-url", "install-timeout"});
    if (!r.error() && env.python.empty())
        r.fail("python", "must not be empty");
    return r.error();
}

std::optional<PackError> read_package(const TomlTable& table, PackageConfig& pkg) {
    TableReader r(table, "package");
    r.read("disk-image", pkg.disk_image);
    r.read("sign", pkg.sign);
    r.read("codesign-identity", pkg.codesign_identity);
    r.read("desktop-shortcut", pkg.desktop_shortcut);
    r.read("shortcut-dir", pkg.shortcut_dir);
    r.read("image-tool", pkg.image_tool);
    r.read("freezer-module", pkg.freezer_module);
    r.read("tool-timeout", pkg.tool_timeout_seconds);
    r.warn_unknown({"disk-image", "sign", "codesign-identity", "desktop-shortcut",
                    "shortcut-dir", "image-tool", "freezer-module", "tool-timeout"});
    return r.error();
}

std::optional<PackError> read_container(const TomlTable& table, ContainerConfig& container) {
    TableReader r(table, "container");
    r.read("ui-port", container.ui_port);
    r.read("api-port", container.api_port);
    r.read("health-path", container.health_path);
    r.read("cpu-base", container.cpu_base);
    r.read("cuda-base", container.cuda_base);
    r.read("module", container.module);
    r.warn_unknown({"ui-port", "api-port", "health-path", "cpu-base", "cuda-base", "module"});
    if (!r.error()) {
        if (container.ui_port == 0 || container.ui_port > 65535)
            r.fail("ui-port", "must be a TCP port");
        else if (container.api_port == 0 || container.api_port > 65535)
            r.fail("api-port", "must be a TCP port");
        else if (container.health_path.empty() || container.health_path[0] != '/')
            r.fail("health-path", "must start with '/'");
    }
    return r.error();
}

std::optional<PackError> read_dependency(const TomlTable& table, size_t index,
                                         deps::DependencySpec& spec) {
    TableReader r(table, "dependency #" + std::to_string(index + 1));
    std::vector<std::string> strategies;
    std::string index_url;
    std::string cuda_variant;
    std::string cmake_args;

    r.read("name", spec.name);
    r.read("requirement", spec.requirement);
    r.read("required", spec.required);
    r.read("strategies", strategies);
    r.read("index-url", index_url);
    r.read("cuda-variant", cuda_variant);
    r.read("cmake-args", cmake_args);
    r.read("collect", spec.collect_packages);
    r.read("data", spec.runtime_data);
    r.read("hidden-modules", spec.hidden_modules);
    r.read_platforms("only-on", spec.only_on);
    r.read("tool", spec.tool);
    r.warn_unknown({"name", "requirement", "required", "strategies", "index-url", "cuda-variant",
                    "cmake-args", "collect", "data", "hidden-modules", "only-on", "tool"});

    if (r.error())
        return r.error();

    if (spec.name.empty()) {
        r.fail("name", "is required");
        return r.error();
    }
    if (spec.requirement.empty())
        spec.requirement = spec.name;

    for (const auto& kind_name : strategies) {
        auto kind = deps::parse_strategy_kind(kind_name);
        if (!kind) {
            r.fail("strategies", "contains unknown strategy '" + kind_name + "'");
            return r.error();
        }
        deps::StrategySpec strategy{*kind, {}};
        if (*kind == deps::StrategyKind::PrebuiltFetch) {
            if (!index_url.empty())
                strategy.parameters["index-url"] = index_url;
            if (!cuda_variant.empty())
                strategy.parameters["cuda-variant"] = cuda_variant;
        } else if (!cmake_args.empty()) {
            strategy.parameters["cmake-args"] = cmake_args;
        }
        spec.acquisition_order.push_back(std::move(strategy));
    }

    return std::nullopt;
}

} // namespace

// ============================================================================
// ProjectConfig
// ============================================================================

ProjectConfig ProjectConfig::defaults(const fs::path& root) {
    ProjectConfig config;
    config.root = root;
    return config;
}

Result<ProjectConfig, PackError> ProjectConfig::parse(const std::string& content,
                                                      const fs::path& root) {
    SimpleTomlParser parser(content);
    auto doc = parser.parse();
    if (!doc) {
        return PackError(ErrorKind::ConfigInvalid, "malformed " + std::string(CONFIG_FILE_NAME))
            .with("detail", parser.get_error());
    }

    ProjectConfig config = defaults(root);

    for (const auto& [name, table] : doc->tables) {
        std::optional<PackError> err;
        if (name == "app") {
            err = read_app(table, config.app);
        } else if (name == "bundle") {
            err = read_bundle(table, config.bundle);
        } else if (name == "environment") {
            err = read_environment(table, config.environment);
        } else if (name == "package") {
            err = read_package(table, config.package);
        } else if (name == "container") {
            err = read_container(table, config.container);
        } else if (name.empty()) {
            if (!table.values.empty()) {
                LSPACK_LOG_WARN("config", "Ignoring keys outside of any section");
            }
        } else {
            LSPACK_LOG_WARN("config", "Ignoring unknown section [" << name << "]");
        }
        if (err) {
            return *err;
        }
    }

    const auto& dep_tables = doc->array("dependency");
    if (!dep_tables.empty()) {
        config.dependencies.clear();
        for (size_t i = 0; i < dep_tables.size(); ++i) {
            deps::DependencySpec spec;
            if (auto err = read_dependency(dep_tables[i], i, spec)) {
                return *err;
            }
            config.dependencies.push_back(std::move(spec));
        }
    }
    for (const auto& [name, _] : doc->table_arrays) {
        if (name != "dependency") {
            LSPACK_LOG_WARN("config", "Ignoring unknown section [[" << name << "]]");
        }
    }

    auto valid = deps::validate_dependencies(config.dependencies);
    if (is_err(valid)) {
        return unwrap_err(valid);
    }

    return config;
}

Result<ProjectConfig, PackError> ProjectConfig::load(const fs::path& root) {
    fs::path path = root / CONFIG_FILE_NAME;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LSPACK_LOG_DEBUG("config", "No " << CONFIG_FILE_NAME << " in " << root.string()
                                         << ", using built-in defaults");
        return defaults(root);
    }

    std::ifstream file(path);
    if (!file) {
        return PackError(ErrorKind::ConfigInvalid, "cannot read configuration file")
            .with("path", path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    LSPACK_LOG_DEBUG("config", "Loading " << path.string());

    auto result = parse(content, root);
    if (is_err(result)) {
        unwrap_err(result).with("path", path.string());
    }
    return result;
}

} // namespace lspack::config
