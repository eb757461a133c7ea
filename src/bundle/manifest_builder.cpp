#include "bundle/manifest_builder.hpp"

#include "bundle/exclusion.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace lspack::bundle {

namespace {

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// Bytecode caches are regenerated by the freezer.
bool is_build_artifact(const fs::path& rel) {
    for (const auto& part : rel) {
        if (part == "__pycache__")
            return true;
    }
    return rel.extension() == ".pyc" || rel.extension() == ".pyo";
}

/// Walks `dir` in sorted order and calls `fn(abs_path, rel_generic)` for
/// every regular file.
template <typename Fn> Result<Unit, PackError> walk_tree(const fs::path& dir, Fn&& fn) {
    std::error_code ec;
    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return PackError(ErrorKind::ManifestIncomplete, "cannot scan directory")
            .with("path", dir.string())
            .with("detail", ec.message());
    }
    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
        fs::path rel = file.lexically_relative(dir);
        if (is_build_artifact(rel))
            continue;
        auto result = fn(file, rel.generic_string());
        if (is_err(result))
            return result;
    }
    return Unit{};
}

} // namespace

bool is_native_library(std::string_view name) {
    if (ends_with(name, ".so") || ends_with(name, ".dylib") || ends_with(name, ".dll") ||
        ends_with(name, ".pyd")) {
        return true;
    }
    // Versioned sonames: libfoo.so.1, libfoo.so.1.2.3
    size_t pos = name.find(".so.");
    if (pos == std::string_view::npos)
        return false;
    std::string_view tail = name.substr(pos + 4);
    return !tail.empty() && std::all_of(tail.begin(), tail.end(), [](char c) {
        return (c >= '0' && c <= '9') || c == '.';
    });
}

bool native_library_fits(std::string_view name, OsFamily os) {
    if (ends_with(name, ".dll") || ends_with(name, ".pyd"))
        return os == OsFamily::Windows;
    if (ends_with(name, ".dylib"))
        return os == OsFamily::MacOS;
    // .so is used by both Linux libraries and macOS extension modules
    return os != OsFamily::Windows;
}

// ============================================================================
// Collection
// ============================================================================

Result<Unit, PackError> ManifestBuilder::collect_sources(BundleManifest& manifest) const {
    for (const auto& tree : config_.bundle.sources) {
        fs::path dir = config_.root / tree;
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            LSPACK_LOG_WARN("bundle", "Source tree '" << tree << "' not found at " << dir.string());
            continue;
        }
        auto result = walk_tree(dir, [&](const fs::path& file, const std::string& rel) {
            return manifest.add({file, tree + "/" + rel, EntryKind::Regular, tree, ""});
        });
        if (is_err(result))
            return result;
    }
    return Unit{};
}

Result<Unit, PackError> ManifestBuilder::collect_dependency(BundleManifest& manifest,
                                                           const fs::path& site_packages,
                                                           const deps::DependencySpec& spec) const {
    for (const auto& module : spec.hidden_modules) {
        manifest.hidden_modules.insert(module);
    }

    for (const auto& package : spec.collect_packages) {
        fs::path dir = site_packages / package;
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            LSPACK_LOG_WARN("bundle", "Package '" << package << "' of " << spec.name
                                                  << " not found in " << site_packages.string());
            continue;
        }
        manifest.hidden_modules.insert(package);

        auto result = walk_tree(dir, [&](const fs::path& file,
                                         const std::string& rel) -> Result<Unit, PackError> {
            std::string name = file.filename().string();
            std::string dest = package + "/" + rel;

            if (is_native_library(name)) {
                return manifest.add({file, dest, EntryKind::NativeBinary, spec.name, ""});
            }
            // Python sources are found by the freezer through the module hints
            if (file.extension() == ".py")
                return Unit{};

            bool is_data = spec.runtime_data.empty() ||
                           std::any_of(spec.runtime_data.begin(), spec.runtime_data.end(),
                                       [&](const std::string& glob) { return glob_match(glob, rel); });
            if (!is_data)
                return Unit{};
            return manifest.add({file, dest, EntryKind::Regular, spec.name, ""});
        });
        if (is_err(result))
            return result;
    }
    return Unit{};
}

// ============================================================================
// Filtering
// ============================================================================

void ManifestBuilder::drop_foreign_platforms(BundleManifest& manifest,
                                             const BuildTarget& target) const {
    std::vector<std::string> foreign_modules;
    for (const auto& [os, modules] : config_.bundle.gui_backends) {
        if (os == target.os) {
            manifest.hidden_modules.insert(modules.begin(), modules.end());
        } else {
            foreign_modules.insert(foreign_modules.end(), modules.begin(), modules.end());
        }
    }

    std::string rule = std::string("platform:") + to_string(target.os);
    std::vector<std::string> drop;
    for (const auto& [dest, entry] : manifest.entries()) {
        bool foreign = std::any_of(foreign_modules.begin(), foreign_modules.end(),
                                   [&](const std::string& m) { return in_module(dest, m); });
        if (!foreign && entry.kind == EntryKind::NativeBinary) {
            foreign = !native_library_fits(entry.source.filename().string(), target.os);
        }
        if (foreign)
            drop.push_back(dest);
    }
    for (const auto& dest : drop) {
        manifest.exclude(dest, rule);
    }
}

void ManifestBuilder::apply_exclusions(BundleManifest& manifest) const {
    std::vector<ExclusionRule> all_rules;
    std::vector<ExclusionRule> binary_rules;
    for (const auto& text : config_.bundle.exclude) {
        all_rules.push_back(ExclusionRule::parse(text));
        manifest.excluded_patterns.push_back(text);
    }
    for (const auto& text : config_.bundle.exclude_binaries) {
        binary_rules.push_back(ExclusionRule::parse(text));
        manifest.excluded_patterns.push_back(text);
    }
    for (const auto& module : config_.bundle.exclude_modules) {
        manifest.excluded_modules.insert(module);
        manifest.hidden_modules.erase(module);
    }

    std::vector<std::pair<std::string, std::string>> drop;
    for (const auto& [dest, entry] : manifest.entries()) {
        const std::string* rule = nullptr;
        for (const auto& r : all_rules) {
            if (r.matches(dest)) {
                rule = &r.text;
                break;
            }
        }
        if (rule == nullptr && entry.kind == EntryKind::NativeBinary) {
            for (const auto& r : binary_rules) {
                if (r.matches(dest)) {
                    rule = &r.text;
                    break;
                }
            }
        }
        if (rule != nullptr) {
            drop.emplace_back(dest, *rule);
            continue;
        }
        for (const auto& module : config_.bundle.exclude_modules) {
            if (in_module(dest, module)) {
                drop.emplace_back(dest, "module:" + module);
                break;
            }
        }
    }
    for (const auto& [dest, rule] : drop) {
        LSPACK_LOG_DEBUG("bundle", "Excluded " << dest << " (" << rule << ")");
        manifest.exclude(dest, rule);
    }
}

std::vector<std::string> ManifestBuilder::required_entries(const BundleManifest& manifest) const {
    std::vector<std::string> dests;
    for (const auto& [dest, _] : manifest.entries()) {
        bool required = std::any_of(config_.bundle.required.begin(), config_.bundle.required.end(),
                                    [&](const std::string& glob) { return glob_match(glob, dest); });
        if (required)
            dests.push_back(dest);
    }
    return dests;
}

Result<Unit, PackError>
ManifestBuilder::check_required(const BundleManifest& manifest,
                                const std::vector<std::string>& required) const {
    for (const auto& glob : config_.bundle.required) {
        // Every entry a required glob matched for this target must survive the filters
        for (const auto& dest : required) {
            if (!glob_match(glob, dest) || manifest.contains(dest))
                continue;
            return PackError(ErrorKind::ManifestIncomplete,
                             "required entry '" + glob + "' was removed by a filter")
                .with("entry", dest)
                .with("rule", manifest.excluded_by(dest).value_or("unknown"));
        }

        bool present = std::any_of(manifest.entries().begin(), manifest.entries().end(),
                                   [&](const auto& kv) { return glob_match(glob, kv.first); });
        if (present)
            continue;

        for (const auto& excluded : manifest.excluded_entries()) {
            if (glob_match(glob, excluded.dest)) {
                return PackError(ErrorKind::ManifestIncomplete,
                                 "required entry '" + glob + "' was removed by a filter")
                    .with("entry", excluded.dest)
                    .with("rule", excluded.rule);
            }
        }
        return PackError(ErrorKind::ManifestIncomplete,
                         "required entry '" + glob + "' was never collected");
    }
    return Unit{};
}

// ============================================================================
// Build
// ============================================================================

Result<BundleManifest, PackError>
ManifestBuilder::build(const fs::path& site_packages,
                       const std::vector<deps::InstalledDependency>& installed,
                       const BuildTarget& target) const {
    BundleManifest manifest;
    manifest.target_key = target.key();
    manifest.entry_script = config_.root / config_.app.entry;

    std::error_code ec;
    if (!fs::is_regular_file(manifest.entry_script, ec)) {
        return PackError(ErrorKind::ManifestIncomplete, "entry script not found")
            .with("path", manifest.entry_script.string());
    }

    auto sources = collect_sources(manifest);
    if (is_err(sources))
        return unwrap_err(sources);

    for (const auto& dep : installed) {
        if (dep.spec.tool)
            continue;
        auto collected = collect_dependency(manifest, site_packages, dep.spec);
        if (is_err(collected))
            return unwrap_err(collected);
    }
    manifest.hidden_modules.insert(config_.bundle.hidden_modules.begin(),
                                   config_.bundle.hidden_modules.end());

    drop_foreign_platforms(manifest, target);
    auto required_set = required_entries(manifest);
    apply_exclusions(manifest);

    auto required = check_required(manifest, required_set);
    if (is_err(required))
        return unwrap_err(required);

    auto sealed = manifest.seal();
    if (is_err(sealed))
        return unwrap_err(sealed);

    LSPACK_LOG_INFO("bundle", "Manifest for " << manifest.target_key << ": "
                                              << manifest.regular_files().size() << " files, "
                                              << manifest.native_binaries().size()
                                              << " native binaries, "
                                              << manifest.excluded_entries().size() << " excluded");
    return manifest;
}

} // namespace lspack::bundle
