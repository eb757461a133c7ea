//! # Dependency Specifications
//!
//! Declarative description of every package the bundled application needs,
//! including the ordered list of ways to obtain it.
//!
//! ## Strategy parameters
//!
//! | Kind       | Key            | Meaning                                        |
//! |------------|----------------|------------------------------------------------|
//! | `prebuilt` | `index-url`    | Extra package index; `{variant}` is replaced   |
//! |            |                | by `cpu`, `metal` or the CUDA variant          |
//! | `prebuilt` | `cuda-variant` | Index variant for CUDA targets (`cu121`)       |
//! | `source`   | `cmake-args`   | Base CMake arguments for the native build      |
//!
//! Prebuilt strategies must precede source strategies: a source build is the
//! fallback, never the first choice.

#ifndef LSPACK_DEPS_DEPENDENCY_SPEC_HPP
#define LSPACK_DEPS_DEPENDENCY_SPEC_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "platform/build_target.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lspack::deps {

enum class StrategyKind { PrebuiltFetch, SourceBuild };

/// "prebuilt" or "source".
const char* to_string(StrategyKind kind);

std::optional<StrategyKind> parse_strategy_kind(std::string_view s);

struct StrategySpec {
    StrategyKind kind;
    std::map<std::string, std::string> parameters;

    std::string param(const std::string& key, const std::string& fallback = "") const;
};

struct DependencySpec {
    /// Distribution name as the installer knows it ("llama-cpp-python").
    std::string name;
    /// Requirement string passed to the installer ("llama-cpp-python>=0.2.50").
    std::string requirement;
    bool required = true;
    std::vector<StrategySpec> acquisition_order;

    /// Import packages whose whole tree (code, data, native libraries) is
    /// collected into the bundle.
    std::vector<std::string> collect_packages;
    /// Globs, relative to a collected package, of data files to bundle.
    std::vector<std::string> runtime_data;
    /// Modules loaded dynamically that the freezer cannot discover.
    std::vector<std::string> hidden_modules;
    /// Restricts the dependency to these OS families; empty = all.
    std::vector<OsFamily> only_on;
    /// Build-time tool (the freezer); installed but never bundled.
    bool tool = false;

    bool applies_to(const BuildTarget& target) const;
};

/// The dependency table of the LocalLLM Studio desktop build.
std::vector<DependencySpec> default_dependencies();

/// Checks one dependency: a required dependency needs at least one strategy,
/// and prebuilt strategies come before source strategies.
Result<Unit, PackError> validate_dependency(const DependencySpec& spec);

/// Validates every dependency and rejects duplicate names.
Result<Unit, PackError> validate_dependencies(const std::vector<DependencySpec>& specs);

} // namespace lspack::deps

#endif // LSPACK_DEPS_DEPENDENCY_SPEC_HPP
