//! # Error Taxonomy
//!
//! Every fallible pipeline operation reports a `PackError`. The orchestrator
//! prints exactly one of these per failed run, so each error carries enough
//! context (dependency, strategy, file) to be actionable on its own.
//!
//! | Kind                        | Fatal | Raised by                         |
//! |-----------------------------|-------|-----------------------------------|
//! | `ProfileUnsupported`        | yes   | platform resolver, packager lookup|
//! | `DependencyUnavailable`     | req.  | dependency resolver               |
//! | `EnvironmentCreationFailed` | yes   | environment manager               |
//! | `ManifestIncomplete`        | yes   | manifest builder                  |
//! | `ManifestConflict`          | yes   | manifest builder                  |
//! | `PackagingFailed`           | yes   | packagers                         |
//! | `ConfigInvalid`             | yes   | project configuration             |
//! | `BuildLocked`               | yes   | build lock                        |
//! | `Interrupted`               | yes   | process runner                    |

#ifndef LSPACK_COMMON_ERROR_HPP
#define LSPACK_COMMON_ERROR_HPP

#include <string>
#include <vector>

namespace lspack {

enum class ErrorKind {
    ProfileUnsupported,
    DependencyUnavailable,
    EnvironmentCreationFailed,
    ManifestIncomplete,
    ManifestConflict,
    PackagingFailed,
    ConfigInvalid,
    BuildLocked,
    Interrupted,
};

/// Returns the CamelCase name of an error kind (e.g. "PackagingFailed").
const char* error_kind_name(ErrorKind kind);

struct PackError {
    ErrorKind kind;
    std::string message;
    /// Extra "key: value" facts appended to the rendered message.
    std::vector<std::string> context;

    PackError(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /// Adds a context line and returns `*this` for chaining.
    PackError& with(std::string key, const std::string& value);

    /// Renders "<Kind>: <message> (<context>; ...)".
    std::string describe() const;
};

} // namespace lspack

#endif // LSPACK_COMMON_ERROR_HPP
