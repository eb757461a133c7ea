//! # Search-Path Sanitization
//!
//! A native source build must not pick up compilers, headers or libraries
//! from a foreign toolchain distribution (Anaconda, Miniconda) that happens to
//! be on the user's search paths. The sanitized values are handed to the
//! build's child process as overrides; the orchestrator's own environment is
//! left untouched.

#ifndef LSPACK_DEPS_SEARCH_PATH_HPP
#define LSPACK_DEPS_SEARCH_PATH_HPP

#include <map>
#include <string>
#include <vector>

namespace lspack::deps {

/// Removes every entry of a separator-joined path list that contains one of
/// `markers` (case-insensitive). Empty entries are dropped; the relative
/// order of the remaining entries is preserved.
std::string sanitize_search_path(const std::string& value, const std::vector<std::string>& markers,
                                 char separator);

/// True if `entry` contains any marker (case-insensitive).
bool contains_conflict_marker(const std::string& entry, const std::vector<std::string>& markers);

struct SanitizedEnvironment {
    /// Variable -> sanitized value, for each variable that was present.
    std::map<std::string, std::string> overrides;
    /// Variables to remove from the child environment.
    std::vector<std::string> unset;
    /// Entries removed, for logging.
    std::vector<std::string> removed_entries;
};

/// Builds the child-environment changes for a source build from a snapshot
/// of the current environment.
SanitizedEnvironment sanitize_environment(const std::map<std::string, std::string>& env,
                                          const std::vector<std::string>& path_vars,
                                          const std::vector<std::string>& unset_vars,
                                          const std::vector<std::string>& markers, char separator);

} // namespace lspack::deps

#endif // LSPACK_DEPS_SEARCH_PATH_HPP
