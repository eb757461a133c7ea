//! # Exclusion Rules
//!
//! Filters applied to the collected manifest entries.
//!
//! | Syntax            | Matches                                              |
//! |-------------------|------------------------------------------------------|
//! | `prefix:<text>`   | file name starts with `<text>` (case-sensitive)       |
//! | `substr:<text>`   | destination path contains `<text>` (case-insensitive) |
//! | `glob:<pattern>`  | destination path matches the glob                     |
//! | `<text>`          | same as `substr:<text>`                               |
//!
//! Globs: `*` matches within one path component, `**` across components,
//! `?` one character. A `**/` prefix also matches zero directories.

#ifndef LSPACK_BUNDLE_EXCLUSION_HPP
#define LSPACK_BUNDLE_EXCLUSION_HPP

#include <string>
#include <string_view>

namespace lspack::bundle {

enum class RuleKind { Prefix, Substring, Glob };

struct ExclusionRule {
    RuleKind kind;
    std::string pattern;
    /// The rule as written, for diagnostics.
    std::string text;

    static ExclusionRule parse(const std::string& text);

    /// `dest` is a '/'-separated destination path inside the bundle.
    bool matches(std::string_view dest) const;
};

bool glob_match(std::string_view pattern, std::string_view path);

/// True if `dest` lives inside the package named by a dotted module path
/// ("numpy.testing" matches "numpy/testing/utils.py").
bool in_module(std::string_view dest, std::string_view module);

} // namespace lspack::bundle

#endif // LSPACK_BUNDLE_EXCLUSION_HPP
