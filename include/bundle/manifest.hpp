//! # Bundle Manifest
//!
//! The complete, deterministic list of what goes into a package: regular
//! files, native shared libraries (with the dependency they came from) and
//! module hints for the freezer.
//!
//! ## Invariants
//!
//! - Entries are keyed by destination; adding a second entry with the same
//!   destination and a different source is `ManifestConflict`.
//! - Iteration is ordered by destination, so two builds from the same inputs
//!   produce identical manifests.
//! - The fingerprint covers (destination, content digest) pairs, so it changes
//!   whenever any bundled byte changes.

#ifndef LSPACK_BUNDLE_MANIFEST_HPP
#define LSPACK_BUNDLE_MANIFEST_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "json/json_value.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lspack::bundle {

namespace fs = std::filesystem;

enum class EntryKind { Regular, NativeBinary };

const char* to_string(EntryKind kind);

struct ManifestEntry {
    fs::path source;
    /// '/'-separated path inside the bundle.
    std::string dest;
    EntryKind kind = EntryKind::Regular;
    /// Dependency name for native binaries and package data, source tree
    /// name for project files.
    std::string origin;
    /// "sha256:<hex>", filled in by `seal()`.
    std::string digest;
};

struct ExcludedEntry {
    std::string dest;
    /// The rule or module that removed it.
    std::string rule;
};

class BundleManifest {
public:
    /// Adds an entry. Re-adding the same (source, dest) pair is a no-op.
    Result<Unit, PackError> add(ManifestEntry entry);

    /// Removes an entry, recording which rule removed it.
    void exclude(const std::string& dest, const std::string& rule);

    bool contains(const std::string& dest) const {
        return entries_.count(dest) > 0;
    }

    const std::map<std::string, ManifestEntry>& entries() const {
        return entries_;
    }

    std::vector<const ManifestEntry*> regular_files() const;
    std::vector<const ManifestEntry*> native_binaries() const;

    const std::vector<ExcludedEntry>& excluded_entries() const {
        return excluded_;
    }

    /// Rule that removed `dest`, if it was excluded.
    std::optional<std::string> excluded_by(const std::string& dest) const;

    std::set<std::string> hidden_modules;
    std::set<std::string> excluded_modules;
    std::vector<std::string> excluded_patterns;

    /// Entry script of the application (absolute path).
    fs::path entry_script;
    /// Key of the target the manifest was built for.
    std::string target_key;

    /// Digests every entry and computes the fingerprint. Fails with
    /// `ManifestIncomplete` if a source file cannot be read.
    Result<std::string, PackError> seal();

    /// Fingerprint computed by the last `seal()` (empty before).
    const std::string& fingerprint() const {
        return fingerprint_;
    }

    json::JsonValue to_json() const;

    /// Writes `to_json()` to `path`, creating parent directories.
    Result<Unit, PackError> write(const fs::path& path) const;

private:
    std::map<std::string, ManifestEntry> entries_;
    std::vector<ExcludedEntry> excluded_;
    std::string fingerprint_;
};

/// Fingerprint over sorted (dest, digest) pairs.
std::string compute_fingerprint(const std::map<std::string, std::string>& dest_digests);

// ============================================================================
// Verification of persisted manifests
// ============================================================================

struct VerifyReport {
    size_t checked = 0;
    std::vector<std::string> missing;
    std::vector<std::string> modified;
    bool fingerprint_matches = false;

    bool ok() const {
        return missing.empty() && modified.empty() && fingerprint_matches;
    }
};

/// Re-digests every source file listed in a persisted manifest and compares
/// it against the recorded digests and fingerprint.
Result<VerifyReport, PackError> verify_manifest_file(const fs::path& manifest_path);

} // namespace lspack::bundle

#endif // LSPACK_BUNDLE_MANIFEST_HPP
