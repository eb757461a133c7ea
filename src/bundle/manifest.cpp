#include "bundle/manifest.hpp"

#include "common/sha256.hpp"
#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <fstream>

namespace lspack::bundle {

const char* to_string(EntryKind kind) {
    switch (kind) {
    case EntryKind::Regular:
        return "file";
    case EntryKind::NativeBinary:
        return "binary";
    }
    return "unknown";
}

Result<Unit, PackError> BundleManifest::add(ManifestEntry entry) {
    auto it = entries_.find(entry.dest);
    if (it != entries_.end()) {
        if (it->second.source == entry.source) {
            return Unit{};
        }
        return PackError(ErrorKind::ManifestConflict,
                         "two files map to the same bundle path '" + entry.dest + "'")
            .with("first", it->second.source.string() + " (" + it->second.origin + ")")
            .with("second", entry.source.string() + " (" + entry.origin + ")");
    }
    std::string dest = entry.dest;
    entries_.emplace(std::move(dest), std::move(entry));
    fingerprint_.clear();
    return Unit{};
}

void BundleManifest::exclude(const std::string& dest, const std::string& rule) {
    if (entries_.erase(dest) > 0) {
        excluded_.push_back({dest, rule});
        fingerprint_.clear();
    }
}

std::vector<const ManifestEntry*> BundleManifest::regular_files() const {
    std::vector<const ManifestEntry*> out;
    for (const auto& [_, entry] : entries_) {
        if (entry.kind == EntryKind::Regular)
            out.push_back(&entry);
    }
    return out;
}

std::vector<const ManifestEntry*> BundleManifest::native_binaries() const {
    std::vector<const ManifestEntry*> out;
    for (const auto& [_, entry] : entries_) {
        if (entry.kind == EntryKind::NativeBinary)
            out.push_back(&entry);
    }
    return out;
}

std::optional<std::string> BundleManifest::excluded_by(const std::string& dest) const {
    for (const auto& excluded : excluded_) {
        if (excluded.dest == dest)
            return excluded.rule;
    }
    return std::nullopt;
}

std::string compute_fingerprint(const std::map<std::string, std::string>& dest_digests) {
    Sha256 hasher;
    for (const auto& [dest, digest] : dest_digests) {
        hasher.update(dest);
        hasher.update("\0", 1);
        hasher.update(digest);
        hasher.update("\n", 1);
    }
    return hasher.finish();
}

Result<std::string, PackError> BundleManifest::seal() {
    std::map<std::string, std::string> digests;
    for (auto& [dest, entry] : entries_) {
        auto digest = sha256_file(entry.source);
        if (!digest) {
            return PackError(ErrorKind::ManifestIncomplete, "cannot read bundled file")
                .with("dest", dest)
                .with("source", entry.source.string());
        }
        entry.digest = *digest;
        digests[dest] = *digest;
    }
    fingerprint_ = compute_fingerprint(digests);
    return fingerprint_;
}

json::JsonValue BundleManifest::to_json() const {
    using json::JsonArray;
    using json::JsonObject;
    using json::JsonValue;

    JsonValue root(JsonObject{});
    root.set("version", JsonValue(1));
    root.set("target", JsonValue(target_key));
    root.set("fingerprint", JsonValue(fingerprint_));
    root.set("entry_script", JsonValue(entry_script.generic_string()));

    JsonArray entries;
    for (const auto& [dest, entry] : entries_) {
        JsonValue item(JsonObject{});
        item.set("dest", JsonValue(dest));
        item.set("source", JsonValue(entry.source.generic_string()));
        item.set("kind", JsonValue(to_string(entry.kind)));
        item.set("origin", JsonValue(entry.origin));
        item.set("digest", JsonValue(entry.digest));
        entries.push_back(std::move(item));
    }
    root.set("entries", JsonValue(std::move(entries)));

    root.set("hidden_modules",
             json::json_string_array(
                 std::vector<std::string>(hidden_modules.begin(), hidden_modules.end())));
    root.set("excluded_modules",
             json::json_string_array(
                 std::vector<std::string>(excluded_modules.begin(), excluded_modules.end())));
    root.set("excluded_patterns", json::json_string_array(excluded_patterns));

    JsonArray excluded;
    for (const auto& item : excluded_) {
        JsonValue obj(JsonObject{});
        obj.set("dest", JsonValue(item.dest));
        obj.set("rule", JsonValue(item.rule));
        excluded.push_back(std::move(obj));
    }
    root.set("excluded", JsonValue(std::move(excluded)));

    return root;
}

Result<Unit, PackError> BundleManifest::write(const fs::path& path) const {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return PackError(ErrorKind::PackagingFailed, "cannot write manifest")
            .with("path", path.string());
    }
    out << to_json().to_string_pretty() << "\n";
    if (!out) {
        return PackError(ErrorKind::PackagingFailed, "cannot write manifest")
            .with("path", path.string());
    }
    LSPACK_LOG_DEBUG("bundle", "Manifest written to " << path.string());
    return Unit{};
}

// ============================================================================
// Verification
// ============================================================================

Result<VerifyReport, PackError> verify_manifest_file(const fs::path& manifest_path) {
    std::ifstream in(manifest_path, std::ios::binary);
    if (!in) {
        return PackError(ErrorKind::ManifestIncomplete, "cannot read manifest")
            .with("path", manifest_path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        return PackError(ErrorKind::ManifestIncomplete, "malformed manifest")
            .with("path", manifest_path.string())
            .with("detail", unwrap_err(parsed).to_string());
    }
    const auto& root = unwrap(parsed);

    const json::JsonValue* entries = root.get("entries");
    auto recorded_fingerprint = root.get_string("fingerprint");
    if (entries == nullptr || !entries->is_array() || !recorded_fingerprint) {
        return PackError(ErrorKind::ManifestIncomplete, "manifest lacks entries or fingerprint")
            .with("path", manifest_path.string());
    }

    VerifyReport report;
    std::map<std::string, std::string> recorded;
    std::map<std::string, std::string> actual;

    for (const auto& item : entries->as_array()) {
        auto dest = item.get_string("dest");
        auto source = item.get_string("source");
        auto digest = item.get_string("digest");
        if (!dest || !source || !digest) {
            return PackError(ErrorKind::ManifestIncomplete, "manifest entry is incomplete")
                .with("path", manifest_path.string());
        }

        report.checked++;
        recorded[*dest] = *digest;

        auto current = sha256_file(fs::path(*source));
        if (!current) {
            report.missing.push_back(*dest);
            continue;
        }
        actual[*dest] = *current;
        if (*current != *digest) {
            report.modified.push_back(*dest);
        }
    }

    report.fingerprint_matches = compute_fingerprint(recorded) == *recorded_fingerprint &&
                                 report.missing.empty() && report.modified.empty() &&
                                 compute_fingerprint(actual) == *recorded_fingerprint;
    return report;
}

} // namespace lspack::bundle
