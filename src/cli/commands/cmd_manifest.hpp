//! # Manifest Check Command Interface

#pragma once

namespace lspack::cli {

// Re-digests the files listed in a persisted manifest
// Returns 0 when every file matches, 1 otherwise
int run_manifest_check(int argc, char* argv[]);

} // namespace lspack::cli
