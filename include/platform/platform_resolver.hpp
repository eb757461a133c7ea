//! # Platform Profile Resolver
//!
//! Determines the `BuildTarget` for a run from the host and user overrides.
//!
//! ## Rules
//!
//! - OS comes from the override, else from the host. A host OS with no
//!   packaging procedure is `ProfileUnsupported`.
//! - An unrecognized architecture is reported as a warning and treated as
//!   x86_64, CPU only.
//! - Automatic acceleration: macOS on arm64 uses Metal; macOS on x86_64 has
//!   none; every other OS queries for a CUDA runtime (never for a cross-OS
//!   target). A failed query is a warning and means no acceleration.
//! - Requested combinations that cannot work (Metal off Apple silicon, CUDA on
//!   macOS) are downgraded to CPU with a warning.

#ifndef LSPACK_PLATFORM_PLATFORM_RESOLVER_HPP
#define LSPACK_PLATFORM_PLATFORM_RESOLVER_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "platform/build_target.hpp"
#include "platform/host_inspector.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lspack {

struct ResolveOptions {
    std::optional<OsFamily> os;
    std::optional<Arch> arch;
    /// nullopt = auto.
    std::optional<Acceleration> acceleration;
};

/// Maps a host OS name (uname -s style) to a family.
std::optional<OsFamily> os_family_from_host(const std::string& os_name);

struct ResolvedProfile {
    BuildTarget target;
    /// Warnings raised while degrading or guessing; also logged.
    std::vector<std::string> warnings;
};

Result<ResolvedProfile, PackError> resolve_profile(HostInspector& host,
                                                   const ResolveOptions& options);

/// Convenience wrapper returning only the target.
Result<BuildTarget, PackError> resolve_build_target(HostInspector& host,
                                                    const ResolveOptions& options);

} // namespace lspack

#endif // LSPACK_PLATFORM_PLATFORM_RESOLVER_HPP
