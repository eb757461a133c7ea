//! # Build Target
//!
//! The (os, arch, acceleration) triple a build produces an artifact for.
//! Created once per run by the platform resolver and never modified.

#ifndef LSPACK_PLATFORM_BUILD_TARGET_HPP
#define LSPACK_PLATFORM_BUILD_TARGET_HPP

#include <optional>
#include <string>
#include <string_view>

namespace lspack {

enum class OsFamily { MacOS, Windows, Linux };

enum class Arch { X86_64, Arm64 };

enum class Acceleration { None, Metal, Cuda };

const char* to_string(OsFamily os);
const char* to_string(Arch arch);
const char* to_string(Acceleration accel);

/// "macos", "windows", "linux" (case-insensitive).
std::optional<OsFamily> parse_os_family(std::string_view s);

/// Accepts "x86_64", "amd64", "x64", "arm64", "aarch64" (case-insensitive).
std::optional<Arch> parse_arch(std::string_view s);

/// "none", "cpu", "metal", "cuda" (case-insensitive).
std::optional<Acceleration> parse_acceleration(std::string_view s);

struct BuildTarget {
    OsFamily os;
    Arch arch;
    Acceleration acceleration;

    /// "<os>-<arch>-<accel>", e.g. "linux-x86_64-none". Names the per-target
    /// environment, staging, output and lock paths.
    std::string key() const;

    /// Human-readable form used in progress output.
    std::string describe() const;

    bool operator==(const BuildTarget&) const = default;
};

} // namespace lspack

#endif // LSPACK_PLATFORM_BUILD_TARGET_HPP
