#include "platform/platform_resolver.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>

namespace lspack {

std::optional<OsFamily> os_family_from_host(const std::string& os_name) {
    std::string lower = os_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "darwin")
        return OsFamily::MacOS;
    if (lower == "linux")
        return OsFamily::Linux;
    if (lower.starts_with("windows") || lower.starts_with("mingw") || lower.starts_with("msys") ||
        lower.starts_with("cygwin"))
        return OsFamily::Windows;
    return std::nullopt;
}

static Acceleration auto_acceleration(HostInspector& host, OsFamily os, Arch arch, bool cross_os,
                                      std::vector<std::string>& warnings) {
    if (os == OsFamily::MacOS) {
        return arch == Arch::Arm64 ? Acceleration::Metal : Acceleration::None;
    }

    if (cross_os) {
        LSPACK_LOG_DEBUG("platform", "Cross-OS target, skipping GPU runtime query");
        return Acceleration::None;
    }

    auto gpu = host.gpu_runtime();
    switch (gpu.status) {
    case GpuRuntimeStatus::Present:
        LSPACK_LOG_INFO("platform", "CUDA runtime detected: " << gpu.detail);
        return Acceleration::Cuda;
    case GpuRuntimeStatus::Absent:
        return Acceleration::None;
    case GpuRuntimeStatus::QueryFailed:
        warnings.push_back("GPU runtime query failed (" + gpu.detail + "), building CPU only");
        return Acceleration::None;
    }
    return Acceleration::None;
}

Result<ResolvedProfile, PackError> resolve_profile(HostInspector& host,
                                                   const ResolveOptions& options) {
    ResolvedProfile profile{BuildTarget{OsFamily::Linux, Arch::X86_64, Acceleration::None}, {}};
    auto& warnings = profile.warnings;

    std::string host_os_name = host.os_name();
    auto host_os = os_family_from_host(host_os_name);

    OsFamily os;
    if (options.os) {
        os = *options.os;
    } else if (host_os) {
        os = *host_os;
    } else {
        return PackError(ErrorKind::ProfileUnsupported,
                         "no packaging procedure for host operating system")
            .with("os", host_os_name.empty() ? "<unknown>" : host_os_name);
    }
    bool cross_os = !host_os || *host_os != os;

    Arch arch = Arch::X86_64;
    bool cpu_only = false;
    if (options.arch) {
        arch = *options.arch;
    } else {
        std::string machine = host.machine();
        auto parsed = parse_arch(machine);
        if (parsed) {
            arch = *parsed;
        } else {
            warnings.push_back("unrecognized architecture '" + machine +
                               "', assuming x86_64 without acceleration");
            cpu_only = true;
        }
    }

    Acceleration accel = Acceleration::None;
    if (cpu_only) {
        accel = Acceleration::None;
    } else if (!options.acceleration) {
        accel = auto_acceleration(host, os, arch, cross_os, warnings);
    } else {
        accel = *options.acceleration;
        if (accel == Acceleration::Metal && !(os == OsFamily::MacOS && arch == Arch::Arm64)) {
            warnings.push_back("Metal requires macOS on arm64, building CPU only");
            accel = Acceleration::None;
        } else if (accel == Acceleration::Cuda && os == OsFamily::MacOS) {
            warnings.push_back("CUDA is not available on macOS, building CPU only");
            accel = Acceleration::None;
        }
    }

    profile.target = BuildTarget{os, arch, accel};

    for (const auto& warning : warnings) {
        LSPACK_LOG_WARN("platform", warning);
    }
    LSPACK_LOG_INFO("platform", "Build target: " << profile.target.describe());

    return profile;
}

Result<BuildTarget, PackError> resolve_build_target(HostInspector& host,
                                                    const ResolveOptions& options) {
    auto result = resolve_profile(host, options);
    if (is_err(result)) {
        return unwrap_err(result);
    }
    return unwrap(result).target;
}

} // namespace lspack
