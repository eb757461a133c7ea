#include "platform/build_target.hpp"

#include <algorithm>
#include <cctype>

namespace lspack {

static std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const char* to_string(OsFamily os) {
    switch (os) {
    case OsFamily::MacOS:
        return "macos";
    case OsFamily::Windows:
        return "windows";
    case OsFamily::Linux:
        return "linux";
    }
    return "unknown";
}

const char* to_string(Arch arch) {
    switch (arch) {
    case Arch::X86_64:
        return "x86_64";
    case Arch::Arm64:
        return "arm64";
    }
    return "unknown";
}

const char* to_string(Acceleration accel) {
    switch (accel) {
    case Acceleration::None:
        return "none";
    case Acceleration::Metal:
        return "metal";
    case Acceleration::Cuda:
        return "cuda";
    }
    return "unknown";
}

std::optional<OsFamily> parse_os_family(std::string_view s) {
    std::string lower = to_lower(s);
    if (lower == "macos" || lower == "darwin")
        return OsFamily::MacOS;
    if (lower == "windows")
        return OsFamily::Windows;
    if (lower == "linux")
        return OsFamily::Linux;
    return std::nullopt;
}

std::optional<Arch> parse_arch(std::string_view s) {
    std::string lower = to_lower(s);
    if (lower == "x86_64" || lower == "amd64" || lower == "x64")
        return Arch::X86_64;
    if (lower == "arm64" || lower == "aarch64")
        return Arch::Arm64;
    return std::nullopt;
}

std::optional<Acceleration> parse_acceleration(std::string_view s) {
    std::string lower = to_lower(s);
    if (lower == "none" || lower == "cpu")
        return Acceleration::None;
    if (lower == "metal")
        return Acceleration::Metal;
    if (lower == "cuda")
        return Acceleration::Cuda;
    return std::nullopt;
}

std::string BuildTarget::key() const {
    return std::string(to_string(os)) + "-" + to_string(arch) + "-" + to_string(acceleration);
}

std::string BuildTarget::describe() const {
    std::string accel = acceleration == Acceleration::None ? "CPU only" : to_string(acceleration);
    return std::string(to_string(os)) + " " + to_string(arch) + " (" + accel + ")";
}

} // namespace lspack
