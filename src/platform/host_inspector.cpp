#include "platform/host_inspector.hpp"

#include "log/log.hpp"

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <sys/utsname.h>
#endif

namespace lspack {

std::string SystemHostInspector::os_name() {
#ifdef _WIN32
    return "Windows_NT";
#else
    struct utsname info {};
    if (uname(&info) != 0) {
        return "";
    }
    return info.sysname;
#endif
}

std::string SystemHostInspector::machine() {
#ifdef _WIN32
    SYSTEM_INFO info;
    GetNativeSystemInfo(&info);
    switch (info.wProcessorArchitecture) {
    case PROCESSOR_ARCHITECTURE_AMD64:
        return "AMD64";
    case PROCESSOR_ARCHITECTURE_ARM64:
        return "ARM64";
    default:
        return "x86";
    }
#else
    struct utsname info {};
    if (uname(&info) != 0) {
        return "";
    }
    return info.machine;
#endif
}

GpuRuntimeInfo SystemHostInspector::gpu_runtime() {
    proc::ProcessSpec spec;
    spec.program = "nvidia-smi";
    spec.args = {"--query-gpu=name", "--format=csv,noheader"};
    spec.timeout_seconds = 15;

    auto result = runner_.run(spec);

    GpuRuntimeInfo info;
    if (!result.launched) {
        info.status = GpuRuntimeStatus::Absent;
        info.detail = "nvidia-smi not found";
    } else if (!result.succeeded()) {
        info.status = GpuRuntimeStatus::QueryFailed;
        info.detail = result.failure_summary();
    } else {
        std::string first = result.stdout_output.substr(0, result.stdout_output.find('\n'));
        if (!first.empty() && first.back() == '\r')
            first.pop_back();
        if (first.empty()) {
            info.status = GpuRuntimeStatus::Absent;
            info.detail = "no GPU listed";
        } else {
            info.status = GpuRuntimeStatus::Present;
            info.detail = first;
        }
    }

    LSPACK_LOG_DEBUG("platform", "GPU runtime query: " << info.detail);
    return info;
}

} // namespace lspack
