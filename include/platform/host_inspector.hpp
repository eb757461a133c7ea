//! # Host Inspection
//!
//! Facts about the machine lspack runs on: OS name, machine architecture and
//! whether an NVIDIA compute runtime is present. Abstracted so the resolver can
//! be exercised against any host.

#ifndef LSPACK_PLATFORM_HOST_INSPECTOR_HPP
#define LSPACK_PLATFORM_HOST_INSPECTOR_HPP

#include "process/process.hpp"

#include <string>

namespace lspack {

enum class GpuRuntimeStatus {
    Present,
    Absent,
    /// The query itself could not give an answer (tool crashed, driver error).
    QueryFailed,
};

struct GpuRuntimeInfo {
    GpuRuntimeStatus status = GpuRuntimeStatus::Absent;
    /// Device name on success, failure reason otherwise.
    std::string detail;
};

class HostInspector {
public:
    virtual ~HostInspector() = default;

    /// Kernel/OS name as `uname -s` reports it ("Darwin", "Linux", "Windows_NT").
    virtual std::string os_name() = 0;

    /// Machine name as `uname -m` reports it ("x86_64", "arm64", "AMD64").
    virtual std::string machine() = 0;

    virtual GpuRuntimeInfo gpu_runtime() = 0;
};

/// Queries the real host. The GPU query runs `nvidia-smi` through the given
/// runner.
class SystemHostInspector : public HostInspector {
public:
    explicit SystemHostInspector(proc::ProcessRunner& runner) : runner_(runner) {}

    std::string os_name() override;
    std::string machine() override;
    GpuRuntimeInfo gpu_runtime() override;

private:
    proc::ProcessRunner& runner_;
};

} // namespace lspack

#endif // LSPACK_PLATFORM_HOST_INSPECTOR_HPP
