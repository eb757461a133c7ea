//! # Acquisition Strategies
//!
//! One way of getting a dependency into the isolated environment. A
//! dependency lists strategies in order; the resolver tries them until one
//! succeeds.
//!
//! | Strategy                | Installer invocation                               |
//! |-------------------------|----------------------------------------------------|
//! | `PrebuiltFetchStrategy` | `pip install --only-binary=:all: [--extra-index-url]` |
//! | `SourceBuildStrategy`   | `pip install --no-binary=<name>` with `CMAKE_ARGS`    |
//!
//! Both need the package index. When the index does not answer, the attempt
//! is recorded as `NetworkUnavailable` without spawning the installer.

#ifndef LSPACK_DEPS_STRATEGIES_HPP
#define LSPACK_DEPS_STRATEGIES_HPP

#include "common.hpp"
#include "config/project_config.hpp"
#include "deps/dependency_spec.hpp"
#include "platform/build_target.hpp"
#include "process/network_checker.hpp"
#include "process/process.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace lspack::deps {

namespace fs = std::filesystem;

enum class AttemptStatus { Succeeded, Failed, NetworkUnavailable, Skipped };

const char* to_string(AttemptStatus status);

struct AttemptRecord {
    std::string dependency;
    /// Strategy description, e.g. "prebuilt (https://.../whl/cpu)".
    std::string strategy;
    AttemptStatus status;
    std::string detail;
};

/// Everything a strategy needs to run against one isolated environment.
struct AcquisitionContext {
    /// Interpreter inside the isolated environment.
    fs::path python;
    BuildTarget target;
    proc::ProcessRunner& runner;
    proc::NetworkChecker& network;
    const config::EnvironmentConfig& environment;
    /// Skip every strategy that needs the network.
    bool offline = false;
    /// Snapshot of the orchestrator's environment; sanitized copies of it
    /// are passed to source builds.
    std::map<std::string, std::string> base_environment;
};

struct StrategyOutcome {
    AttemptStatus status;
    std::string detail;
    bool interrupted = false;
};

class AcquisitionStrategy {
public:
    explicit AcquisitionStrategy(StrategySpec spec) : spec_(std::move(spec)) {}
    virtual ~AcquisitionStrategy() = default;

    StrategyKind kind() const {
        return spec_.kind;
    }

    /// Short label with the parameter that distinguishes this attempt.
    virtual std::string describe(const AcquisitionContext& ctx) const = 0;

    /// URL whose host must answer before the installer is started.
    virtual std::string network_url(const AcquisitionContext& ctx) const = 0;

    /// The installer invocation for `dep`.
    virtual proc::ProcessSpec command(const DependencySpec& dep,
                                      const AcquisitionContext& ctx) const = 0;

    /// Checks the network, runs the installer and classifies the result.
    StrategyOutcome acquire(const DependencySpec& dep, AcquisitionContext& ctx) const;

protected:
    StrategySpec spec_;
};

class PrebuiltFetchStrategy : public AcquisitionStrategy {
public:
    using AcquisitionStrategy::AcquisitionStrategy;

    std::string describe(const AcquisitionContext& ctx) const override;
    std::string network_url(const AcquisitionContext& ctx) const override;
    proc::ProcessSpec command(const DependencySpec& dep,
                              const AcquisitionContext& ctx) const override;

    /// Extra index URL with `{variant}` expanded, or empty when none is set.
    std::string index_url(const BuildTarget& target) const;
};

class SourceBuildStrategy : public AcquisitionStrategy {
public:
    using AcquisitionStrategy::AcquisitionStrategy;

    std::string describe(const AcquisitionContext& ctx) const override;
    std::string network_url(const AcquisitionContext& ctx) const override;
    proc::ProcessSpec command(const DependencySpec& dep,
                              const AcquisitionContext& ctx) const override;

    /// Base `cmake-args` plus the acceleration flag for the target.
    std::string cmake_args(const BuildTarget& target) const;
};

/// "cpu", "metal" or the strategy's CUDA variant (default "cu121").
std::string index_variant(const BuildTarget& target, const StrategySpec& spec);

/// "-DGGML_METAL=ON", "-DGGML_CUDA=ON" or "-DGGML_NATIVE=OFF".
const char* acceleration_cmake_flag(Acceleration accel);

Box<AcquisitionStrategy> make_strategy(const StrategySpec& spec);

} // namespace lspack::deps

#endif // LSPACK_DEPS_STRATEGIES_HPP
