#include "deps/strategies.hpp"

#include "deps/search_path.hpp"
#include "log/log.hpp"

namespace lspack::deps {

const char* to_string(AttemptStatus status) {
    switch (status) {
    case AttemptStatus::Succeeded:
        return "succeeded";
    case AttemptStatus::Failed:
        return "failed";
    case AttemptStatus::NetworkUnavailable:
        return "network unreachable";
    case AttemptStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

std::string index_variant(const BuildTarget& target, const StrategySpec& spec) {
    switch (target.acceleration) {
    case Acceleration::Metal:
        return "metal";
    case Acceleration::Cuda:
        return spec.param("cuda-variant", "cu121");
    case Acceleration::None:
        break;
    }
    return "cpu";
}

const char* acceleration_cmake_flag(Acceleration accel) {
    switch (accel) {
    case Acceleration::Metal:
        return "-DGGML_METAL=ON";
    case Acceleration::Cuda:
        return "-DGGML_CUDA=ON";
    case Acceleration::None:
        break;
    }
    return "-DGGML_NATIVE=OFF";
}

// ============================================================================
// AcquisitionStrategy
// ============================================================================

StrategyOutcome AcquisitionStrategy::acquire(const DependencySpec& dep,
                                             AcquisitionContext& ctx) const {
    if (ctx.offline) {
        return {AttemptStatus::Skipped, "offline mode"};
    }

    std::string url = network_url(ctx);
    if (!url.empty() && !ctx.network.reachable(url)) {
        std::string host;
        int port = 0;
        proc::split_url_host(url, host, port);
        return {AttemptStatus::NetworkUnavailable, "network unreachable (" + host + ")"};
    }

    auto spec = command(dep, ctx);
    LSPACK_LOG_DEBUG("deps", "Running: " << spec.command_line());

    auto result = ctx.runner.run(spec);
    if (result.interrupted) {
        return {AttemptStatus::Failed, "interrupted", true};
    }
    if (!result.succeeded()) {
        return {AttemptStatus::Failed, result.failure_summary()};
    }
    return {AttemptStatus::Succeeded, "installed in " + std::to_string(result.duration_ms) + " ms"};
}

static proc::ProcessSpec pip_install(const AcquisitionContext& ctx) {
    proc::ProcessSpec spec;
    spec.program = ctx.python.string();
    spec.args = {"-m", "pip", "install", "--no-cache-dir"};
    spec.env_overrides["PIP_DISABLE_PIP_VERSION_CHECK"] = "1";
    spec.timeout_seconds = ctx.environment.install_timeout_seconds;
    return spec;
}

// ============================================================================
// PrebuiltFetchStrategy
// ============================================================================

std::string PrebuiltFetchStrategy::index_url(const BuildTarget& target) const {
    std::string url = spec_.param("index-url");
    const std::string placeholder = "{variant}";
    size_t pos = url.find(placeholder);
    if (pos != std::string::npos) {
        url.replace(pos, placeholder.size(), index_variant(target, spec_));
    }
    return url;
}

std::string PrebuiltFetchStrategy::describe(const AcquisitionContext& ctx) const {
    std::string url = index_url(ctx.target);
    return url.empty() ? "prebuilt" : "prebuilt (" + url + ")";
}

std::string PrebuiltFetchStrategy::network_url(const AcquisitionContext& ctx) const {
    std::string url = index_url(ctx.target);
    return url.empty() ? ctx.environment.index_check_url : url;
}

proc::ProcessSpec PrebuiltFetchStrategy::command(const DependencySpec& dep,
                                                 const AcquisitionContext& ctx) const {
    auto spec = pip_install(ctx);
    spec.args.push_back("--only-binary=:all:");
    spec.args.push_back(dep.requirement);

    std::string url = index_url(ctx.target);
    if (!url.empty()) {
        spec.args.push_back("--extra-index-url");
        spec.args.push_back(url);
    }
    return spec;
}

// ============================================================================
// SourceBuildStrategy
// ============================================================================

std::string SourceBuildStrategy::cmake_args(const BuildTarget& target) const {
    std::string args = spec_.param("cmake-args");
    if (!args.empty())
        args += ' ';
    args += acceleration_cmake_flag(target.acceleration);
    return args;
}

std::string SourceBuildStrategy::describe(const AcquisitionContext& ctx) const {
    return "source (" + cmake_args(ctx.target) + ")";
}

std::string SourceBuildStrategy::network_url(const AcquisitionContext& ctx) const {
    return ctx.environment.index_check_url;
}

proc::ProcessSpec SourceBuildStrategy::command(const DependencySpec& dep,
                                               const AcquisitionContext& ctx) const {
    auto spec = pip_install(ctx);
    spec.args.push_back("--no-binary=" + dep.name);
    spec.args.push_back(dep.requirement);

    auto sanitized = sanitize_environment(
        ctx.base_environment, ctx.environment.search_path_vars, ctx.environment.unset_vars,
        ctx.environment.conflict_markers, proc::path_list_separator());
    for (const auto& entry : sanitized.removed_entries) {
        LSPACK_LOG_INFO("deps", "Hiding conflicting search-path entry from the build: " << entry);
    }

    for (auto& [name, value] : sanitized.overrides) {
        spec.env_overrides[name] = std::move(value);
    }
    spec.env_unset = std::move(sanitized.unset);
    spec.env_overrides["CMAKE_ARGS"] = cmake_args(ctx.target);
    spec.env_overrides["FORCE_CMAKE"] = "1";
    return spec;
}

// ============================================================================
// Factory
// ============================================================================

Box<AcquisitionStrategy> make_strategy(const StrategySpec& spec) {
    switch (spec.kind) {
    case StrategyKind::PrebuiltFetch:
        return make_box<PrebuiltFetchStrategy>(spec);
    case StrategyKind::SourceBuild:
        return make_box<SourceBuildStrategy>(spec);
    }
    return nullptr;
}

} // namespace lspack::deps
