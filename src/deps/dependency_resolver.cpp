#include "deps/dependency_resolver.hpp"

#include "log/log.hpp"

namespace lspack::deps {

Result<InstalledDependency, PackError> DependencyResolver::resolve(const DependencySpec& spec) {
    if (spec.acquisition_order.empty()) {
        return PackError(ErrorKind::DependencyUnavailable,
                         "no acquisition strategy declared for '" + spec.name + "'");
    }

    std::vector<AttemptRecord> tried;
    bool network_missing = false;

    for (const auto& strategy_spec : spec.acquisition_order) {
        auto strategy = make_strategy(strategy_spec);
        std::string label = strategy->describe(ctx_);

        LSPACK_LOG_INFO("deps", "Installing " << spec.name << " via " << label);
        auto outcome = strategy->acquire(spec, ctx_);

        AttemptRecord record{spec.name, label, outcome.status, outcome.detail};
        attempts_.push_back(record);
        tried.push_back(record);

        if (outcome.interrupted) {
            return PackError(ErrorKind::Interrupted,
                             "installation of '" + spec.name + "' was interrupted")
                .with("strategy", label);
        }

        switch (outcome.status) {
        case AttemptStatus::Succeeded:
            LSPACK_LOG_INFO("deps", spec.name << " installed via " << label);
            return InstalledDependency{spec, label, strategy->kind()};
        case AttemptStatus::NetworkUnavailable:
            network_missing = true;
            LSPACK_LOG_WARN("deps", spec.name << ": " << label << " " << outcome.detail);
            break;
        case AttemptStatus::Skipped:
            LSPACK_LOG_DEBUG("deps", spec.name << ": " << label << " skipped (" << outcome.detail
                                               << ")");
            break;
        case AttemptStatus::Failed:
            LSPACK_LOG_WARN("deps", spec.name << ": " << label << " failed: " << outcome.detail);
            break;
        }
    }

    PackError err(ErrorKind::DependencyUnavailable,
                  "every acquisition strategy failed for '" + spec.name + "'");
    for (const auto& attempt : tried) {
        std::string detail = attempt.detail.empty() ? to_string(attempt.status) : attempt.detail;
        err.with(attempt.strategy, detail);
    }
    if (network_missing) {
        err.with("hint", "the package index could not be reached; check the network connection");
    }
    return err;
}

} // namespace lspack::deps
