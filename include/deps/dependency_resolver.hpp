//! # Dependency Resolver
//!
//! Installs one dependency into an isolated environment by trying its
//! acquisition strategies in declared order. The first success wins; every
//! attempt is recorded so that a total failure can name each strategy that
//! was tried.

#ifndef LSPACK_DEPS_DEPENDENCY_RESOLVER_HPP
#define LSPACK_DEPS_DEPENDENCY_RESOLVER_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "deps/dependency_spec.hpp"
#include "deps/strategies.hpp"

#include <string>
#include <vector>

namespace lspack::deps {

/**
 * A dependency present in the isolated environment
 */
struct InstalledDependency {
    DependencySpec spec;
    /// Description of the strategy that installed it.
    std::string strategy;
    StrategyKind strategy_kind;
};

class DependencyResolver {
public:
    explicit DependencyResolver(AcquisitionContext& ctx) : ctx_(ctx) {}

    /**
     * Install a dependency
     *
     * @return The installed dependency, `DependencyUnavailable` when every
     *         strategy failed (one context line per attempted strategy), or
     *         `Interrupted` when the installer was interrupted
     */
    Result<InstalledDependency, PackError> resolve(const DependencySpec& spec);

    /**
     * Every attempt made so far, across all dependencies
     */
    const std::vector<AttemptRecord>& attempts() const {
        return attempts_;
    }

private:
    AcquisitionContext& ctx_;
    std::vector<AttemptRecord> attempts_;
};

} // namespace lspack::deps

#endif // LSPACK_DEPS_DEPENDENCY_RESOLVER_HPP
