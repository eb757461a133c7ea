//! # Build Lock
//!
//! Exclusive, non-blocking file locks held for the whole build of a target:
//!
//! - `<work>/locks/<target-key>.lock` guards the environment and work trees
//! - `<output>/.<target-key>.lock` guards the published output directory
//!
//! Two runs that share either directory for the same target never overlap.
//! Locks are released when the lock objects are destroyed.

#ifndef LSPACK_ENV_BUILD_LOCK_HPP
#define LSPACK_ENV_BUILD_LOCK_HPP

#include "common.hpp"
#include "common/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lspack::env {

namespace fs = std::filesystem;

class BuildLock {
public:
    /// Takes the lock or fails with `BuildLocked` if another build holds it.
    static Result<BuildLock, PackError> acquire(const fs::path& path);

    BuildLock(BuildLock&& other) noexcept;
    BuildLock& operator=(BuildLock&& other) noexcept;
    ~BuildLock();

    BuildLock(const BuildLock&) = delete;
    BuildLock& operator=(const BuildLock&) = delete;

    const fs::path& path() const {
        return path_;
    }

private:
    BuildLock(fs::path path, intptr_t handle) : path_(std::move(path)), handle_(handle) {}

    void release();

    fs::path path_;
    intptr_t handle_ = -1; // fd on POSIX, HANDLE on Windows
};

/// Lock files of one target, in acquisition order.
std::vector<fs::path> target_lock_paths(const fs::path& work_dir, const fs::path& output_dir,
                                        const std::string& target_key);

/// Takes every lock of a target or none of them.
Result<std::vector<BuildLock>, PackError> acquire_target_locks(const fs::path& work_dir,
                                                               const fs::path& output_dir,
                                                               const std::string& target_key);

} // namespace lspack::env

#endif // LSPACK_ENV_BUILD_LOCK_HPP
