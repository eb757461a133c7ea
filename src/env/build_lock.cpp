#include "env/build_lock.hpp"

#include "log/log.hpp"

#include <string>
#include <utility>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace lspack::env {

Result<BuildLock, PackError> BuildLock::acquire(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return PackError(ErrorKind::BuildLocked, "cannot create lock directory")
            .with("path", path.parent_path().string())
            .with("reason", ec.message());
    }

#ifdef _WIN32
    HANDLE handle = CreateFileW(path.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr, OPEN_ALWAYS,
                                FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        return PackError(ErrorKind::BuildLocked, "cannot open lock file")
            .with("path", path.string())
            .with("error", std::to_string(GetLastError()));
    }

    OVERLAPPED overlapped{};
    if (!LockFileEx(handle, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY, 0, 1, 0,
                    &overlapped)) {
        CloseHandle(handle);
        return PackError(ErrorKind::BuildLocked, "another build of this target is running")
            .with("lock", path.string());
    }

    std::string pid = std::to_string(GetCurrentProcessId()) + "\n";
    DWORD written = 0;
    SetEndOfFile(handle);
    WriteFile(handle, pid.data(), static_cast<DWORD>(pid.size()), &written, nullptr);

    LSPACK_LOG_DEBUG("build", "Acquired lock " << path.string());
    return BuildLock(path, reinterpret_cast<intptr_t>(handle));
#else
    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return PackError(ErrorKind::BuildLocked, "cannot open lock file")
            .with("path", path.string())
            .with("reason", std::strerror(errno));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return PackError(ErrorKind::BuildLocked, "another build of this target is running")
                .with("lock", path.string());
        }
        return PackError(ErrorKind::BuildLocked, "cannot lock")
            .with("lock", path.string())
            .with("reason", std::strerror(err));
    }

    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) == 0) {
        ssize_t written = write(fd, pid.data(), pid.size());
        (void)written; // the pid is informational only
    }

    LSPACK_LOG_DEBUG("build", "Acquired lock " << path.string());
    return BuildLock(path, fd);
#endif
}

BuildLock::BuildLock(BuildLock&& other) noexcept
    : path_(std::move(other.path_)), handle_(other.handle_) {
    other.handle_ = -1;
}

BuildLock& BuildLock::operator=(BuildLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        handle_ = other.handle_;
        other.handle_ = -1;
    }
    return *this;
}

BuildLock::~BuildLock() {
    release();
}

void BuildLock::release() {
    if (handle_ == -1) {
        return;
    }
#ifdef _WIN32
    HANDLE handle = reinterpret_cast<HANDLE>(handle_);
    OVERLAPPED overlapped{};
    UnlockFileEx(handle, 0, 1, 0, &overlapped);
    CloseHandle(handle);
#else
    int fd = static_cast<int>(handle_);
    flock(fd, LOCK_UN);
    close(fd);
#endif
    handle_ = -1;
    LSPACK_LOG_DEBUG("build", "Released lock " << path_.string());
}

// ============================================================================
// Target Locks
// ============================================================================

std::vector<fs::path> target_lock_paths(const fs::path& work_dir, const fs::path& output_dir,
                                        const std::string& target_key) {
    return {work_dir / "locks" / (target_key + ".lock"), output_dir / ("." + target_key + ".lock")};
}

Result<std::vector<BuildLock>, PackError> acquire_target_locks(const fs::path& work_dir,
                                                               const fs::path& output_dir,
                                                               const std::string& target_key) {
    std::vector<BuildLock> locks;
    for (const auto& path : target_lock_paths(work_dir, output_dir, target_key)) {
        auto lock = BuildLock::acquire(path);
        if (is_err(lock))
            return unwrap_err(lock); // locks taken so far are released here
        locks.push_back(std::move(unwrap(lock)));
    }
    return locks;
}

} // namespace lspack::env
