//! # Isolated Environment Tests
//!
//! Environment creation from scratch, failure reporting, dependency
//! installation through the manager, and the per-target build lock.

#include "env/build_lock.hpp"
#include "env/environment.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace lspack;
using namespace lspack::env;
using lspack::test::fail_result;
using lspack::test::FakeNetworkChecker;
using lspack::test::FakeToolRunner;
using lspack::test::TempDir;
using lspack::test::write_file;

namespace {

const BuildTarget kTarget{OsFamily::Linux, Arch::X86_64, Acceleration::None};

} // namespace

class EnvironmentManagerTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeToolRunner runner;
    FakeNetworkChecker network;
    config::EnvironmentConfig config;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(EnvironmentManagerTest, CreatesFreshEnvironment) {
    EnvironmentManager manager(config, runner, network);
    fs::path env_dir = dir.path() / "env" / kTarget.key();

    // Leftovers from an earlier build must not survive
    write_file(env_dir / "stale.txt", "old");

    auto result = manager.create(env_dir, kTarget);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();
    const auto& env = unwrap(result);

    EXPECT_EQ(env.root(), env_dir);
    EXPECT_EQ(env.target(), kTarget);
    EXPECT_FALSE(fs::exists(env_dir / "stale.txt"));
    EXPECT_TRUE(fs::exists(env.python()));
    ASSERT_TRUE(env.site_packages().has_value());

    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].program, config.python);
    EXPECT_EQ(runner.calls[0].args,
              (std::vector<std::string>{"-m", "venv", env_dir.string()}));
}

TEST_F(EnvironmentManagerTest, VenvFailureIsEnvironmentCreationFailed) {
    runner.venv_fails = true;
    EnvironmentManager manager(config, runner, network);

    auto result = manager.create(dir.path() / "env", kTarget);
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::EnvironmentCreationFailed);
    EXPECT_NE(err.describe().find("ensurepip"), std::string::npos);
}

TEST_F(EnvironmentManagerTest, MissingInterpreterIsReported) {
    config.python = "python3.11";
    runner.on([](const proc::ProcessSpec& spec) { return spec.program == "python3.11"; },
              [](const proc::ProcessSpec&) { return lspack::test::ok_result(); });
    EnvironmentManager manager(config, runner, network);

    auto result = manager.create(dir.path() / "env", kTarget);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "virtual environment has no interpreter");
}

TEST_F(EnvironmentManagerTest, InterruptedCreation) {
    runner.on([](const proc::ProcessSpec&) { return true; },
              [](const proc::ProcessSpec&) {
                  auto r = fail_result(130, "");
                  r.interrupted = true;
                  return r;
              });
    EnvironmentManager manager(config, runner, network);

    auto result = manager.create(dir.path() / "env", kTarget);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Interrupted);
}

TEST(IsolatedEnvironmentTest, SitePackagesAbsentUntilCreated) {
    TempDir dir;
    IsolatedEnvironment env(dir.path() / "nothing", kTarget);
    EXPECT_FALSE(env.site_packages().has_value());

    fs::create_directories(dir.path() / "nothing" / "lib" / "python3.12" / "site-packages");
    ASSERT_TRUE(env.site_packages().has_value());
    EXPECT_EQ(env.site_packages()->parent_path().filename(), "python3.12");
}

// ============================================================================
// Installation
// ============================================================================

TEST_F(EnvironmentManagerTest, InstallRecordsAttempts) {
    EnvironmentManager manager(config, runner, network);
    auto created = manager.create(dir.path() / "env", kTarget);
    ASSERT_TRUE(is_ok(created));
    const auto& env = unwrap(created);

    auto specs = deps::default_dependencies();
    runner.fail_prebuilt.insert("llama-cpp-python");

    auto llama = manager.install(env, specs[0]);
    ASSERT_TRUE(is_ok(llama)) << unwrap_err(llama).describe();
    auto flask = manager.install(env, specs[1]);
    ASSERT_TRUE(is_ok(flask));

    ASSERT_EQ(manager.attempts().size(), 3u);
    EXPECT_EQ(manager.attempts()[0].dependency, "llama-cpp-python");
    EXPECT_EQ(manager.attempts()[0].status, deps::AttemptStatus::Failed);
    EXPECT_EQ(manager.attempts()[1].status, deps::AttemptStatus::Succeeded);
    EXPECT_EQ(manager.attempts()[2].dependency, "flask");

    // The installer runs with the environment's own interpreter
    auto pip_calls = runner.calls_with("-m pip install");
    ASSERT_EQ(pip_calls.size(), 3u);
    for (const auto& call : pip_calls) {
        EXPECT_EQ(fs::path(call.program), env.python());
    }
    EXPECT_TRUE(fs::exists(*env.site_packages() / "flask" / "__init__.py"));
}

TEST_F(EnvironmentManagerTest, OfflineManagerSkipsNetworkStrategies) {
    EnvironmentManager manager(config, runner, network, true);
    auto created = manager.create(dir.path() / "env", kTarget);
    ASSERT_TRUE(is_ok(created));

    auto result = manager.install(unwrap(created), deps::default_dependencies()[1]);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::DependencyUnavailable);
    EXPECT_EQ(manager.attempts().at(0).status, deps::AttemptStatus::Skipped);
    EXPECT_TRUE(runner.calls_with("pip").empty());
}

// ============================================================================
// Build Lock
// ============================================================================

TEST(BuildLockTest, SecondAcquireFailsWhileHeld) {
    TempDir dir;
    fs::path path = dir.path() / "locks" / "linux-x86_64-none.lock";

    auto first = BuildLock::acquire(path);
    ASSERT_TRUE(is_ok(first)) << unwrap_err(first).describe();
    EXPECT_TRUE(fs::exists(path));

    auto second = BuildLock::acquire(path);
    ASSERT_TRUE(is_err(second));
    EXPECT_EQ(unwrap_err(second).kind, ErrorKind::BuildLocked);
    EXPECT_EQ(unwrap_err(second).message, "another build of this target is running");
}

TEST(BuildLockTest, ReleasedOnDestruction) {
    TempDir dir;
    fs::path path = dir.path() / "locks" / "macos-arm64-metal.lock";
    {
        auto lock = BuildLock::acquire(path);
        ASSERT_TRUE(is_ok(lock));
    }
    auto again = BuildLock::acquire(path);
    EXPECT_TRUE(is_ok(again));
}

TEST(BuildLockTest, MovedLockStaysHeld) {
    TempDir dir;
    fs::path path = dir.path() / "locks" / "a.lock";
    auto acquired = BuildLock::acquire(path);
    ASSERT_TRUE(is_ok(acquired));

    BuildLock moved = std::move(unwrap(acquired));
    EXPECT_EQ(moved.path(), path);
    EXPECT_TRUE(is_err(BuildLock::acquire(path)));
}

TEST(BuildLockTest, DifferentTargetsDoNotConflict) {
    TempDir dir;
    auto a = BuildLock::acquire(dir.path() / "locks" / "linux-x86_64-none.lock");
    auto b = BuildLock::acquire(dir.path() / "locks" / "linux-x86_64-cuda.lock");
    EXPECT_TRUE(is_ok(a));
    EXPECT_TRUE(is_ok(b));
}

TEST(TargetLocksTest, GuardWorkAndOutputTrees) {
    auto paths = target_lock_paths("/w", "/o", "linux-x86_64-none");
    EXPECT_EQ(paths, (std::vector<fs::path>{"/w/locks/linux-x86_64-none.lock",
                                            "/o/.linux-x86_64-none.lock"}));
}

TEST(TargetLocksTest, AllOrNothing) {
    TempDir dir;
    auto output_only = BuildLock::acquire(dir.path() / "out" / ".linux-x86_64-none.lock");
    ASSERT_TRUE(is_ok(output_only));

    auto locks = acquire_target_locks(dir.path() / "work", dir.path() / "out", "linux-x86_64-none");
    ASSERT_TRUE(is_err(locks));
    EXPECT_EQ(unwrap_err(locks).kind, ErrorKind::BuildLocked);
    // The work lock taken before the failure was given back
    auto work_lock = dir.path() / "work" / "locks" / "linux-x86_64-none.lock";
    EXPECT_TRUE(is_ok(BuildLock::acquire(work_lock)));
}
