//! # Build Orchestrator Tests
//!
//! Whole-pipeline runs against the fake tool runner: state sequencing,
//! failure attribution, optional dependencies, rebuilds and the build lock.

#include "build/orchestrator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace lspack;
using namespace lspack::build;
using lspack::test::FakeHostInspector;
using lspack::test::FakeNetworkChecker;
using lspack::test::FakeToolRunner;
using lspack::test::TempDir;
using lspack::test::write_sample_project;

namespace {

size_t count_files(const fs::path& dir) {
    size_t count = 0;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        ++count;
    }
    return count;
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = dir.path() / "LocalLLM";
        write_sample_project(root);
        config = config::ProjectConfig::defaults(root);
        runner.package_files["llama-cpp-python"] = {"llama_cpp/__init__.py",
                                                    "llama_cpp/llama.py",
                                                    "llama_cpp/lib/libllama.so"};
        proc::clear_interrupt();
    }

    void TearDown() override {
        proc::clear_interrupt();
    }

    PipelineReport run(HostInspector& host, BuildOptions options = {}) {
        BuildOrchestrator orchestrator(config, BuildServices{runner, host, network},
                                       std::move(options));
        return orchestrator.run();
    }

    TempDir dir;
    fs::path root;
    config::ProjectConfig config;
    FakeToolRunner runner;
    FakeNetworkChecker network;
};

// ============================================================================
// Successful Runs
// ============================================================================

TEST_F(OrchestratorTest, LinuxCpuBuildReachesDone) {
    FakeHostInspector host("Linux", "x86_64");
    auto report = run(host);

    ASSERT_TRUE(report.succeeded()) << (report.error ? report.error->describe() : "");
    EXPECT_EQ(report.states,
              (std::vector<BuildState>{BuildState::Init, BuildState::ProfileResolved,
                                       BuildState::EnvironmentReady,
                                       BuildState::DependenciesInstalled,
                                       BuildState::ManifestBuilt, BuildState::Packaged,
                                       BuildState::Done}));
    EXPECT_FALSE(report.failed_step.has_value());
    ASSERT_TRUE(report.target.has_value());
    EXPECT_EQ(report.target->key(), "linux-x86_64-none");

    ASSERT_TRUE(report.artifact.has_value());
    EXPECT_EQ(report.artifact->kind, pkg::ArtifactKind::FilesystemImage);
    EXPECT_EQ(report.artifact->path,
              root / "dist" / "linux-x86_64-none" / "LocalLLM-Studio-1.0.0-x86_64.AppImage");
    EXPECT_TRUE(fs::exists(report.artifact->path));

    EXPECT_EQ(report.manifest_path, root / "build" / "linux-x86_64-none" / "manifest.json");
    EXPECT_FALSE(report.manifest_fingerprint.empty());
    auto verified = bundle::verify_manifest_file(report.manifest_path);
    ASSERT_TRUE(is_ok(verified));
    EXPECT_TRUE(unwrap(verified).ok());

    // mlx-lm is restricted to macOS; pyinstaller is installed but not bundled
    EXPECT_EQ(report.skipped, std::vector<std::string>{"mlx-lm"});
    EXPECT_EQ(report.installed.size(), 6u);
    EXPECT_FALSE(fs::exists(root / "build" / "linux-x86_64-none" / "staging"));
}

TEST_F(OrchestratorTest, ReportsNumberedProgress) {
    FakeHostInspector host("Linux", "x86_64");
    auto report = run(host);
    ASSERT_TRUE(report.succeeded());
    EXPECT_EQ(report.progress,
              (std::vector<std::string>{"[1/6] Detecting target platform...",
                                        "[2/6] Setting up build environment...",
                                        "[3/6] Installing dependencies...",
                                        "[4/6] Collecting bundle contents...",
                                        "[5/6] Packaging application...", "[6/6] Finishing..."}));
}

TEST_F(OrchestratorTest, DirectoriesFollowOptions) {
    FakeHostInspector host("Linux", "x86_64");
    BuildOptions options;
    options.output_dir = dir.path() / "out";
    options.work_dir = dir.path() / "work";
    auto report = run(host, options);
    ASSERT_TRUE(report.succeeded());

    EXPECT_EQ(report.artifact->path.parent_path(), dir.path() / "out" / "linux-x86_64-none");
    EXPECT_TRUE(fs::exists(dir.path() / "work" / "env" / "linux-x86_64-none"));
    EXPECT_TRUE(fs::exists(dir.path() / "work" / "locks" / "linux-x86_64-none.lock"));
    EXPECT_TRUE(fs::exists(dir.path() / "out" / ".linux-x86_64-none.lock"));
    EXPECT_FALSE(fs::exists(root / "dist"));
}

TEST_F(OrchestratorTest, RebuildLeavesSingleArtifact) {
    FakeHostInspector host("Linux", "x86_64");
    auto first = run(host);
    ASSERT_TRUE(first.succeeded());
    fs::path out = root / "dist" / "linux-x86_64-none";
    lspack::test::write_file(out / "leftover.txt", "stale");

    auto second = run(host);
    ASSERT_TRUE(second.succeeded());
    EXPECT_EQ(count_files(out), 1u);
    EXPECT_EQ(first.manifest_fingerprint, second.manifest_fingerprint);
}

TEST_F(OrchestratorTest, CudaFallsBackToSourceBuild) {
    FakeHostInspector host("Linux", "x86_64", GpuRuntimeStatus::Present);
    runner.fail_prebuilt.insert("llama-cpp-python");
    auto report = run(host);

    ASSERT_TRUE(report.succeeded()) << (report.error ? report.error->describe() : "");
    EXPECT_EQ(report.target->acceleration, Acceleration::Cuda);
    ASSERT_FALSE(report.installed.empty());
    EXPECT_EQ(report.installed[0].spec.name, "llama-cpp-python");
    EXPECT_EQ(report.installed[0].strategy_kind, deps::StrategyKind::SourceBuild);
    EXPECT_EQ(report.attempts[0].status, deps::AttemptStatus::Failed);
}

TEST_F(OrchestratorTest, OptionalDependencyFailureIsAWarning) {
    FakeHostInspector host("Darwin", "arm64");
    runner.fail_prebuilt.insert("mlx-lm");
    auto report = run(host);

    ASSERT_TRUE(report.succeeded()) << (report.error ? report.error->describe() : "");
    EXPECT_EQ(report.target->key(), "macos-arm64-metal");
    EXPECT_EQ(report.skipped, std::vector<std::string>{"mlx-lm"});
    ASSERT_FALSE(report.warnings.empty());
    EXPECT_EQ(report.warnings.back().rfind("optional dependency mlx-lm was not installed", 0), 0u);
    EXPECT_EQ(report.artifact->kind, pkg::ArtifactKind::DiskImage);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(OrchestratorTest, UnknownHostHaltsBeforeEnvironment) {
    FakeHostInspector host("FreeBSD", "amd64");
    auto report = run(host);

    EXPECT_EQ(report.state(), BuildState::Failed);
    EXPECT_EQ(report.failed_step, BuildState::EnvironmentReady);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->kind, ErrorKind::ProfileUnsupported);
    EXPECT_NE(report.error->describe().find("FreeBSD"), std::string::npos);
    EXPECT_EQ(report.states, (std::vector<BuildState>{BuildState::Init,
                                                      BuildState::ProfileResolved,
                                                      BuildState::Failed}));
    EXPECT_FALSE(report.target.has_value());
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(OrchestratorTest, UnpackagedPlatformFailsBeforeEnvironment) {
    config.app.platforms = {OsFamily::MacOS, OsFamily::Windows};
    FakeHostInspector host("Linux", "x86_64");
    auto report = run(host);

    EXPECT_EQ(report.failed_step, BuildState::EnvironmentReady);
    EXPECT_EQ(report.error->kind, ErrorKind::ProfileUnsupported);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_FALSE(fs::exists(root / "build" / "env"));
}

TEST_F(OrchestratorTest, RequiredDependencyFailureHaltsBuild) {
    FakeHostInspector host("Linux", "x86_64");
    runner.fail_prebuilt.insert("flask");
    auto report = run(host);

    EXPECT_EQ(report.failed_step, BuildState::DependenciesInstalled);
    EXPECT_EQ(report.error->kind, ErrorKind::DependencyUnavailable);
    EXPECT_EQ(report.states,
              (std::vector<BuildState>{BuildState::Init, BuildState::ProfileResolved,
                                       BuildState::EnvironmentReady, BuildState::Failed}));
    EXPECT_FALSE(report.artifact.has_value());
    EXPECT_TRUE(runner.calls_with("PyInstaller").empty());
    EXPECT_FALSE(fs::exists(root / "dist" / "linux-x86_64-none"));
}

TEST_F(OrchestratorTest, EnvironmentFailureHaltsBuild) {
    FakeHostInspector host("Linux", "x86_64");
    runner.venv_fails = true;
    auto report = run(host);
    EXPECT_EQ(report.failed_step, BuildState::EnvironmentReady);
    EXPECT_EQ(report.error->kind, ErrorKind::EnvironmentCreationFailed);
    EXPECT_TRUE(runner.calls_with("pip").empty());
}

TEST_F(OrchestratorTest, MissingNativeRuntimeFailsManifest) {
    FakeHostInspector host("Linux", "x86_64");
    runner.package_files["llama-cpp-python"] = {"llama_cpp/__init__.py"};
    auto report = run(host);
    EXPECT_EQ(report.failed_step, BuildState::ManifestBuilt);
    EXPECT_EQ(report.error->kind, ErrorKind::ManifestIncomplete);
}

TEST_F(OrchestratorTest, PackagingFailureLeavesNoArtifact) {
    FakeHostInspector host("Linux", "x86_64");
    runner.image_tool_writes_nothing = true;
    auto report = run(host);
    EXPECT_EQ(report.failed_step, BuildState::Packaged);
    EXPECT_EQ(report.error->kind, ErrorKind::PackagingFailed);
    EXPECT_EQ(count_files(root / "dist" / "linux-x86_64-none"), 0u);
}

TEST_F(OrchestratorTest, InvalidDependencyTableFailsAtInit) {
    FakeHostInspector host("Linux", "x86_64");
    auto& llama = config.dependencies[0];
    std::swap(llama.acquisition_order[0], llama.acquisition_order[1]);
    auto report = run(host);

    EXPECT_EQ(report.failed_step, BuildState::Init);
    EXPECT_EQ(report.error->kind, ErrorKind::ConfigInvalid);
    EXPECT_EQ(report.states, (std::vector<BuildState>{BuildState::Init, BuildState::Failed}));
    EXPECT_TRUE(report.progress.empty());
}

TEST_F(OrchestratorTest, ConcurrentBuildOfSameTargetIsRefused) {
    auto held = env::BuildLock::acquire(root / "build" / "locks" / "linux-x86_64-none.lock");
    ASSERT_TRUE(is_ok(held));

    FakeHostInspector host("Linux", "x86_64");
    auto report = run(host);
    EXPECT_EQ(report.failed_step, BuildState::EnvironmentReady);
    EXPECT_EQ(report.error->kind, ErrorKind::BuildLocked);
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(OrchestratorTest, SharedOutputDirectoryIsLockedAcrossWorkDirs) {
    auto held = env::acquire_target_locks(dir.path() / "work-a", dir.path() / "out",
                                          "linux-x86_64-none");
    ASSERT_TRUE(is_ok(held));
    lspack::test::write_file(dir.path() / "out" / "linux-x86_64-none" / "artifact.AppImage",
                             "published by the other build");

    FakeHostInspector host("Linux", "x86_64");
    BuildOptions options;
    options.output_dir = dir.path() / "out";
    options.work_dir = dir.path() / "work-b";
    auto report = run(host, options);

    EXPECT_EQ(report.failed_step, BuildState::EnvironmentReady);
    EXPECT_EQ(report.error->kind, ErrorKind::BuildLocked);
    EXPECT_TRUE(fs::exists(dir.path() / "out" / "linux-x86_64-none" / "artifact.AppImage"));
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(OrchestratorTest, LockIsReleasedAfterFailure) {
    FakeHostInspector host("Linux", "x86_64");
    runner.fail_prebuilt.insert("flask");
    auto failed = run(host);
    ASSERT_FALSE(failed.succeeded());

    runner.fail_prebuilt.clear();
    auto retried = run(host);
    EXPECT_TRUE(retried.succeeded());
}

TEST_F(OrchestratorTest, PendingInterruptStopsTheBuild) {
    FakeHostInspector host("Linux", "x86_64");
    proc::request_interrupt();
    auto report = run(host);

    EXPECT_EQ(report.failed_step, BuildState::ProfileResolved);
    EXPECT_EQ(report.error->kind, ErrorKind::Interrupted);
    EXPECT_EQ(report.progress.size(), 1u);
    EXPECT_TRUE(runner.calls.empty());
}
