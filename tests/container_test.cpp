//! # Container Image Tests

#include "container/container_image.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace lspack;
using namespace lspack::container;
using lspack::test::fail_result;
using lspack::test::FakeToolRunner;
using lspack::test::read_file;
using lspack::test::TempDir;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(ImageFlavorTest, Parse) {
    EXPECT_EQ(parse_image_flavor("cpu"), ImageFlavor::Cpu);
    EXPECT_EQ(parse_image_flavor("cuda"), ImageFlavor::Cuda);
    EXPECT_EQ(parse_image_flavor("gpu"), ImageFlavor::Cuda);
    EXPECT_FALSE(parse_image_flavor("rocm").has_value());
    EXPECT_STREQ(to_string(ImageFlavor::Cuda), "cuda");
}

TEST(DockerfileTest, CpuFlavor) {
    auto config = config::ProjectConfig::defaults("/src/localllm");
    std::string text = render_dockerfile(config, ImageFlavor::Cpu);

    EXPECT_EQ(text.rfind("# LocalLLM Studio 1.0.0 API server (cpu)\nFROM python:3.11-slim\n", 0),
              0u);
    EXPECT_TRUE(contains(text, "RUN pip install -r requirements.txt\n"));
    EXPECT_FALSE(contains(text, "GGML_CUDA"));
    EXPECT_FALSE(contains(text, "python3-pip"));
    EXPECT_TRUE(contains(text, "COPY localllm_studio/ ./localllm_studio/\n"));
    EXPECT_TRUE(contains(text, "EXPOSE 7860 8000\n"));
    EXPECT_TRUE(contains(text, "CMD curl -f http://localhost:8000/health || exit 1\n"));
    EXPECT_TRUE(contains(
        text, "CMD [\"python\", \"-m\", \"localllm_studio\", \"--api\", \"--port\", \"8000\"]\n"));
}

TEST(DockerfileTest, CudaFlavor) {
    auto config = config::ProjectConfig::defaults("/src/localllm");
    std::string text = render_dockerfile(config, ImageFlavor::Cuda);

    EXPECT_TRUE(contains(text, "FROM nvidia/cuda:12.1.0-runtime-ubuntu22.04\n"));
    EXPECT_TRUE(contains(text, "    python3-pip \\\n"));
    EXPECT_TRUE(contains(text, "RUN CMAKE_ARGS=\"-DGGML_CUDA=on\" pip3 install llama-cpp-python\n"));
    EXPECT_TRUE(contains(text, "RUN pip3 install -r requirements.txt\n"));
    EXPECT_TRUE(contains(text, "CMD [\"python3\", \"-m\""));
}

TEST(DockerfileTest, FollowsContainerSettings) {
    auto config = config::ProjectConfig::defaults("/src/localllm");
    config.container.api_port = 9000;
    config.container.ui_port = 3000;
    config.container.health_path = "/api/health";
    config.container.cpu_base = "python:3.12-slim";
    std::string text = render_dockerfile(config, ImageFlavor::Cpu);

    EXPECT_TRUE(contains(text, "FROM python:3.12-slim\n"));
    EXPECT_TRUE(contains(text, "EXPOSE 3000 9000\n"));
    EXPECT_TRUE(contains(text, "http://localhost:9000/api/health"));
    EXPECT_TRUE(contains(text, "\"--port\", \"9000\"]"));
}

class ContainerGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = config::ProjectConfig::defaults(dir.path());
    }

    TempDir dir;
    config::ProjectConfig config;
    FakeToolRunner runner;
};

TEST_F(ContainerGeneratorTest, DefaultOutputsAndTags) {
    ContainerImageGenerator generator(config, runner);
    EXPECT_EQ(generator.default_output(ImageFlavor::Cpu), dir.path() / "Dockerfile");
    EXPECT_EQ(generator.default_output(ImageFlavor::Cuda), dir.path() / "Dockerfile.cuda");
    EXPECT_EQ(generator.default_tag(ImageFlavor::Cpu), "localllm-studio:1.0.0");
    EXPECT_EQ(generator.default_tag(ImageFlavor::Cuda), "localllm-studio:1.0.0-cuda");
}

TEST_F(ContainerGeneratorTest, WritesDockerfileWithoutBuilding) {
    ContainerImageGenerator generator(config, runner);
    auto result = generator.generate({ImageFlavor::Cuda, {}, false, {}});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();
    EXPECT_EQ(unwrap(result), dir.path() / "Dockerfile.cuda");
    EXPECT_EQ(read_file(unwrap(result)), render_dockerfile(config, ImageFlavor::Cuda));
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(ContainerGeneratorTest, BuildsImage) {
    ContainerImageGenerator generator(config, runner);
    fs::path output = dir.path() / "docker" / "Dockerfile";
    auto result = generator.generate({ImageFlavor::Cpu, output, true, ""});
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(fs::exists(output));

    auto calls = runner.calls_with("docker build");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].args, (std::vector<std::string>{"build", "-f", output.string(), "-t",
                                                       "localllm-studio:1.0.0",
                                                       dir.path().string()}));
}

TEST_F(ContainerGeneratorTest, ExplicitTag) {
    ContainerImageGenerator generator(config, runner);
    ASSERT_TRUE(is_ok(generator.generate({ImageFlavor::Cpu, {}, true, "studio:dev"})));
    auto calls = runner.calls_with("docker build");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].args[4], "studio:dev");
}

TEST_F(ContainerGeneratorTest, FailedBuildIsPackagingFailed) {
    runner.on([](const proc::ProcessSpec& spec) { return spec.program == "docker"; },
              [](const proc::ProcessSpec&) {
                  return fail_result(1, "Cannot connect to the Docker daemon");
              });
    ContainerImageGenerator generator(config, runner);
    auto result = generator.generate({ImageFlavor::Cpu, {}, true, ""});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::PackagingFailed);
    EXPECT_EQ(unwrap_err(result).message, "docker build failed");
    EXPECT_TRUE(contains(unwrap_err(result).describe(), "tag: localllm-studio:1.0.0"));
    // The Dockerfile is still there for a manual build
    EXPECT_TRUE(fs::exists(dir.path() / "Dockerfile"));
}
