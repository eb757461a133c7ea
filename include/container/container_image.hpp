//! # Container Image
//!
//! Generates the Dockerfile of the headless API server image, in a CPU-only
//! and a CUDA flavor, and optionally builds it with `docker build`.

#ifndef LSPACK_CONTAINER_CONTAINER_IMAGE_HPP
#define LSPACK_CONTAINER_CONTAINER_IMAGE_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "config/project_config.hpp"
#include "process/process.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lspack::container {

namespace fs = std::filesystem;

enum class ImageFlavor { Cpu, Cuda };

const char* to_string(ImageFlavor flavor);

std::optional<ImageFlavor> parse_image_flavor(std::string_view s);

std::string render_dockerfile(const config::ProjectConfig& config, ImageFlavor flavor);

struct ContainerRequest {
    ImageFlavor flavor = ImageFlavor::Cpu;
    /// Empty = `<root>/Dockerfile` (CPU) or `<root>/Dockerfile.cuda`.
    fs::path output;
    bool build = false;
    /// Empty = `<id>:<version>`, with a `-cuda` suffix for the CUDA flavor.
    std::string tag;
};

class ContainerImageGenerator {
public:
    ContainerImageGenerator(const config::ProjectConfig& config, proc::ProcessRunner& runner)
        : config_(config), runner_(runner) {}

    /// Writes the Dockerfile and, if requested, builds the image.
    /// Returns the Dockerfile path.
    Result<fs::path, PackError> generate(const ContainerRequest& request);

    fs::path default_output(ImageFlavor flavor) const;
    std::string default_tag(ImageFlavor flavor) const;

private:
    const config::ProjectConfig& config_;
    proc::ProcessRunner& runner_;
};

} // namespace lspack::container

#endif // LSPACK_CONTAINER_CONTAINER_IMAGE_HPP
