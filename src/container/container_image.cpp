#include "container/container_image.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace lspack::container {

const char* to_string(ImageFlavor flavor) {
    return flavor == ImageFlavor::Cuda ? "cuda" : "cpu";
}

std::optional<ImageFlavor> parse_image_flavor(std::string_view s) {
    if (s == "cpu")
        return ImageFlavor::Cpu;
    if (s == "cuda" || s == "gpu")
        return ImageFlavor::Cuda;
    return std::nullopt;
}

std::string render_dockerfile(const config::ProjectConfig& config, ImageFlavor flavor) {
    const auto& c = config.container;
    bool cuda = flavor == ImageFlavor::Cuda;
    const char* python = cuda ? "python3" : "python";
    const char* pip = cuda ? "pip3" : "pip";

    std::ostringstream out;
    out << "# " << config.app.name << " " << config.app.version << " API server ("
        << to_string(flavor) << ")\n";
    out << "FROM " << (cuda ? c.cuda_base : c.cpu_base) << "\n\n";

    out << "ENV PYTHONDONTWRITEBYTECODE=1 \\\n";
    out << "    PYTHONUNBUFFERED=1 \\\n";
    out << "    PIP_NO_CACHE_DIR=1 \\\n";
    out << "    PIP_DISABLE_PIP_VERSION_CHECK=1\n\n";

    out << "WORKDIR /app\n\n";

    out << "RUN apt-get update && apt-get install -y --no-install-recommends \\\n";
    if (cuda) {
        out << "    python3 \\\n";
        out << "    python3-pip \\\n";
    }
    out << "    build-essential \\\n";
    out << "    cmake \\\n";
    out << "    git \\\n";
    out << "    curl \\\n";
    out << "    && rm -rf /var/lib/apt/lists/*\n\n";

    out << "COPY requirements.txt .\n";
    if (cuda) {
        out << "RUN CMAKE_ARGS=\"-DGGML_CUDA=on\" " << pip << " install llama-cpp-python\n";
    }
    out << "RUN " << pip << " install -r requirements.txt\n\n";

    out << "COPY " << c.module << "/ ./" << c.module << "/\n\n";

    out << "EXPOSE " << c.ui_port << " " << c.api_port << "\n\n";

    out << "HEALTHCHECK --interval=30s --timeout=10s --start-period=5s --retries=3 \\\n";
    out << "    CMD curl -f http://localhost:" << c.api_port << c.health_path << " || exit 1\n\n";

    out << "CMD [\"" << python << "\", \"-m\", \"" << c.module << "\", \"--api\", \"--port\", \""
        << c.api_port << "\"]\n";
    return out.str();
}

fs::path ContainerImageGenerator::default_output(ImageFlavor flavor) const {
    return config_.root / (flavor == ImageFlavor::Cuda ? "Dockerfile.cuda" : "Dockerfile");
}

std::string ContainerImageGenerator::default_tag(ImageFlavor flavor) const {
    std::string tag = config_.app.id + ":" + config_.app.version;
    if (flavor == ImageFlavor::Cuda)
        tag += "-cuda";
    return tag;
}

Result<fs::path, PackError> ContainerImageGenerator::generate(const ContainerRequest& request) {
    fs::path output = request.output.empty() ? default_output(request.flavor) : request.output;

    std::error_code ec;
    if (output.has_parent_path())
        fs::create_directories(output.parent_path(), ec);
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (out) {
        out << render_dockerfile(config_, request.flavor);
    }
    if (!out) {
        return PackError(ErrorKind::PackagingFailed, "cannot write Dockerfile")
            .with("path", output.string());
    }
    out.close();
    LSPACK_LOG_INFO("container", "Wrote " << to_string(request.flavor) << " Dockerfile to "
                                          << output.string());

    if (!request.build)
        return output;

    std::string tag = request.tag.empty() ? default_tag(request.flavor) : request.tag;
    proc::ProcessSpec spec;
    spec.program = "docker";
    spec.args = {"build", "-f", output.string(), "-t", tag, config_.root.string()};
    spec.timeout_seconds = config_.package.tool_timeout_seconds;
    LSPACK_LOG_INFO("container", "Building image " << tag);
    LSPACK_LOG_DEBUG("container", "$ " << spec.command_line());

    auto result = runner_.run(spec);
    if (result.interrupted) {
        return PackError(ErrorKind::Interrupted, "docker build interrupted");
    }
    if (!result.succeeded()) {
        return PackError(ErrorKind::PackagingFailed, "docker build failed")
            .with("tag", tag)
            .with("detail", result.failure_summary());
    }
    return output;
}

} // namespace lspack::container
