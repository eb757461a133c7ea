//! # Container Command
//!
//! `lspack container [--project DIR] [--flavor cpu|cuda] [--output FILE]
//! [--build] [--tag TAG]`

#include "cmd_container.hpp"

#include "cli/utils.hpp"
#include "container/container_image.hpp"
#include "log/log.hpp"
#include "process/process.hpp"

#include <iostream>

namespace lspack::cli {

int run_container(int argc, char* argv[]) {
    std::string project_dir;
    std::string flavor = "cpu";
    std::string output;
    std::string tag;
    bool build = false;
    bool ok = true;

    for (int i = 2; i < argc && ok; ++i) {
        std::string arg = argv[i];
        if (take_value(argc, argv, i, "--project", project_dir, ok) ||
            take_value(argc, argv, i, "--flavor", flavor, ok) ||
            take_value(argc, argv, i, "--output", output, ok) ||
            take_value(argc, argv, i, "--tag", tag, ok)) {
            continue;
        }
        if (arg == "--build") {
            build = true;
        } else if (!log::is_log_option(arg)) {
            std::cerr << "error: unknown option '" << arg << "' for 'container'\n";
            return 1;
        }
    }
    if (!ok)
        return 1;

    auto parsed_flavor = container::parse_image_flavor(flavor);
    if (!parsed_flavor) {
        std::cerr << "error: unknown flavor '" << flavor << "' (expected cpu or cuda)\n";
        return 1;
    }

    auto project = load_project(project_dir);
    if (!project)
        return 1;

    container::ContainerRequest request;
    request.flavor = *parsed_flavor;
    request.output = output;
    request.build = build;
    request.tag = tag;

    proc::SystemProcessRunner runner;
    container::ContainerImageGenerator generator(*project, runner);
    auto written = generator.generate(request);
    if (is_err(written)) {
        report_error(unwrap_err(written));
        return 1;
    }
    std::cout << "Wrote " << unwrap(written).string() << "\n";
    return 0;
}

} // namespace lspack::cli
