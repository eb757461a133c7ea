//! # Container Command Interface

#pragma once

namespace lspack::cli {

// Writes the container Dockerfile for --flavor cpu|cuda, optionally builds it
int run_container(int argc, char* argv[]);

} // namespace lspack::cli
