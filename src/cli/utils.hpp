//! # CLI Utilities Interface
//!
//! Shared helpers for the command handlers.
//!
//! | Function              | Description                                   |
//! |-----------------------|-----------------------------------------------|
//! | `take_value()`        | Reads `--opt VALUE` or `--opt=VALUE`          |
//! | `load_project()`      | Loads `lspack.toml` from `--project`          |
//! | `report_error()`      | Prints a `PackError` the way every command does |
//! | `print_usage()`       | Prints CLI help text                          |
//! | `print_version()`     | Prints the tool version                       |

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "config/project_config.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace lspack::cli {

namespace fs = std::filesystem;

/// If `argv[i]` is `name` or `name=...`, stores the value in `out` and
/// returns true. A missing value is reported on stderr and leaves `ok` false.
bool take_value(int argc, char* argv[], int& i, const std::string& name, std::string& out,
                bool& ok);

/// Loads the project configuration, reporting errors on stderr.
std::optional<config::ProjectConfig> load_project(const std::string& project_dir);

/// Prints "error: <prefix><Kind>: <message>" followed by one indented line
/// per context entry.
void report_error(const PackError& error, const std::string& prefix = "");

void print_usage();
void print_version();

} // namespace lspack::cli
