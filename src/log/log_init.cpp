//! # Log Initialization from CLI
//!
//! Turns logging-related command-line options and the LSPACK_LOG environment
//! variable into a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace lspack::log {

static bool is_verbosity_flag(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return false;
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v')
            return false;
    }
    return true;
}

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || is_verbosity_flag(arg);
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    config.level = LogLevel::Info;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Warn;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            v_count = std::max(v_count, 1);
        } else if (is_verbosity_flag(arg)) {
            v_count = std::max(v_count, static_cast<int>(arg.size() - 1));
        }
    }

    // -v = Debug, -vv and beyond = Trace (Info is already the default)
    if (!has_cli_level && v_count > 0) {
        config.level = v_count >= 2 ? LogLevel::Trace : LogLevel::Debug;
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("LSPACK_LOG");
        if (env_log != nullptr && *env_log != '\0') {
            std::string env_str = env_log;
            if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace lspack::log
