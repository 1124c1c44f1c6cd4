//! # Log Initialization from CLI
//!
//! Turns logging-related command-line arguments and the TYFIX_LOG environment
//! variable into a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace tyfix::log {

auto is_log_option(std::string_view arg) -> bool {
    if (arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
        arg.starts_with("--log-format=") || arg == "-q" || arg == "--quiet") {
        return true;
    }
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return false;
    }
    return arg.find_first_not_of('v', 1) == std::string_view::npos;
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    size_t v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_cli_filter = true;
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (is_log_option(arg)) {
            // -v, -vv, -vvv
            v_count = std::max(v_count, arg.size() - 1);
        }
    }

    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("TYFIX_LOG");
        if (env_log != nullptr && *env_log != '\0') {
            std::string env_str = env_log;
            // "module=level" or comma lists are filters, anything else a level
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace tyfix::log
