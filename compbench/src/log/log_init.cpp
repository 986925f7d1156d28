//! # Logging Options
//!
//! Turns the logging flags of the command line, or failing that the
//! COMPBENCH_LOG environment variable, into a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>

namespace compbench::log {

namespace {

constexpr std::string_view LEVEL_FLAG = "--log-level=";
constexpr std::string_view FILTER_FLAG = "--log-filter=";
constexpr std::string_view FILE_FLAG = "--log-file=";
constexpr std::string_view FORMAT_FLAG = "--log-format=";

/// Number of 'v's in "-v", "-vv", "-vvv"; 0 for anything else.
int verbosity_count(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-')
        return 0;
    std::string_view vs = arg.substr(1);
    bool all_v = std::all_of(vs.begin(), vs.end(), [](char c) { return c == 'v'; });
    return all_v ? static_cast<int>(vs.size()) : 0;
}

LogLevel level_for_verbosity(int count) {
    if (count >= 3)
        return LogLevel::Trace;
    return count == 2 ? LogLevel::Debug : LogLevel::Info;
}

} // namespace

bool is_log_option(std::string_view arg) {
    for (std::string_view flag : {LEVEL_FLAG, FILTER_FLAG, FILE_FLAG, FORMAT_FLAG}) {
        if (arg.starts_with(flag))
            return true;
    }
    return arg == "-q" || arg == "--quiet" || arg == "--verbose" || verbosity_count(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    bool has_filter = false;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with(LEVEL_FLAG)) {
            explicit_level = parse_level(arg.substr(LEVEL_FLAG.size())).value_or(LogLevel::Info);
        } else if (arg.starts_with(FILTER_FLAG)) {
            config.filter_spec = arg.substr(FILTER_FLAG.size());
            has_filter = true;
        } else if (arg.starts_with(FILE_FLAG)) {
            config.log_file = arg.substr(FILE_FLAG.size());
        } else if (arg.starts_with(FORMAT_FLAG)) {
            auto format = arg.substr(FORMAT_FLAG.size());
            config.format = (format == "json" || format == "JSON") ? LogFormat::JSON
                                                                   : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_count(arg));
        }
    }

    // --log-level and -q beat -v
    if (!explicit_level && verbosity > 0) {
        explicit_level = level_for_verbosity(verbosity);
    }
    if (explicit_level) {
        config.level = *explicit_level;
        config.level_explicit = true;
        return config;
    }
    if (has_filter) {
        return config;
    }

    // "invoke=debug" or "invoke,report" is a filter; anything else a level
    const char* env = std::getenv("COMPBENCH_LOG");
    std::string_view env_value = env ? env : "";
    if (env_value.find_first_of("=,") != std::string_view::npos) {
        config.filter_spec = env_value;
    } else if (!env_value.empty()) {
        config.level = parse_level(env_value).value_or(LogLevel::Info);
        config.level_explicit = true;
    }
    return config;
}

} // namespace compbench::log
