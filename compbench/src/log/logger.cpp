//! # Logger
//!
//! Record rendering, the console and file sinks, module filtering and the
//! process-wide Logger.

#include "log/log.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace compbench::log {

std::optional<LogLevel> parse_level(std::string_view name) {
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        std::string_view candidate = LEVEL_NAMES[i];
        if (candidate.size() != name.size())
            continue;

        bool same = true;
        for (size_t j = 0; j < name.size() && same; ++j) {
            same = std::toupper(static_cast<unsigned char>(name[j])) == candidate[j];
        }
        if (same)
            return static_cast<LogLevel>(i);
    }
    return std::nullopt;
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

constexpr const char* ANSI_RESET = "\033[0m";

const char* color_for(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return nullptr;
}

/// Local wall-clock time of `ms` as "HH:MM:SS.mmm".
void put_clock_time(std::ostream& os, int64_t ms) {
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm local {};
    localtime_r(&seconds, &local);
    os << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << (ms % 1000) << std::setfill(' ');
}

void put_json_string(std::ostream& os, std::string_view text) {
    os << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            os << "\\\"";
            break;
        case '\\':
            os << "\\\\";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\r':
            os << "\\r";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            os << c;
        }
    }
    os << '"';
}

bool stderr_is_color_terminal() {
    if (!isatty(STDERR_FILENO))
        return false;
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

} // namespace

std::string FormattedSink::render(const LogRecord& record, const char* level_color) const {
    std::ostringstream os;

    if (format_ == LogFormat::JSON) {
        os << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
           << "\",\"module\":";
        put_json_string(os, record.module);
        os << ",\"msg\":";
        put_json_string(os, record.message);
        os << "}\n";
        return os.str();
    }

    put_clock_time(os, record.timestamp_ms);
    os << ' ' << (level_color ? level_color : "") << std::left << std::setw(5)
       << level_name(record.level) << (level_color ? ANSI_RESET : "") << " [" << record.module
       << "] " << record.message << '\n';
    return os.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && stderr_is_color_terminal()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << render(record, colors_enabled_ ? color_for(record.level) : nullptr);
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, std::ios::out | (append ? std::ios::app : std::ios::trunc)) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << render(record, nullptr);
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open())
        file_.flush();
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view entry = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty())
            continue;

        size_t eq = entry.find('=');
        std::string_view module = entry.substr(0, eq);
        LogLevel level = LogLevel::Trace;
        if (eq != std::string_view::npos) {
            level = parse_level(entry.substr(eq + 1)).value_or(LogLevel::Info);
        }

        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto found = module_levels_.find(std::string(module));
    LogLevel threshold = found == module_levels_.end() ? default_level_ : found->second;
    return level >= threshold;
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& entry : module_levels_) {
        if (entry.second < lowest)
            lowest = entry.second;
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(const LogConfig& config) {
    LogFilter filter;
    filter.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        filter.parse(config.filter_spec);
        // An explicit level may only make the default more verbose
        if (config.level_explicit && config.level < filter.default_level()) {
            filter.set_default_level(config.level);
        }
    }

    std::vector<std::unique_ptr<LogSink>> sinks;
    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        sinks.push_back(std::move(console));
    }

    bool file_failed = false;
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            sinks.push_back(std::move(file));
        } else {
            file_failed = true;
        }
    }

    auto& logger = instance();
    {
        std::lock_guard<std::mutex> lock(logger.mutex_);
        logger.filter_ = std::move(filter);
        logger.threshold_ = logger.filter_.min_level();
        logger.sinks_ = std::move(sinks);
    }

    if (file_failed) {
        COMPBENCH_LOG_WARN("cli", "Cannot open log file " << config.log_file);
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    return level >= threshold_ && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(level);
    threshold_ = filter_.min_level();
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    threshold_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace compbench::log
