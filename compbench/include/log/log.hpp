//! # compbench Logging
//!
//! Structured diagnostics for the harness, kept strictly on stderr (or a
//! file) so that the benchmark report on stdout is never interleaved with
//! log output.
//!
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages ("bench", "invoke", "report", "cli")
//! - Console and File sinks, text or JSON lines
//! - Compile-time level elision via COMPBENCH_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! COMPBENCH_LOG_INFO("bench", "Running " << name << " x" << iterations);
//! COMPBENCH_LOG_DEBUG("invoke", "Spawned pid " << pid);
//! ```

#ifndef COMPBENCH_LOG_HPP
#define COMPBENCH_LOG_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace compbench::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity, ascending. `Off` is only meaningful as a threshold.
enum class LogLevel : int { Trace, Debug, Info, Warn, Error, Fatal, Off };

inline constexpr std::array<std::string_view, 7> LEVEL_NAMES = {
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};

/// Upper-case name of a level (e.g., "WARN").
inline const char* level_name(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index].data() : "???";
}

/// Case-insensitive level lookup; nullopt for an unknown name.
std::optional<LogLevel> parse_level(std::string_view name);

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag (e.g., "invoke")
    std::string message;
    const char* file;     ///< __FILE__
    int line;             ///< __LINE__
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One JSON object per line
};

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Log Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// A sink that renders records as text or JSON lines.
class FormattedSink : public LogSink {
public:
    void set_format(LogFormat format) {
        format_ = format;
    }
    LogFormat format() const {
        return format_;
    }

protected:
    /// `level_color` wraps the level name in text mode; nullptr for none.
    std::string render(const LogRecord& record, const char* level_color) const;

private:
    LogFormat format_ = LogFormat::Text;
};

/// stderr, colored when stderr is a terminal.
class ConsoleSink : public FormattedSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_enabled_;
};

/// Log file. Error and Fatal records are flushed immediately.
class FileSink : public FormattedSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module thresholds from specs like "invoke=debug,*=warn".
class LogFilter {
public:
    /// Replaces the module table. `*=level` sets the default; a bare module
    /// name enables Trace for it; unknown level names mean Info.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold of any module or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool level_explicit = false; ///< `level` came from a flag or COMPBENCH_LOG
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Empty = no file sink
    bool console = true;     ///< stderr output
    bool colors = true;
};

/// Process-wide logger. Usable before `init()`; it then logs Info and above
/// to stderr.
class Logger {
public:
    static void init(const LogConfig& config);
    static Logger& instance();

    /// Checked by the macros before the message is formatted.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Drops every sink. Used by tests to silence or capture output.
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const {
        return threshold_;
    }

    void set_filter(std::string_view spec);
    void flush();

private:
    Logger();

    LogLevel threshold_ = LogLevel::Info; ///< cheapest reject before the filter
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the COMPBENCH_LOG environment variable
/// when neither a level nor a filter was given on the command line.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for arguments consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace ... 5=Fatal, 6=Off
#ifndef COMPBENCH_MIN_LOG_LEVEL
#define COMPBENCH_MIN_LOG_LEVEL 0
#endif

#define COMPBENCH_LOG_IMPL(level, module_str, msg)                                                 \
    do {                                                                                           \
        if (static_cast<int>(level) >= COMPBENCH_MIN_LOG_LEVEL) {                                  \
            auto& cb_logger_ = ::compbench::log::Logger::instance();                               \
            if (cb_logger_.should_log(level, module_str)) {                                        \
                std::ostringstream cb_oss_;                                                        \
                cb_oss_ << msg;                                                                    \
                cb_logger_.log(level, module_str, cb_oss_.str(), __FILE__, __LINE__);              \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define COMPBENCH_LOG_TRACE(module, msg)                                                           \
    COMPBENCH_LOG_IMPL(::compbench::log::LogLevel::Trace, module, msg)
#define COMPBENCH_LOG_DEBUG(module, msg)                                                           \
    COMPBENCH_LOG_IMPL(::compbench::log::LogLevel::Debug, module, msg)
#define COMPBENCH_LOG_INFO(module, msg)                                                            \
    COMPBENCH_LOG_IMPL(::compbench::log::LogLevel::Info, module, msg)
#define COMPBENCH_LOG_WARN(module, msg)                                                            \
    COMPBENCH_LOG_IMPL(::compbench::log::LogLevel::Warn, module, msg)
#define COMPBENCH_LOG_ERROR(module, msg)                                                           \
    COMPBENCH_LOG_IMPL(::compbench::log::LogLevel::Error, module, msg)
#define COMPBENCH_LOG_FATAL(module, msg)                                                           \
    COMPBENCH_LOG_IMPL(::compbench::log::LogLevel::Fatal, module, msg)

} // namespace compbench::log

#endif // COMPBENCH_LOG_HPP
