#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace sightlink {
namespace log {

// ============================================================================
// Logger Names
// ============================================================================
constexpr const char* MAIN_LOGGER = "sightlink";
constexpr const char* TUNNEL_LOGGER = "tunnel";
constexpr const char* TRANSPORT_LOGGER = "transport";
constexpr const char* STREAM_LOGGER = "stream";
constexpr const char* DEVICE_LOGGER = "device";
constexpr const char* PROXY_LOGGER = "proxy";
constexpr const char* CONFIG_LOGGER = "config";

// ============================================================================
// Log Levels
// ============================================================================
enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// "debug" -> Level::Debug, unknown strings fall back to Info
Level parse_level(std::string_view level);
std::string_view level_name(Level level);

spdlog::level::level_enum to_spdlog_level(Level level);

// ============================================================================
// Log Configuration
// ============================================================================
struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10 MB
    size_t max_files{5};

    // Per-logger overrides, e.g. {"stream": Debug} while everything else
    // stays at `level`
    std::map<std::string, Level> component_levels;

    Level level_for(const std::string& name) const;
};

// ============================================================================
// Initialization
// ============================================================================
// All loggers share one sink set, so a rotating file is only ever opened
// once. init() is a no-op until shutdown() when already initialized.

void init(const LogConfig& config = LogConfig{});

// SIGHTLINK_LOG_LEVEL: trace, debug, info, warn, error, critical, off
// SIGHTLINK_LOG_FILE: path to log file
void init_from_env();

// Creates the logger on first use, with the configured level for its name
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

// Applies to every logger, clearing component overrides
void set_level(Level level);
void set_level(const std::string& name, Level level);
Level get_level(const std::string& name = MAIN_LOGGER);

void flush();
void shutdown();

// ============================================================================
// Component logger
// ============================================================================
// Cheap handle; every call resolves the logger so that re-initialisation
// (SIGHUP, log level changes) is picked up.
class Logger {
public:
    explicit Logger(std::string name) : name_(std::move(name)) {}

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) const {
        emit(spdlog::level::trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        emit(spdlog::level::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        emit(spdlog::level::info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        emit(spdlog::level::warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        emit(spdlog::level::err, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> fmt, Args&&... args) const {
        emit(spdlog::level::critical, fmt, std::forward<Args>(args)...);
    }

    bool enabled(Level level) const { return get(name_)->should_log(to_spdlog_level(level)); }
    const std::string& name() const { return name_; }

private:
    template<typename... Args>
    void emit(spdlog::level::level_enum lvl, fmt::format_string<Args...> fmt, Args&&... args) const {
        auto target = get(name_);
        if (target->should_log(lvl)) {
            target->log(lvl, fmt, std::forward<Args>(args)...);
        }
    }

    std::string name_;
};

// ============================================================================
// Macros
// ============================================================================

#define LOG_TRACE(...) ::sightlink::log::Logger(::sightlink::log::MAIN_LOGGER).trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::sightlink::log::Logger(::sightlink::log::MAIN_LOGGER).debug(__VA_ARGS__)
#define LOG_INFO(...) ::sightlink::log::Logger(::sightlink::log::MAIN_LOGGER).info(__VA_ARGS__)
#define LOG_WARN(...) ::sightlink::log::Logger(::sightlink::log::MAIN_LOGGER).warn(__VA_ARGS__)
#define LOG_ERROR(...) ::sightlink::log::Logger(::sightlink::log::MAIN_LOGGER).error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::sightlink::log::Logger(::sightlink::log::MAIN_LOGGER).critical(__VA_ARGS__)

#define NLOG_TRACE(name, ...) ::sightlink::log::Logger(name).trace(__VA_ARGS__)
#define NLOG_DEBUG(name, ...) ::sightlink::log::Logger(name).debug(__VA_ARGS__)
#define NLOG_INFO(name, ...) ::sightlink::log::Logger(name).info(__VA_ARGS__)
#define NLOG_WARN(name, ...) ::sightlink::log::Logger(name).warn(__VA_ARGS__)
#define NLOG_ERROR(name, ...) ::sightlink::log::Logger(name).error(__VA_ARGS__)

} // namespace log
} // namespace sightlink
