#include "common/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace sightlink::log {

namespace {

// Loggers every tunnel component writes to; registered up front so that
// component overrides apply even before the first message
constexpr const char* KNOWN_LOGGERS[] = {
    MAIN_LOGGER, TUNNEL_LOGGER, TRANSPORT_LOGGER, STREAM_LOGGER,
    DEVICE_LOGGER, PROXY_LOGGER, CONFIG_LOGGER,
};

struct Registry {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    bool initialized = false;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

void build_sinks(Registry& reg) {
    reg.sinks.clear();

    if (reg.config.console) {
        reg.sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!reg.config.file_path.empty()) {
        try {
            reg.sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                reg.config.file_path, reg.config.max_file_size, reg.config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            // Keep running on the console; the file is optional
            fmt::print(stderr, "Cannot open log file {}: {}\n", reg.config.file_path, e.what());
        }
    }
    for (auto& sink : reg.sinks) {
        sink->set_pattern(reg.config.pattern);
    }
}

std::shared_ptr<spdlog::logger> make_logger(Registry& reg, const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(to_spdlog_level(reg.config.level_for(name)));
    reg.loggers[name] = logger;
    return logger;
}

void initialize(Registry& reg, const LogConfig& config) {
    reg.config = config;
    reg.loggers.clear();
    build_sinks(reg);
    for (const char* name : KNOWN_LOGGERS) {
        make_logger(reg, name);
    }
    reg.initialized = true;
}

} // anonymous namespace

Level parse_level(std::string_view level) {
    std::string lower(level);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error" || lower == "err") return Level::Error;
    if (lower == "critical" || lower == "crit") return Level::Critical;
    if (lower == "off") return Level::Off;
    return Level::Info;
}

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Trace:    return "trace";
        case Level::Debug:    return "debug";
        case Level::Info:     return "info";
        case Level::Warn:     return "warn";
        case Level::Error:    return "error";
        case Level::Critical: return "critical";
        case Level::Off:      return "off";
        default:              return "info";
    }
}

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

Level LogConfig::level_for(const std::string& name) const {
    auto it = component_levels.find(name);
    return it != component_levels.end() ? it->second : level;
}

void init(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    if (reg.initialized) {
        return;
    }
    initialize(reg, config);
}

void init_from_env() {
    LogConfig config;
    if (const char* level = std::getenv("SIGHTLINK_LOG_LEVEL")) {
        config.level = parse_level(level);
    }
    if (const char* file = std::getenv("SIGHTLINK_LOG_FILE")) {
        config.file_path = file;
    }
    init(config);
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    // 未初始化时用默认配置
    if (!reg.initialized) {
        initialize(reg, reg.config);
    }

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }
    return make_logger(reg, name);
}

void set_level(Level level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.config.level = level;
    reg.config.component_levels.clear();
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(to_spdlog_level(level));
    }
}

void set_level(const std::string& name, Level level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.config.component_levels[name] = level;
    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        it->second->set_level(to_spdlog_level(level));
    }
}

Level get_level(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level_for(name);
}

void flush() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
}

void shutdown() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    reg.loggers.clear();
    reg.sinks.clear();
    reg.initialized = false;
}

} // namespace sightlink::log
