// VoxelForge Core
// logger.cpp - Per-stage logging on top of spdlog

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <array>
#include <mutex>
#include <string>
#include <voxelforge/core/config.hpp>
#include <voxelforge/core/logger.hpp>

namespace voxelforge::core {

namespace {

constexpr std::array<const char*, 7> LEVEL_NAMES = {"trace", "debug", "info", "warn", "error", "critical", "off"};

constexpr std::array<const char*, LOG_CATEGORY_COUNT> CATEGORY_NAMES = {
    "engine", "world", "noise", "terrain", "hydrology", "caves", "mountains", "vegetation", "config"};

struct LoggerState {
    std::mutex mutex;
    bool initialized = false;
    LogLevel level = LogLevel::Info;
    std::array<std::optional<LogLevel>, LOG_CATEGORY_COUNT> overrides;
    size_t warnings = 0;
    std::shared_ptr<spdlog::logger> logger;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(static_cast<int>(level));
}

LogLevel effective_level(const LoggerState& s, LogCategory category) {
    const auto& override_level = s.overrides[static_cast<size_t>(category)];
    return override_level.value_or(s.level);
}

spdlog::sink_ptr make_console_sink(bool colors) {
    spdlog::sink_ptr sink;
    if (colors) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    return sink;
}

}  // namespace

// ============================================================================
// Names
// ============================================================================

const char* log_level_to_string(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "info";
}

std::optional<LogLevel> log_level_from_string(std::string_view name) {
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (name == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    if (name == "warning") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

const char* log_category_to_string(LogCategory category) {
    auto index = static_cast<size_t>(category);
    return index < CATEGORY_NAMES.size() ? CATEGORY_NAMES[index] : "unknown";
}

std::optional<LogCategory> log_category_from_string(std::string_view name) {
    for (size_t i = 0; i < CATEGORY_NAMES.size(); ++i) {
        if (name == CATEGORY_NAMES[i]) {
            return static_cast<LogCategory>(i);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Config Binding
// ============================================================================

LoggerConfig logger_config_from(const Config& config) {
    LoggerConfig result;

    const std::string level_name = config.get_string(config_section::DEBUG, config_key::LOG_LEVEL, "info");
    if (auto level = log_level_from_string(level_name)) {
        result.level = *level;
    } else {
        VOXELFORGE_LOG_WARN(log_category::CONFIG, "Unknown log level '{}', using info", level_name);
    }

    const std::string log_file = config.get_string(config_section::DEBUG, config_key::LOG_FILE, "");
    if (!log_file.empty()) {
        result.log_file = log_file;
    }

    for (const auto& stage : config.keys(config_section::LOG_LEVELS)) {
        const auto category = log_category_from_string(stage);
        const std::string name = config.get_string(config_section::LOG_LEVELS, stage, "");
        const auto level = log_level_from_string(name);
        if (!category || !level) {
            VOXELFORGE_LOG_WARN(log_category::CONFIG, "Ignoring log level '{}' for stage '{}'", name, stage);
            continue;
        }
        result.category_levels.emplace_back(*category, *level);
    }
    return result;
}

// ============================================================================
// Logger
// ============================================================================

void Logger::initialize(const LoggerConfig& config) {
    auto& s = state();
    std::string file_error;

    {
        std::lock_guard lock(s.mutex);
        if (s.initialized) {
            return;
        }

        std::vector<spdlog::sink_ptr> sinks{make_console_sink(config.colors)};
        if (!config.log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.log_file.string(), config.max_file_size, config.max_files);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(std::move(file_sink));
            } catch (const spdlog::spdlog_ex& ex) {
                file_error = ex.what();
            }
        }

        s.logger = std::make_shared<spdlog::logger>("voxelforge", sinks.begin(), sinks.end());
        s.logger->set_level(spdlog::level::trace);  // Filtered per category
        s.logger->flush_on(spdlog::level::warn);

        s.level = config.level;
        s.overrides.fill(std::nullopt);
        for (const auto& [category, level] : config.category_levels) {
            s.overrides[static_cast<size_t>(category)] = level;
        }
        s.warnings = 0;
        s.initialized = true;
    }

    if (!file_error.empty()) {
        VOXELFORGE_LOG_ERROR(log_category::ENGINE, "Cannot open log file {}: {}", config.log_file.string(),
                             file_error);
    } else if (!config.log_file.empty()) {
        VOXELFORGE_LOG_DEBUG(log_category::ENGINE, "Logging to {}", config.log_file.string());
    }
}

void Logger::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized) {
        return;
    }
    s.logger->flush();
    s.logger.reset();
    s.overrides.fill(std::nullopt);
    s.initialized = false;
}

bool Logger::is_initialized() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.initialized;
}

void Logger::set_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.level = level;
}

LogLevel Logger::level() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.level;
}

void Logger::set_category_level(LogCategory category, LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.overrides[static_cast<size_t>(category)] = level;
}

void Logger::clear_category_level(LogCategory category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.overrides[static_cast<size_t>(category)].reset();
}

LogLevel Logger::category_level(LogCategory category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return effective_level(s, category);
}

size_t Logger::warning_count() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.warnings;
}

void Logger::flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->flush();
    }
}

bool Logger::should_log(LogLevel level, LogCategory category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized) {
        return spdlog::should_log(to_spdlog(level));
    }
    return level >= effective_level(s, category);
}

void Logger::write(LogLevel level, LogCategory category, std::string_view message) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (!s.initialized) {
        spdlog::log(to_spdlog(level), "[{}] {}", log_category_to_string(category), message);
        return;
    }
    if (level >= LogLevel::Warn && level != LogLevel::Off) {
        ++s.warnings;
    }
    s.logger->log(to_spdlog(level), "[{}] {}", log_category_to_string(category), message);
}

}  // namespace voxelforge::core
