// VoxelForge Core
// logger.hpp - Per-stage logging on top of spdlog

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace voxelforge::core {

class Config;

// ============================================================================
// Levels and Categories
// ============================================================================

// Ordered like spdlog::level::level_enum
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

[[nodiscard]] const char* log_level_to_string(LogLevel level);
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name);

// One category per generation stage plus the front end
enum class LogCategory : uint8_t {
    Engine = 0,
    World,
    Noise,
    Terrain,
    Hydrology,
    Caves,
    Mountains,
    Vegetation,
    Config,
    Count  // Must be last
};

inline constexpr size_t LOG_CATEGORY_COUNT = static_cast<size_t>(LogCategory::Count);

[[nodiscard]] const char* log_category_to_string(LogCategory category);
[[nodiscard]] std::optional<LogCategory> log_category_from_string(std::string_view name);

namespace log_category {
    inline constexpr LogCategory ENGINE = LogCategory::Engine;
    inline constexpr LogCategory WORLD = LogCategory::World;
    inline constexpr LogCategory NOISE = LogCategory::Noise;
    inline constexpr LogCategory TERRAIN = LogCategory::Terrain;
    inline constexpr LogCategory HYDROLOGY = LogCategory::Hydrology;
    inline constexpr LogCategory CAVES = LogCategory::Caves;
    inline constexpr LogCategory MOUNTAINS = LogCategory::Mountains;
    inline constexpr LogCategory VEGETATION = LogCategory::Vegetation;
    inline constexpr LogCategory CONFIG = LogCategory::Config;
}  // namespace log_category

// ============================================================================
// Logger
// ============================================================================

struct LoggerConfig {
    LogLevel level = LogLevel::Info;  // Stages without an override
    std::vector<std::pair<LogCategory, LogLevel>> category_levels;
    std::filesystem::path log_file;   // Empty = console only
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 2;
    bool colors = true;
};

/// Build a logger setup from the debug and log_levels config sections.
/// Unknown stage or level names are skipped with a warning.
[[nodiscard]] LoggerConfig logger_config_from(const Config& config);

// Static logging interface shared by every stage
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_level(LogLevel level);
    [[nodiscard]] static LogLevel level();

    static void set_category_level(LogCategory category, LogLevel level);
    static void clear_category_level(LogCategory category);
    [[nodiscard]] static LogLevel category_level(LogCategory category);

    // Messages at Warn or above since initialize()
    [[nodiscard]] static size_t warning_count();

    static void flush();

    template<typename... Args>
    static void log(LogLevel level, LogCategory category, fmt::format_string<Args...> format, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        write(level, category, fmt::format(format, std::forward<Args>(args)...));
    }

private:
    Logger() = delete;

    [[nodiscard]] static bool should_log(LogLevel level, LogCategory category);
    static void write(LogLevel level, LogCategory category, std::string_view message);
};

}  // namespace voxelforge::core

// Level is checked before the message is formatted
#define VOXELFORGE_LOG_TRACE(category, ...) \
    ::voxelforge::core::Logger::log(::voxelforge::core::LogLevel::Trace, category, __VA_ARGS__)

#define VOXELFORGE_LOG_DEBUG(category, ...) \
    ::voxelforge::core::Logger::log(::voxelforge::core::LogLevel::Debug, category, __VA_ARGS__)

#define VOXELFORGE_LOG_INFO(category, ...) \
    ::voxelforge::core::Logger::log(::voxelforge::core::LogLevel::Info, category, __VA_ARGS__)

#define VOXELFORGE_LOG_WARN(category, ...) \
    ::voxelforge::core::Logger::log(::voxelforge::core::LogLevel::Warn, category, __VA_ARGS__)

#define VOXELFORGE_LOG_ERROR(category, ...) \
    ::voxelforge::core::Logger::log(::voxelforge::core::LogLevel::Error, category, __VA_ARGS__)

#define VOXELFORGE_LOG_CRITICAL(category, ...) \
    ::voxelforge::core::Logger::log(::voxelforge::core::LogLevel::Critical, category, __VA_ARGS__)
