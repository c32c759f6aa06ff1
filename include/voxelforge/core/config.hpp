// VoxelForge Core
// config.hpp - JSON-based configuration store

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace voxelforge::core {

// Section/key configuration store with JSON file persistence
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Load/Save operations
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view text);
    bool save(const std::filesystem::path& path) const;

    // Typed getters with defaults (type mismatches return the default)
    [[nodiscard]] int get_int(std::string_view section, std::string_view key,
                               int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                     double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key,
                                 bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                          std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    // Keys of an object section in sorted order, empty when absent
    [[nodiscard]] std::vector<std::string> keys(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);
    bool remove_section(std::string_view section);

    // Change notification callback
    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    // Dirty tracking
    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    // Reset to the default world generation parameters
    void set_defaults();

    [[nodiscard]] std::string dump() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* WORLD = "world";
    inline constexpr const char* TERRAIN = "terrain";
    inline constexpr const char* CLIMATE = "climate";
    inline constexpr const char* WATER = "water";
    inline constexpr const char* ORES = "ores";
    inline constexpr const char* MOUNTAINS = "mountains";
    inline constexpr const char* GENERATION = "generation";
    inline constexpr const char* DEBUG = "debug";
    inline constexpr const char* LOG_LEVELS = "log_levels";  // Stage name -> level name
}  // namespace config_section

namespace config_key {
    // World section
    inline constexpr const char* WIDTH = "width";
    inline constexpr const char* LENGTH = "length";
    inline constexpr const char* MAX_HEIGHT = "max_height";
    inline constexpr const char* SEED = "seed";

    // Terrain section
    inline constexpr const char* SCALE = "scale";
    inline constexpr const char* ROUGHNESS = "roughness";
    inline constexpr const char* FLATNESS_FACTOR = "flatness_factor";
    inline constexpr const char* SMOOTHING = "smoothing";
    inline constexpr const char* TERRAIN_BLEND = "terrain_blend";
    inline constexpr const char* COMPLETELY_FLAT = "completely_flat";

    // Climate section
    inline constexpr const char* TEMPERATURE = "temperature";

    // Water section
    inline constexpr const char* SEA_LEVEL = "sea_level";
    inline constexpr const char* RIVER_FREQUENCY = "river_frequency";

    // Ores section
    inline constexpr const char* ENABLED = "enabled";
    inline constexpr const char* RARITY = "rarity";

    // Mountains section (also uses ENABLED)
    inline constexpr const char* HEIGHT = "height";
    inline constexpr const char* SIZE = "size";
    inline constexpr const char* SNOW_HEIGHT = "snow_height";
    inline constexpr const char* SNOW_CAP = "snow_cap";

    // Generation section
    inline constexpr const char* DETERMINISTIC_DECORATIONS = "deterministic_decorations";
    inline constexpr const char* DESERT_DUNES = "desert_dunes";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
    inline constexpr const char* LOG_FILE = "log_file";
}  // namespace config_key

}  // namespace voxelforge::core
