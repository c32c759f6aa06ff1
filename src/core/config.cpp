// VoxelForge Core
// config.cpp - JSON-based configuration store

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <voxelforge/core/config.hpp>
#include <voxelforge/core/logger.hpp>

namespace voxelforge::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    ChangeCallback change_callback;
    bool dirty = false;

    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }

    void changed(std::string_view section, std::string_view key) {
        dirty = true;
        if (change_callback) {
            change_callback(section, key);
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        VOXELFORGE_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_string(buffer.str())) {
        VOXELFORGE_LOG_ERROR(log_category::CONFIG, "Config file rejected: {}", path.string());
        return false;
    }

    VOXELFORGE_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            VOXELFORGE_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        impl_->data = std::move(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        VOXELFORGE_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            VOXELFORGE_LOG_ERROR(log_category::CONFIG, "Failed to create config directory {}: {}", parent.string(),
                                 ec.message());
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        VOXELFORGE_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }
    file << impl_->data.dump(4);

    VOXELFORGE_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return static_cast<bool>(file);
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    const json* value = impl_->find(section, key);
    if (value && value->is_number()) {
        return value->get<int>();
    }
    return default_value;
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    const json* value = impl_->find(section, key);
    if (value && value->is_number()) {
        return value->get<double>();
    }
    return default_value;
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    const json* value = impl_->find(section, key);
    if (value && value->is_boolean()) {
        return value->get<bool>();
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    const json* value = impl_->find(section, key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    impl_->changed(section, key);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    impl_->changed(section, key);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    impl_->changed(section, key);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->data[std::string(section)][std::string(key)] = std::string(value);
    impl_->changed(section, key);
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

std::vector<std::string> Config::keys(std::string_view section) const {
    std::vector<std::string> result;
    auto it = impl_->data.find(std::string(section));
    if (it == impl_->data.end() || !it->is_object()) {
        return result;
    }
    for (const auto& item : it->items()) {
        result.push_back(item.key());
    }
    return result;
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

bool Config::remove_section(std::string_view section) {
    if (!has_section(section)) {
        return false;
    }
    impl_->data.erase(std::string(section));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::WORLD,
                        {{config_key::WIDTH, 200},
                         {config_key::LENGTH, 200},
                         {config_key::MAX_HEIGHT, 64},
                         {config_key::SEED, 0}}},
                       {config_section::TERRAIN,
                        {{config_key::SCALE, 0.15},
                         {config_key::ROUGHNESS, 1.0},
                         {config_key::FLATNESS_FACTOR, 0.15},
                         {config_key::SMOOTHING, 0.7},
                         {config_key::TERRAIN_BLEND, 0.5},
                         {config_key::COMPLETELY_FLAT, false}}},
                       {config_section::CLIMATE, {{config_key::TEMPERATURE, 0.5}}},
                       {config_section::WATER, {{config_key::SEA_LEVEL, 35}, {config_key::RIVER_FREQUENCY, 0.05}}},
                       {config_section::ORES, {{config_key::ENABLED, true}, {config_key::RARITY, 0.74}}},
                       {config_section::MOUNTAINS,
                        {{config_key::ENABLED, false},
                         {config_key::HEIGHT, 20},
                         {config_key::SIZE, 0.0},
                         {config_key::SNOW_HEIGHT, 40},
                         {config_key::SNOW_CAP, true}}},
                       {config_section::GENERATION,
                        {{config_key::DETERMINISTIC_DECORATIONS, true}, {config_key::DESERT_DUNES, false}}},
                       {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}, {config_key::LOG_FILE, ""}}},
                       {config_section::LOG_LEVELS, json::object()}};
    impl_->dirty = true;
}

std::string Config::dump() const {
    return impl_->data.dump(4);
}

}  // namespace voxelforge::core
