// VoxelForge World Generation
// block_types.cpp - Semantic block roles and their external ID table

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/block_types.hpp>

namespace voxelforge::world {

using json = nlohmann::json;

namespace {

constexpr std::array<const char*, BLOCK_ROLE_COUNT> ROLE_NAMES = {
    "stone",   "dirt",      "grass",      "sand",       "sand-light",  "snow",       "gravel",  "clay",
    "cactus",  "sandstone", "lava",       "water-still", "coal",       "iron",       "gold",    "emerald",
    "diamond", "log",       "poplar log", "oak-leaves", "cold-leaves", "cobblestone"};

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Registry names searched for each role, first hit wins
std::vector<const char*> registry_aliases(BlockRole role) {
    switch (role) {
        case BlockRole::WaterStill:
            return {"water"};
        case BlockRole::Coal:
            return {"coal-ore"};
        case BlockRole::Iron:
            return {"iron-ore"};
        case BlockRole::Gold:
            return {"gold-ore"};
        case BlockRole::Emerald:
            return {"emerald-ore"};
        case BlockRole::Diamond:
            return {"diamond-ore"};
        case BlockRole::Snow:
            return {"snow", "snow-block", "white-wool"};
        default:
            return {ROLE_NAMES[static_cast<size_t>(role)]};
    }
}

}  // namespace

const char* block_role_to_string(BlockRole role) {
    auto index = static_cast<size_t>(role);
    if (index >= ROLE_NAMES.size()) {
        return "unknown";
    }
    return ROLE_NAMES[index];
}

std::optional<BlockRole> block_role_from_string(std::string_view name) {
    for (size_t i = 0; i < ROLE_NAMES.size(); ++i) {
        if (name == ROLE_NAMES[i]) {
            return static_cast<BlockRole>(i);
        }
    }
    return std::nullopt;
}

BlockTypeTable::BlockTypeTable() {
    ids_.fill(BLOCK_INVALID);
}

void BlockTypeTable::set(BlockRole role, BlockId id) {
    ids_[static_cast<size_t>(role)] = id;
}

void BlockTypeTable::unset(BlockRole role) {
    ids_[static_cast<size_t>(role)] = BLOCK_INVALID;
}

std::optional<BlockId> BlockTypeTable::find(BlockRole role) const {
    BlockId id = ids_[static_cast<size_t>(role)];
    if (id == BLOCK_INVALID) {
        return std::nullopt;
    }
    return id;
}

bool BlockTypeTable::is(BlockId id, BlockRole role) const {
    BlockId mapped = ids_[static_cast<size_t>(role)];
    return mapped != BLOCK_INVALID && mapped == id;
}

std::vector<BlockRole> BlockTypeTable::missing_roles() const {
    std::vector<BlockRole> missing;
    for (size_t i = 0; i < ids_.size(); ++i) {
        if (ids_[i] == BLOCK_INVALID) {
            missing.push_back(static_cast<BlockRole>(i));
        }
    }
    return missing;
}

size_t BlockTypeTable::mapped_count() const {
    return static_cast<size_t>(std::count_if(ids_.begin(), ids_.end(), [](BlockId id) { return id != BLOCK_INVALID; }));
}

bool BlockTypeTable::load_from_json(std::string_view text) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        VOXELFORGE_LOG_ERROR(core::log_category::CONFIG, "Failed to parse block table: {}", e.what());
        return false;
    }

    // A registry list of {"id": n, "name": "..."} entries
    if (data.is_array()) {
        std::vector<RegisteredBlock> registry;
        for (const auto& entry : data) {
            if (!entry.is_object() || !entry.contains("id") || !entry.contains("name") ||
                !entry["id"].is_number_integer() || !entry["name"].is_string()) {
                VOXELFORGE_LOG_WARN(core::log_category::CONFIG, "Skipping malformed registry entry: {}", entry.dump());
                continue;
            }
            const auto id = entry["id"].get<int64_t>();
            if (id < 0 || id >= BLOCK_INVALID) {
                VOXELFORGE_LOG_WARN(core::log_category::CONFIG, "Invalid block ID in registry entry: {}", entry.dump());
                continue;
            }
            registry.push_back({static_cast<BlockId>(id), entry["name"].get<std::string>()});
        }
        *this = from_registry(registry);
        return true;
    }

    if (!data.is_object()) {
        VOXELFORGE_LOG_ERROR(core::log_category::CONFIG, "Block table must be a JSON object or array");
        return false;
    }

    BlockTypeTable table;
    for (const auto& [name, value] : data.items()) {
        auto role = block_role_from_string(name);
        if (!role) {
            VOXELFORGE_LOG_DEBUG(core::log_category::CONFIG, "Ignoring unknown block role '{}'", name);
            continue;
        }
        if (!value.is_number_integer() || value.get<int64_t>() < 0 || value.get<int64_t>() >= BLOCK_INVALID) {
            VOXELFORGE_LOG_WARN(core::log_category::CONFIG, "Invalid block ID for role '{}': {}", name, value.dump());
            continue;
        }
        table.set(*role, static_cast<BlockId>(value.get<int64_t>()));
    }

    *this = table;
    return true;
}

bool BlockTypeTable::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        VOXELFORGE_LOG_ERROR(core::log_category::CONFIG, "Failed to read block table: {}", path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_json(buffer.str())) {
        return false;
    }

    VOXELFORGE_LOG_INFO(core::log_category::CONFIG, "Loaded block table from {} ({} of {} roles mapped)",
                        path.string(), mapped_count(), BLOCK_ROLE_COUNT);
    return true;
}

std::string BlockTypeTable::to_json() const {
    json data = json::object();
    for (size_t i = 0; i < ids_.size(); ++i) {
        if (ids_[i] != BLOCK_INVALID) {
            data[ROLE_NAMES[i]] = ids_[i];
        }
    }
    return data.dump(4);
}

BlockTypeTable BlockTypeTable::defaults() {
    BlockTypeTable table;
    for (size_t i = 0; i < BLOCK_ROLE_COUNT; ++i) {
        table.ids_[i] = static_cast<BlockId>(i + 1);
    }
    return table;
}

BlockTypeTable BlockTypeTable::from_registry(const std::vector<RegisteredBlock>& registry) {
    BlockTypeTable table;
    for (size_t i = 0; i < BLOCK_ROLE_COUNT; ++i) {
        auto role = static_cast<BlockRole>(i);
        for (const char* alias : registry_aliases(role)) {
            auto match = std::find_if(registry.begin(), registry.end(), [&](const RegisteredBlock& block) {
                return !block.name.empty() && to_lower(block.name).find(to_lower(alias)) != std::string::npos;
            });
            if (match != registry.end()) {
                table.ids_[i] = match->id;
                break;
            }
        }
    }
    return table;
}

}  // namespace voxelforge::world
