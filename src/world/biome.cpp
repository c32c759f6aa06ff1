// VoxelForge World Generation
// biome.cpp - Biome types, climate classification and surface palettes

#include <array>
#include <voxelforge/world/biome.hpp>

namespace voxelforge::world {

namespace {

constexpr std::array<const char*, BIOME_COUNT> BIOME_NAMES = {
    "snowy_plains", "snowy_forest", "snowy_taiga", "plains", "forest", "taiga",
    "swamp",        "savanna",      "jungle",      "desert", "ocean"};

// Rows: temperature band, columns: humidity band (< 0.3, < 0.6, else)
constexpr BiomeType CLIMATE_TABLE[5][3] = {
    {BiomeType::SnowyPlains, BiomeType::SnowyForest, BiomeType::SnowyTaiga},
    {BiomeType::Plains, BiomeType::Forest, BiomeType::Taiga},
    {BiomeType::Plains, BiomeType::Forest, BiomeType::Swamp},
    {BiomeType::Savanna, BiomeType::Jungle, BiomeType::Swamp},
    {BiomeType::Desert, BiomeType::Savanna, BiomeType::Jungle},
};

const std::array<BiomePalette, BIOME_COUNT>& palettes() {
    static const std::array<BiomePalette, BIOME_COUNT> table = [] {
        std::array<BiomePalette, BIOME_COUNT> result{};

        const BiomePalette sandy{BlockRole::Sand, BlockRole::Sand, std::nullopt, false};
        const BiomePalette snowy{BlockRole::Snow, BlockRole::Snow, std::nullopt, false};
        const BiomePalette grassy{BlockRole::Dirt, BlockRole::Grass, std::nullopt, true};

        for (size_t i = 0; i < BIOME_COUNT; ++i) {
            auto type = static_cast<BiomeType>(i);
            if (type == BiomeType::Desert || type == BiomeType::Savanna) {
                result[i] = sandy;
            } else if (is_snowy(type)) {
                result[i] = snowy;
            } else {
                result[i] = grassy;
            }
        }

        result[static_cast<size_t>(BiomeType::Ocean)].underwater_surface = BlockRole::Gravel;
        return result;
    }();
    return table;
}

}  // namespace

const char* biome_type_to_string(BiomeType type) {
    auto index = static_cast<size_t>(type);
    if (index >= BIOME_NAMES.size()) {
        return "unknown";
    }
    return BIOME_NAMES[index];
}

std::optional<BiomeType> biome_type_from_string(std::string_view name) {
    for (size_t i = 0; i < BIOME_NAMES.size(); ++i) {
        if (name == BIOME_NAMES[i]) {
            return static_cast<BiomeType>(i);
        }
    }
    return std::nullopt;
}

BiomeType classify_biome(double temperature, double humidity) {
    int band = 4;
    if (temperature < 0.2) {
        band = 0;
    } else if (temperature < 0.4) {
        band = 1;
    } else if (temperature < 0.6) {
        band = 2;
    } else if (temperature < 0.8) {
        band = 3;
    }

    int wetness = 2;
    if (humidity < 0.3) {
        wetness = 0;
    } else if (humidity < 0.6) {
        wetness = 1;
    }

    return CLIMATE_TABLE[band][wetness];
}

const BiomePalette& get_biome_palette(BiomeType type) {
    auto index = static_cast<size_t>(type);
    if (index >= BIOME_COUNT) {
        index = static_cast<size_t>(BiomeType::Plains);
    }
    return palettes()[index];
}

}  // namespace voxelforge::world
