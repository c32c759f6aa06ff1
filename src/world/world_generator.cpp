// VoxelForge World Generation
// world_generator.cpp - Seed-based generation of a complete voxel world

#include <fmt/format.h>

#include <chrono>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/climate.hpp>
#include <voxelforge/world/density_field.hpp>
#include <voxelforge/world/heightmap.hpp>
#include <voxelforge/world/world_generator.hpp>

namespace voxelforge::world {

namespace {

DecorationRandom decoration_stream_for(const GenerationSettings& settings, int32_t seed, int64_t offset) {
    return DecorationRandom(static_cast<int64_t>(seed) + offset, settings.deterministic_decorations);
}

std::vector<std::string> missing_role_warnings(const BlockTypeTable& block_types) {
    std::vector<std::string> warnings;
    for (BlockRole role : block_types.missing_roles()) {
        warnings.push_back(fmt::format("missing block type mapping: {}", block_role_to_string(role)));
        VOXELFORGE_LOG_WARN(core::log_category::WORLD, "{}", warnings.back());
    }
    return warnings;
}

}  // namespace

std::optional<GenerationResult> WorldGenerator::generate(const GenerationSettings& settings, int32_t seed,
                                                         const BlockTypeTable& block_types) const {
    core::ProgressReporter progress;
    return generate(settings, seed, block_types, progress);
}

std::optional<GenerationResult> WorldGenerator::generate(const GenerationSettings& settings, int32_t seed,
                                                         const BlockTypeTable& block_types,
                                                         core::ProgressReporter& progress) const {
    const auto problems = validate_settings(settings);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            VOXELFORGE_LOG_ERROR(core::log_category::WORLD, "Invalid generation settings: {}", problem);
        }
        return std::nullopt;
    }

    const auto start_time = std::chrono::steady_clock::now();
    VOXELFORGE_LOG_INFO(core::log_category::WORLD, "Generating {}x{}x{} world with seed {}", settings.width,
                        settings.length, settings.max_height, seed);

    GenerationResult result;
    result.warnings = missing_role_warnings(block_types);

    const WorldGrid grid = WorldGrid::from_settings(settings);
    VoxelEditor editor(result.voxels, block_types, grid);
    GenerationStats& stats = result.stats;

    progress.reset();
    progress.report("Starting seed-based world generation...", 0);

    // Heightmap
    progress.report("Generating heightmap...", 5);
    const TerrainLayers layers = generate_terrain_layers(settings, seed);
    const HeightMap raw = composite_heightmap(layers, settings);

    progress.report("Smoothing heightmap...", 10);
    const HeightMap smoothed = smooth_heightmap(raw, settings);

    progress.report("Applying erosion...", 15);
    const HeightMap heights = erode_heightmap(smoothed, raw, settings);

    // Climate and biomes
    progress.report("Generating climate maps and biomes...", 20);
    const ClimateMaps climate = generate_climate(settings, seed);

    // Density and columns
    progress.report("Building terrain layers...", 25);
    const DensityField density = generate_density_field(settings, seed, climate.biomes, heights);

    progress.report("Building world from density field...", 45);
    stats.columns = build_columns(editor, density, climate.biomes, layers.rock, settings.sea_level, progress);
    VOXELFORGE_LOG_INFO(core::log_category::TERRAIN, "Terrain built: {} voxels", result.voxels.size());

    // Hydrology
    progress.report("Creating natural water bodies...", 65);
    const HydrologyNoise hydrology_noise = generate_hydrology_noise(settings, seed);
    SurfaceHeightMap surface = compute_surface_heights(editor);
    WaterState water =
        classify_water(surface, climate.biomes, hydrology_noise.lake, settings.sea_level, &stats.hydrology);
    {
        DecorationRandom bed_random = decoration_stream_for(settings, seed, decoration_stream::BED_MATERIAL);
        DecorationRandom beach_random = decoration_stream_for(settings, seed, decoration_stream::BEACHES);
        fill_water_bodies(editor, surface, water, settings.sea_level, bed_random, beach_random, &stats.hydrology);
    }
    if (!settings.completely_flat) {
        DecorationRandom bank_random = decoration_stream_for(settings, seed, decoration_stream::RIVER_BANKS);
        carve_rivers(editor, surface, water, hydrology_noise.river, settings.sea_level, bank_random,
                     &stats.hydrology);
    }
    VOXELFORGE_LOG_INFO(core::log_category::HYDROLOGY, "Water placed in {} columns", water.water_column_count());

    // Caves and ores
    progress.report("Preparing cave systems...", 75);
    const CaveNoise cave_noise = generate_cave_noise(settings, seed);

    progress.report("Carving cave systems...", 80);
    {
        DecorationRandom emerald_random = decoration_stream_for(settings, seed, decoration_stream::EMERALD);
        stats.caves = carve_caves_and_ores(editor, surface, cave_noise, settings, emerald_random, progress);
    }
    VOXELFORGE_LOG_INFO(core::log_category::CAVES, "Caves carved: {} voxels removed, {} ores", stats.caves.carved,
                        stats.caves.ore_total());

    progress.report("Smoothing underwater terrain...", 88);
    stats.hydrology.smoothed_voxels = smooth_underwater_terrain(editor, water);

    // Surface features
    progress.report("Adding biome-specific features...", 90);
    if (settings.mountain_range.enabled) {
        progress.report("Creating snow-capped mountain ranges along world borders...", 92);
        DecorationRandom snow_random = decoration_stream_for(settings, seed, decoration_stream::MOUNTAIN_SNOW);
        stats.mountains = apply_mountain_range(editor, surface, settings, snow_random);
        VOXELFORGE_LOG_INFO(core::log_category::MOUNTAINS, "Mountain ranges raised over {} columns",
                            stats.mountains.columns);
    }

    progress.report("Adding trees and vegetation...", 95);
    {
        DecorationRandom vegetation_random = decoration_stream_for(settings, seed, decoration_stream::VEGETATION);
        stats.vegetation = place_vegetation(editor, climate, settings, vegetation_random);
    }
    VOXELFORGE_LOG_INFO(core::log_category::VEGETATION, "Vegetation placed: {} trees, {} cacti",
                        stats.vegetation.trees, stats.vegetation.cacti);

    stats.dropped_writes = editor.dropped_count();
    stats.total_voxels = result.voxels.size();
    stats.elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();

    progress.finish(fmt::format("World generation complete. Created {} blocks.", stats.total_voxels));
    VOXELFORGE_LOG_INFO(core::log_category::WORLD, "World generated: {} voxels in {:.1f} ms", stats.total_voxels,
                        stats.elapsed_ms);
    return result;
}

}  // namespace voxelforge::world
