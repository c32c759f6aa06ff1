// VoxelForge World Generation Tests
// vegetation_test.cpp - Tests for cacti, trees and dunes

#include <gtest/gtest.h>

#include <voxelforge/world/vegetation.hpp>

namespace voxelforge::world {
namespace {

class VegetationTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.width = 42;
        settings_.length = 42;
        settings_.max_height = 32;
        grid_ = WorldGrid::from_settings(settings_);
    }

    // Stone with a single top layer at y = 5
    void build_ground(VoxelEditor& editor, BlockRole top) {
        for (int z = 0; z < grid_.length; ++z) {
            for (int x = 0; x < grid_.width; ++x) {
                for (int y = 1; y < 5; ++y) {
                    editor.place(x, y, z, BlockRole::Stone);
                }
                editor.place(x, 5, z, top);
            }
        }
    }

    ClimateMaps uniform_climate(BiomeType biome, float temperature) const {
        ClimateMaps climate;
        climate.temperature.width = grid_.width;
        climate.temperature.height = grid_.length;
        climate.temperature.values.assign(grid_.column_count(), temperature);
        climate.humidity = climate.temperature;
        climate.biomes = ColumnMap<BiomeType>(grid_.width, grid_.length, biome);
        return climate;
    }

    size_t count(BlockRole role) const { return voxels_.count(*blocks_.find(role)); }

    GenerationSettings settings_;
    WorldGrid grid_;
    VoxelMap voxels_;
    BlockTypeTable blocks_ = BlockTypeTable::defaults();
};

// ============================================================================
// Table Tests
// ============================================================================

// Test: Tree chances per biome
TEST_F(VegetationTest, TreeProbabilities) {
    EXPECT_DOUBLE_EQ(tree_probability(BiomeType::Forest), 0.3);
    EXPECT_DOUBLE_EQ(tree_probability(BiomeType::Taiga), 0.3);
    EXPECT_DOUBLE_EQ(tree_probability(BiomeType::Plains), 0.15);
    EXPECT_DOUBLE_EQ(tree_probability(BiomeType::Savanna), 0.15);
    EXPECT_DOUBLE_EQ(tree_probability(BiomeType::SnowyForest), 0.25);
    EXPECT_DOUBLE_EQ(tree_probability(BiomeType::SnowyTaiga), 0.25);
    EXPECT_DOUBLE_EQ(tree_probability(BiomeType::SnowyPlains), 0.1);
    EXPECT_DOUBLE_EQ(tree_probability(BiomeType::Jungle), 0.1);
}

// Test: Hotter deserts grow more cacti
TEST_F(VegetationTest, CactusProbabilities) {
    EXPECT_DOUBLE_EQ(cactus_probability(0.9), 0.35);
    EXPECT_DOUBLE_EQ(cactus_probability(0.75), 0.3);
    EXPECT_DOUBLE_EQ(cactus_probability(0.65), 0.25);
    EXPECT_DOUBLE_EQ(cactus_probability(0.6), 0.2);
    EXPECT_DOUBLE_EQ(cactus_probability(0.0), 0.2);
}

// Test: Tree shapes per biome
TEST_F(VegetationTest, TreeShapes) {
    EXPECT_EQ(tree_base_height(BiomeType::Savanna), 5);
    EXPECT_EQ(tree_base_height(BiomeType::SnowyTaiga), 3);
    EXPECT_EQ(tree_base_height(BiomeType::Forest), 4);
    EXPECT_EQ(tree_leaf_radius(BiomeType::Savanna), 3);
    EXPECT_EQ(tree_leaf_radius(BiomeType::Forest), 2);
}

// ============================================================================
// Placement Tests
// ============================================================================

// Test: Forest trees grow from grass with oak logs and leaves
TEST_F(VegetationTest, TreesOnGrass) {
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_ground(editor, BlockRole::Grass);

    DecorationRandom random(16, true);
    VegetationStats stats = place_vegetation(editor, uniform_climate(BiomeType::Forest, 0.5f), settings_, random);

    EXPECT_GT(stats.trees, 0u);
    EXPECT_EQ(stats.cacti, 0u);
    EXPECT_EQ(count(BlockRole::OakLeaves), stats.leaves);
    EXPECT_GE(count(BlockRole::Log), stats.trees * 4);
    EXPECT_EQ(count(BlockRole::PoplarLog), 0u);

    // Every trunk stands on grass or on another log
    voxels_.for_each([&](const VoxelPos& pos, BlockId id) {
        if (!blocks_.is(id, BlockRole::Log)) {
            return;
        }
        const auto below = voxels_.get(VoxelPos(pos.x, pos.y - 1, pos.z));
        ASSERT_TRUE(below.has_value());
        EXPECT_TRUE(blocks_.is(*below, BlockRole::Log) || blocks_.is(*below, BlockRole::Grass));
    });
}

// Test: Snowy biomes use poplar logs and cold leaves
TEST_F(VegetationTest, SnowyTrees) {
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_ground(editor, BlockRole::Snow);

    DecorationRandom random(16, true);
    VegetationStats stats = place_vegetation(editor, uniform_climate(BiomeType::SnowyTaiga, 0.1f), settings_, random);

    ASSERT_GT(stats.trees, 0u);
    EXPECT_EQ(count(BlockRole::Log), 0u);
    EXPECT_GE(count(BlockRole::PoplarLog), stats.trees * 3);
    EXPECT_EQ(count(BlockRole::ColdLeaves), stats.leaves);
}

// Test: Sand surfaces outside deserts stay bare
TEST_F(VegetationTest, NoTreesOnSand) {
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_ground(editor, BlockRole::Sand);
    const size_t before = voxels_.size();

    DecorationRandom random(16, true);
    VegetationStats stats = place_vegetation(editor, uniform_climate(BiomeType::Forest, 0.5f), settings_, random);

    EXPECT_EQ(stats.trees, 0u);
    EXPECT_EQ(stats.cacti, 0u);
    EXPECT_EQ(voxels_.size(), before);
    // Only the four grid offsets were drawn
    EXPECT_EQ(random.draw_count(), 4u);
}

// Test: Deserts grow cacti on sand and no trees
TEST_F(VegetationTest, CactiInDesert) {
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_ground(editor, BlockRole::Sand);

    DecorationRandom random(16, true);
    VegetationStats stats = place_vegetation(editor, uniform_climate(BiomeType::Desert, 0.9f), settings_, random);

    EXPECT_GT(stats.cacti, 0u);
    EXPECT_EQ(stats.trees, 0u);
    EXPECT_EQ(stats.dunes, 0u);
    EXPECT_GE(count(BlockRole::Cactus), stats.cacti * 3);
    EXPECT_LE(count(BlockRole::Cactus), stats.cacti * 4);

    voxels_.for_each([&](const VoxelPos& pos, BlockId id) {
        if (!blocks_.is(id, BlockRole::Cactus)) {
            return;
        }
        const auto below = voxels_.get(VoxelPos(pos.x, pos.y - 1, pos.z));
        ASSERT_TRUE(below.has_value());
        EXPECT_TRUE(blocks_.is(*below, BlockRole::Cactus) || blocks_.is(*below, BlockRole::Sand));
    });
}

// Test: Dunes raise sandstone one block above desert sand
TEST_F(VegetationTest, DesertDunes) {
    settings_.desert_dunes = true;
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_ground(editor, BlockRole::Sand);

    DecorationRandom random(16, true);
    VegetationStats stats = place_vegetation(editor, uniform_climate(BiomeType::Desert, 0.5f), settings_, random);

    EXPECT_GT(stats.dunes, 0u);
    EXPECT_GE(count(BlockRole::Sandstone), stats.dunes);
    voxels_.for_each([&](const VoxelPos& pos, BlockId id) {
        if (blocks_.is(id, BlockRole::Sandstone)) {
            EXPECT_GE(pos.y, 6);
        }
    });
}

// Test: Vegetation never replaces existing voxels
TEST_F(VegetationTest, NeverOverwritesTerrain) {
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_ground(editor, BlockRole::Grass);
    for (int z = 1; z < grid_.length; z += 3) {
        for (int x = 2; x < grid_.width; x += 3) {
            editor.place(x, 7, z, BlockRole::Cobblestone);
        }
    }
    const auto before = voxels_.entries();

    DecorationRandom random(16, true);
    place_vegetation(editor, uniform_climate(BiomeType::Forest, 0.5f), settings_, random);

    for (const auto& [key, id] : before) {
        const auto it = voxels_.entries().find(key);
        ASSERT_NE(it, voxels_.entries().end());
        EXPECT_EQ(it->second, id);
    }
}

// Test: The same stream produces the same vegetation
TEST_F(VegetationTest, Deterministic) {
    VoxelMap first;
    VoxelMap second;
    const ClimateMaps climate = uniform_climate(BiomeType::Savanna, 0.7f);

    for (VoxelMap* map : {&first, &second}) {
        VoxelEditor editor(*map, blocks_, grid_);
        build_ground(editor, BlockRole::Grass);
        DecorationRandom random(16, true);
        place_vegetation(editor, climate, settings_, random);
    }
    EXPECT_EQ(first.entries(), second.entries());
}

}  // namespace
}  // namespace voxelforge::world
