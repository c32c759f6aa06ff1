// VoxelForge World Generation Tests
// cave_carver_test.cpp - Tests for cave carving and ore placement

#include <gtest/gtest.h>

#include <vector>
#include <voxelforge/world/cave_carver.hpp>

namespace voxelforge::world {

namespace {

class CaveCarverTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.width = 4;
        settings_.length = 4;
        settings_.max_height = 20;
        grid_ = WorldGrid::from_settings(settings_);
    }

    // Lava floor and stone up to y = 10 in every column
    void build_stone(VoxelEditor& editor) {
        for (int z = 0; z < grid_.length; ++z) {
            for (int x = 0; x < grid_.width; ++x) {
                editor.place(x, 0, z, BlockRole::Lava);
                for (int y = 1; y <= 10; ++y) {
                    editor.place(x, y, z, BlockRole::Stone);
                }
            }
        }
    }

    NoiseField3D constant_field(float value) const {
        NoiseField3D field;
        field.width = grid_.width;
        field.height = grid_.max_height;
        field.depth = grid_.length;
        field.values.assign(static_cast<size_t>(field.width * field.height * field.depth), value);
        return field;
    }

    CaveNoise noise(float small, float large, float ore) const {
        return CaveNoise{.small = constant_field(small), .large = constant_field(large), .ore = constant_field(ore)};
    }

    GenerationSettings settings_;
    WorldGrid grid_;
    VoxelMap voxels_;
    BlockTypeTable blocks_ = BlockTypeTable::defaults();
    SurfaceHeightMap surface_{4, 4, 10};
};

// ============================================================================
// Cell Tests
// ============================================================================

// Test: Either field alone or both together can open a cave
TEST_F(CaveCarverTest, CaveCellThresholds) {
    EXPECT_TRUE(is_cave_cell(0.65, 0.55));
    EXPECT_FALSE(is_cave_cell(0.65, 0.5));
    EXPECT_TRUE(is_cave_cell(0.71, 0.0));
    EXPECT_TRUE(is_cave_cell(0.0, 0.66));
    EXPECT_FALSE(is_cave_cell(0.6, 0.65));
    EXPECT_FALSE(is_cave_cell(0.0, 0.0));
}

// Test: Ores are tried in order with depth limits
TEST_F(CaveCarverTest, OreSelectionOrder) {
    DecorationRandom random(14, true);

    EXPECT_EQ(select_ore(0.63, 40, 0.5, random), BlockRole::Coal);
    EXPECT_EQ(select_ore(0.63, 41, 0.5, random), std::nullopt);
    EXPECT_EQ(select_ore(0.58, 30, 0.5, random), BlockRole::Iron);
    EXPECT_EQ(select_ore(0.55, 20, 0.5, random), BlockRole::Gold);
    EXPECT_EQ(select_ore(0.51, 10, 0.5, random), BlockRole::Diamond);
    EXPECT_EQ(select_ore(0.51, 16, 0.5, random), std::nullopt);
    EXPECT_EQ(select_ore(0.4, 5, 0.5, random), std::nullopt);

    // None of the above reached the emerald draw
    EXPECT_EQ(random.draw_count(), 0u);
}

// Test: Emerald draws only happen once noise and depth qualify
TEST_F(CaveCarverTest, EmeraldNeedsDraw) {
    DecorationRandom random(14, true);

    size_t emeralds = 0;
    for (int i = 0; i < 200; ++i) {
        const auto ore = select_ore(0.53, 25, 0.5, random);
        if (ore) {
            EXPECT_EQ(*ore, BlockRole::Emerald);
            ++emeralds;
        }
    }
    EXPECT_EQ(random.draw_count(), 200u);
    EXPECT_GT(emeralds, 0u);
    EXPECT_LT(emeralds, 200u);

    // Above the emerald depth limit and too shallow for diamond
    DecorationRandom untouched(14, true);
    EXPECT_EQ(select_ore(0.53, 31, 0.5, untouched), std::nullopt);
    EXPECT_EQ(untouched.draw_count(), 0u);
}

// ============================================================================
// Carving Tests
// ============================================================================

// Test: Cave noise removes stone between y = 2 and two below the surface
TEST_F(CaveCarverTest, CarvesStone) {
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_stone(editor);
    editor.place(1, 5, 1, BlockRole::Dirt);

    std::vector<int> percents;
    core::ProgressReporter progress([&percents](std::string_view, int percent) { percents.push_back(percent); });
    DecorationRandom random(14, true);
    CaveStats stats = carve_caves_and_ores(editor, surface_, noise(0.8f, 0.0f, 0.0f), settings_, random, progress);

    EXPECT_EQ(stats.carved, 16u * 7u - 1u);
    EXPECT_EQ(stats.ore_total(), 0u);
    EXPECT_TRUE(editor.is(0, 10, 0, BlockRole::Stone));
    EXPECT_TRUE(editor.is(0, 9, 0, BlockRole::Stone));
    EXPECT_FALSE(editor.contains(0, 8, 0));
    EXPECT_FALSE(editor.contains(0, 2, 0));
    EXPECT_TRUE(editor.is(0, 1, 0, BlockRole::Stone));
    EXPECT_TRUE(editor.is(0, 0, 0, BlockRole::Lava));
    EXPECT_TRUE(editor.is(1, 5, 1, BlockRole::Dirt));

    EXPECT_EQ(percents, (std::vector<int>{80, 81, 82, 83}));
}

// Test: Rich ore noise turns the walked stone into coal
TEST_F(CaveCarverTest, PlacesOres) {
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_stone(editor);

    core::ProgressReporter progress;
    DecorationRandom random(14, true);
    CaveStats stats = carve_caves_and_ores(editor, surface_, noise(0.0f, 0.0f, 0.95f), settings_, random, progress);

    EXPECT_EQ(stats.carved, 0u);
    EXPECT_EQ(stats.coal, 16u * 7u);
    EXPECT_TRUE(editor.is(2, 8, 2, BlockRole::Coal));
    EXPECT_TRUE(editor.is(2, 9, 2, BlockRole::Stone));
    EXPECT_EQ(random.draw_count(), 0u);
}

// Test: Flat worlds keep their stone and ores can be disabled
TEST_F(CaveCarverTest, FlatWorldWithoutOresIsUntouched) {
    VoxelEditor editor(voxels_, blocks_, grid_);
    build_stone(editor);
    const size_t before = voxels_.size();

    settings_.completely_flat = true;
    settings_.generate_ores = false;
    core::ProgressReporter progress;
    DecorationRandom random(14, true);
    CaveStats stats = carve_caves_and_ores(editor, surface_, noise(0.9f, 0.9f, 0.95f), settings_, random, progress);

    EXPECT_EQ(stats.carved, 0u);
    EXPECT_EQ(stats.ore_total(), 0u);
    EXPECT_EQ(voxels_.size(), before);
    EXPECT_EQ(editor.removed_count(), 0u);
}

// Test: Cave noise fields cover the whole volume
TEST_F(CaveCarverTest, NoiseFieldDimensions) {
    CaveNoise generated = generate_cave_noise(settings_, 42);
    EXPECT_EQ(generated.small.size(), 4u * 20u * 4u);
    EXPECT_EQ(generated.large.depth, 4);
    EXPECT_EQ(generated.ore.height, 20);
}

}  // namespace
}  // namespace voxelforge::world
