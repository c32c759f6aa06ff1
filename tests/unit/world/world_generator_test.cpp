// VoxelForge World Generation Tests
// world_generator_test.cpp - End-to-end tests for seed-based world generation

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>
#include <voxelforge/world/world_generator.hpp>

namespace voxelforge::world {
namespace {

class WorldGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.width = 10;
        settings_.length = 10;
        settings_.max_height = 64;
    }

    GenerationSettings settings_;
    BlockTypeTable blocks_ = BlockTypeTable::defaults();
    WorldGenerator generator_;
};

// ============================================================================
// World Shape Tests
// ============================================================================

// Test: Every column has a lava floor and no voxel leaves the world box
TEST_F(WorldGeneratorTest, SmallWorldShape) {
    auto result = generator_.generate(settings_, 42, blocks_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->warnings.empty());
    EXPECT_EQ(result->stats.total_voxels, result->voxels.size());
    EXPECT_EQ(result->stats.dropped_writes, 0u);

    const WorldGrid grid = WorldGrid::from_settings(settings_);
    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            const auto floor = result->voxels.get(grid.to_world(x, 0, z));
            ASSERT_TRUE(floor.has_value()) << "Missing floor at (" << x << ", " << z << ")";
            EXPECT_TRUE(blocks_.is(*floor, BlockRole::Lava));
        }
    }

    result->voxels.for_each([&](const VoxelPos& pos, BlockId id) {
        EXPECT_GE(pos.x, grid.start_x);
        EXPECT_LT(pos.x, grid.start_x + grid.width);
        EXPECT_GE(pos.z, grid.start_z);
        EXPECT_LT(pos.z, grid.start_z + grid.length);
        EXPECT_GE(pos.y, 0);
        EXPECT_LT(pos.y, grid.max_height);
        EXPECT_GE(id, 1);
        EXPECT_LE(id, static_cast<BlockId>(BLOCK_ROLE_COUNT));
    });
}

// Test: Water never rises above sea level
TEST_F(WorldGeneratorTest, WaterStaysBelowSeaLevel) {
    settings_.width = 24;
    settings_.length = 24;
    auto result = generator_.generate(settings_, 7, blocks_);
    ASSERT_TRUE(result.has_value());

    result->voxels.for_each([&](const VoxelPos& pos, BlockId id) {
        if (blocks_.is(id, BlockRole::WaterStill)) {
            EXPECT_LE(pos.y, settings_.sea_level);
        }
    });
}

// Test: Flat worlds are solid up to y = 24 with no caves or rivers
TEST_F(WorldGeneratorTest, FlatWorld) {
    settings_.completely_flat = true;
    settings_.sea_level = 10;
    settings_.mountain_range.enabled = true;
    auto result = generator_.generate(settings_, 42, blocks_);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->stats.caves.carved, 0u);
    EXPECT_EQ(result->stats.hydrology.river_columns, 0u);
    EXPECT_EQ(result->stats.mountains.columns, 0u);

    const WorldGrid grid = WorldGrid::from_settings(settings_);
    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            for (int y = 0; y <= 24; ++y) {
                EXPECT_TRUE(result->voxels.contains(grid.to_world(x, y, z)))
                    << "Hole at (" << x << ", " << y << ", " << z << ")";
            }
        }
    }
}

// Test: Border ranges raise the world edges
TEST_F(WorldGeneratorTest, MountainRangeRaisesBorders) {
    settings_.width = 30;
    settings_.length = 30;
    settings_.mountain_range.enabled = true;
    settings_.mountain_range.height = 20;
    auto result = generator_.generate(settings_, 42, blocks_);
    ASSERT_TRUE(result.has_value());

    EXPECT_GT(result->stats.mountains.columns, 0u);
    EXPECT_GT(result->stats.mountains.snow + result->stats.mountains.stone, 0u);
}

// ============================================================================
// Determinism Tests
// ============================================================================

// Test: Same seed and settings produce identical worlds
TEST_F(WorldGeneratorTest, DeterministicForSeed) {
    auto first = generator_.generate(settings_, 1234, blocks_);
    auto second = generator_.generate(settings_, 1234, blocks_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->voxels.entries(), second->voxels.entries());
}

// Test: Different seeds produce different worlds
TEST_F(WorldGeneratorTest, SeedsDiffer) {
    auto first = generator_.generate(settings_, 1, blocks_);
    auto second = generator_.generate(settings_, 2, blocks_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->voxels.entries(), second->voxels.entries());
}

// ============================================================================
// Error Handling Tests
// ============================================================================

// Test: Invalid settings produce no world and no progress
TEST_F(WorldGeneratorTest, InvalidSettingsRejected) {
    settings_.width = 0;
    size_t updates = 0;
    core::ProgressReporter progress([&updates](std::string_view, int) { ++updates; });

    EXPECT_FALSE(generator_.generate(settings_, 42, blocks_, progress).has_value());
    EXPECT_EQ(updates, 0u);
}

// Test: Unmapped roles are reported and their writes dropped
TEST_F(WorldGeneratorTest, MissingRoleWarning) {
    blocks_.unset(BlockRole::Lava);
    auto result = generator_.generate(settings_, 42, blocks_);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result->warnings.size(), 1u);
    EXPECT_EQ(result->warnings[0], std::string("missing block type mapping: ") + block_role_to_string(BlockRole::Lava));
    EXPECT_GE(result->stats.dropped_writes, 100u);

    const WorldGrid grid = WorldGrid::from_settings(settings_);
    EXPECT_FALSE(result->voxels.contains(grid.to_world(0, 0, 0)));
}

// ============================================================================
// Progress Tests
// ============================================================================

// Test: Progress is non-decreasing and ends with a single 100
TEST_F(WorldGeneratorTest, ProgressSequence) {
    settings_.mountain_range.enabled = true;
    std::vector<std::pair<std::string, int>> updates;
    core::ProgressReporter progress([&updates](std::string_view message, int percent) {
        updates.emplace_back(std::string(message), percent);
    });

    auto result = generator_.generate(settings_, 42, blocks_, progress);
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(updates.empty());

    EXPECT_EQ(updates.front().first, "Starting seed-based world generation...");
    EXPECT_EQ(updates.front().second, 0);
    for (size_t i = 1; i < updates.size(); ++i) {
        EXPECT_GE(updates[i].second, updates[i - 1].second);
    }

    const auto hundreds = std::count_if(updates.begin(), updates.end(), [](const auto& u) { return u.second == 100; });
    EXPECT_EQ(hundreds, 1);
    EXPECT_EQ(updates.back().second, 100);
    EXPECT_EQ(updates.back().first,
              "World generation complete. Created " + std::to_string(result->voxels.size()) + " blocks.");

    auto has_message = [&updates](const std::string& message) {
        return std::any_of(updates.begin(), updates.end(), [&](const auto& u) { return u.first == message; });
    };
    EXPECT_TRUE(has_message("Creating natural water bodies..."));
    EXPECT_TRUE(has_message("Creating snow-capped mountain ranges along world borders..."));
    EXPECT_TRUE(has_message("Adding trees and vegetation..."));
}

// Test: A reporter reused for a second world reports its completion again
TEST_F(WorldGeneratorTest, ReusedReporterFinishesEachRun) {
    std::vector<int> percents;
    core::ProgressReporter progress([&percents](std::string_view, int percent) { percents.push_back(percent); });

    ASSERT_TRUE(generator_.generate(settings_, 42, blocks_, progress).has_value());
    const size_t first_run = percents.size();
    ASSERT_TRUE(generator_.generate(settings_, 42, blocks_, progress).has_value());

    ASSERT_EQ(percents.size(), 2 * first_run);
    EXPECT_EQ(percents[first_run - 1], 100);
    EXPECT_EQ(percents[first_run], 0);
    EXPECT_EQ(percents.back(), 100);
    EXPECT_TRUE(progress.is_finished());
}

// Test: The mountain stage is silent when disabled
TEST_F(WorldGeneratorTest, NoMountainProgressWhenDisabled) {
    std::vector<std::string> messages;
    core::ProgressReporter progress(
        [&messages](std::string_view message, int) { messages.emplace_back(message); });

    ASSERT_TRUE(generator_.generate(settings_, 42, blocks_, progress).has_value());
    EXPECT_EQ(std::find(messages.begin(), messages.end(),
                        "Creating snow-capped mountain ranges along world borders..."),
              messages.end());
}

}  // namespace
}  // namespace voxelforge::world
