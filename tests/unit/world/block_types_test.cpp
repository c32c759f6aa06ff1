// VoxelForge World Generation Tests
// block_types_test.cpp - Tests for block roles and the BlockTypeTable

#include <gtest/gtest.h>

#include <voxelforge/world/block_types.hpp>

namespace voxelforge::world {
namespace {

class BlockTypesTest : public ::testing::Test {};

// Test: Every role name converts back to its role
TEST_F(BlockTypesTest, RoleNamesRoundTrip) {
    for (size_t i = 0; i < BLOCK_ROLE_COUNT; ++i) {
        auto role = static_cast<BlockRole>(i);
        auto parsed = block_role_from_string(block_role_to_string(role));
        ASSERT_TRUE(parsed.has_value()) << "Failed for role index " << i;
        EXPECT_EQ(*parsed, role);
    }
    EXPECT_STREQ(block_role_to_string(BlockRole::PoplarLog), "poplar log");
    EXPECT_STREQ(block_role_to_string(BlockRole::WaterStill), "water-still");
    EXPECT_FALSE(block_role_from_string("bedrock").has_value());
}

// Test: A fresh table maps nothing
TEST_F(BlockTypesTest, EmptyTableIsUnmapped) {
    BlockTypeTable table;
    EXPECT_EQ(table.mapped_count(), 0u);
    EXPECT_EQ(table.missing_roles().size(), BLOCK_ROLE_COUNT);
    EXPECT_FALSE(table.find(BlockRole::Stone).has_value());
    EXPECT_FALSE(table.is(BLOCK_INVALID, BlockRole::Stone));
}

// Test: Defaults map every role to a distinct ID
TEST_F(BlockTypesTest, DefaultsMapAllRoles) {
    BlockTypeTable table = BlockTypeTable::defaults();
    EXPECT_EQ(table.mapped_count(), BLOCK_ROLE_COUNT);
    EXPECT_TRUE(table.missing_roles().empty());
    EXPECT_EQ(table.find(BlockRole::Stone), BlockId{1});
    EXPECT_TRUE(table.is(1, BlockRole::Stone));
    EXPECT_FALSE(table.is(1, BlockRole::Dirt));
}

// Test: Loading a role object, ignoring unknown names
TEST_F(BlockTypesTest, LoadFromJsonObject) {
    BlockTypeTable table;
    ASSERT_TRUE(table.load_from_json(R"({"stone": 5, "water-still": 9, "poplar log": 30, "bedrock": 1})"));
    EXPECT_EQ(table.find(BlockRole::Stone), BlockId{5});
    EXPECT_EQ(table.find(BlockRole::WaterStill), BlockId{9});
    EXPECT_EQ(table.find(BlockRole::PoplarLog), BlockId{30});
    EXPECT_EQ(table.mapped_count(), 3u);
}

// Test: Malformed JSON is rejected
TEST_F(BlockTypesTest, LoadRejectsMalformedJson) {
    BlockTypeTable table = BlockTypeTable::defaults();
    EXPECT_FALSE(table.load_from_json("{ broken"));
    EXPECT_FALSE(table.load_from_json("42"));
    EXPECT_EQ(table.mapped_count(), BLOCK_ROLE_COUNT);
}

// Test: Registry lookup matches names case-insensitively with aliases
TEST_F(BlockTypesTest, FromRegistryUsesAliases) {
    std::vector<RegisteredBlock> registry = {
        {1, "Stone"}, {2, "water-flow"}, {3, "Coal-Ore"}, {4, "white-wool"}, {5, "oak-leaves"},
    };
    BlockTypeTable table = BlockTypeTable::from_registry(registry);
    EXPECT_EQ(table.find(BlockRole::Stone), BlockId{1});
    EXPECT_EQ(table.find(BlockRole::WaterStill), BlockId{2});
    EXPECT_EQ(table.find(BlockRole::Coal), BlockId{3});
    EXPECT_EQ(table.find(BlockRole::Snow), BlockId{4});
    EXPECT_EQ(table.find(BlockRole::OakLeaves), BlockId{5});
    EXPECT_FALSE(table.find(BlockRole::Diamond).has_value());
}

// Test: Registry arrays load through the same lookup
TEST_F(BlockTypesTest, LoadFromJsonRegistryArray) {
    BlockTypeTable table;
    ASSERT_TRUE(table.load_from_json(R"([{"id": 3, "name": "grass"}, {"id": 8, "name": "lava"}, {"bad": true}])"));
    EXPECT_EQ(table.find(BlockRole::Grass), BlockId{3});
    EXPECT_EQ(table.find(BlockRole::Lava), BlockId{8});
}

// Test: Registry ids outside the block ID range are skipped, not narrowed
TEST_F(BlockTypesTest, LoadFromJsonRegistryArrayRejectsOutOfRangeIds) {
    BlockTypeTable table;
    ASSERT_TRUE(table.load_from_json(
        R"([{"id": 65537, "name": "grass"}, {"id": -1, "name": "stone"}, {"id": 65535, "name": "sand"},
            {"id": 7, "name": "dirt"}])"));
    EXPECT_FALSE(table.find(BlockRole::Grass).has_value());
    EXPECT_FALSE(table.find(BlockRole::Stone).has_value());
    EXPECT_FALSE(table.find(BlockRole::Sand).has_value());
    EXPECT_EQ(table.find(BlockRole::Dirt), BlockId{7});
    EXPECT_EQ(table.mapped_count(), 1u);
}

}  // namespace
}  // namespace voxelforge::world
