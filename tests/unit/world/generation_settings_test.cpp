// VoxelForge World Generation Tests
// generation_settings_test.cpp - Tests for settings validation, config binding and presets

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <voxelforge/core/config.hpp>
#include <voxelforge/world/generation_settings.hpp>
#include <voxelforge/world/types.hpp>

namespace voxelforge::world {
namespace {

class GenerationSettingsTest : public ::testing::Test {};

// Test: Default settings are valid
TEST_F(GenerationSettingsTest, DefaultsAreValid) {
    GenerationSettings settings;
    EXPECT_TRUE(validate_settings(settings).empty());
}

// Test: Each degenerate value is reported
TEST_F(GenerationSettingsTest, DegenerateValuesReported) {
    GenerationSettings settings;
    settings.width = 0;
    settings.max_height = 4;
    settings.scale = 0.0;
    settings.smoothing = 1.5;
    settings.temperature = -0.1;
    settings.terrain_blend = -1.0;
    EXPECT_EQ(validate_settings(settings).size(), 7u);  // max_height 4 also puts sea_level 35 out of range
}

// Test: Sea level must lie below max_height
TEST_F(GenerationSettingsTest, SeaLevelRange) {
    GenerationSettings settings;
    settings.sea_level = settings.max_height;
    EXPECT_EQ(validate_settings(settings).size(), 1u);
    settings.sea_level = 0;
    EXPECT_EQ(validate_settings(settings).size(), 1u);
}

// Test: Dimensions beyond the packed key range are rejected
TEST_F(GenerationSettingsTest, KeyRangeLimit) {
    GenerationSettings settings;
    settings.width = KEY_AXIS_MAX + 1;
    EXPECT_FALSE(validate_settings(settings).empty());
}

// Test: Noise scales are bounded so lattice coordinates stay representable
TEST_F(GenerationSettingsTest, NoiseScaleUpperBound) {
    GenerationSettings settings;
    settings.scale = MAX_NOISE_SCALE;
    EXPECT_TRUE(validate_settings(settings).empty());
    settings.scale = 1e12;
    EXPECT_EQ(validate_settings(settings).size(), 1u);
    settings.scale = std::numeric_limits<double>::infinity();
    EXPECT_EQ(validate_settings(settings).size(), 1u);

    settings = GenerationSettings{};
    settings.roughness = std::numeric_limits<double>::infinity();
    EXPECT_EQ(validate_settings(settings).size(), 1u);
}

// Test: River frequency must be a finite non-negative noise scale
TEST_F(GenerationSettingsTest, RiverFrequencyRange) {
    GenerationSettings settings;
    settings.river_frequency = 0.0;
    EXPECT_TRUE(validate_settings(settings).empty());
    settings.river_frequency = -0.05;
    EXPECT_EQ(validate_settings(settings).size(), 1u);
    settings.river_frequency = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(validate_settings(settings).size(), 1u);
    settings.river_frequency = 1e15;
    EXPECT_EQ(validate_settings(settings).size(), 1u);
}

// Test: An enabled mountain range must fit inside the world height
TEST_F(GenerationSettingsTest, MountainRangeBounds) {
    GenerationSettings settings;
    settings.mountain_range.enabled = true;
    settings.mountain_range.height = settings.max_height;
    settings.mountain_range.snow_height = 0;
    EXPECT_TRUE(validate_settings(settings).empty());

    settings.mountain_range.height = 2000000000;
    EXPECT_EQ(validate_settings(settings).size(), 1u);
    settings.mountain_range.height = -1;
    EXPECT_EQ(validate_settings(settings).size(), 1u);

    settings.mountain_range.height = 20;
    settings.mountain_range.snow_height = settings.max_height + 1;
    EXPECT_EQ(validate_settings(settings).size(), 1u);

    settings.mountain_range.snow_height = 40;
    settings.mountain_range.size = -0.5;
    EXPECT_EQ(validate_settings(settings).size(), 1u);
    settings.mountain_range.size = std::numeric_limits<double>::infinity();
    EXPECT_EQ(validate_settings(settings).size(), 1u);
    settings.mountain_range.size = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(validate_settings(settings).size(), 1u);
}

// Test: Mountain fields are not checked while the range is disabled
TEST_F(GenerationSettingsTest, DisabledMountainRangeIsNotChecked) {
    GenerationSettings settings;
    settings.max_height = 32;
    settings.sea_level = 20;
    settings.mountain_range.enabled = false;
    settings.mountain_range.snow_height = 40;
    EXPECT_TRUE(validate_settings(settings).empty());

    settings.mountain_range.enabled = true;
    EXPECT_EQ(validate_settings(settings).size(), 1u);
}

// Test: Preset mountain ranges validate at the slider extreme
TEST_F(GenerationSettingsTest, OptionsMountainRangeValidates) {
    WorldOptions options;
    options.mountain_range = 100;
    options.width = 10;
    EXPECT_TRUE(validate_settings(settings_from_options(options)).empty());
}

// Test: World origin centers the grid on zero
TEST_F(GenerationSettingsTest, WorldStartIsCentered) {
    GenerationSettings settings;
    settings.width = 10;
    settings.length = 7;
    EXPECT_EQ(world_start_x(settings), -5);
    EXPECT_EQ(world_start_z(settings), -3);
}

// Test: Text seeds follow the 31-multiplier string hash
TEST_F(GenerationSettingsTest, SeedFromText) {
    EXPECT_EQ(seed_from_text(""), 0);
    EXPECT_EQ(seed_from_text("a"), 97);
    EXPECT_EQ(seed_from_text("hello"), 99162322);
    EXPECT_EQ(seed_from_text("polygenelubricants"), INT32_MIN);
}

// Test: Non-ASCII seeds hash UTF-16 code units, not UTF-8 bytes
TEST_F(GenerationSettingsTest, SeedFromTextUsesUtf16Units) {
    EXPECT_EQ(seed_from_text("\xC3\xA9"), 233);                // U+00E9
    EXPECT_EQ(seed_from_text("\xE2\x82\xAC"), 8364);           // U+20AC
    EXPECT_EQ(seed_from_text("\xF0\x9F\x98\x80"), 1772899);   // U+1F600 as D83D DE00
    EXPECT_EQ(seed_from_text("na\xC3\xAFve seed"), 824644646);
    EXPECT_EQ(seed_from_text("\xFF"), 65533);
    EXPECT_EQ(seed_from_text("\xC3"), 65533);
}

// Test: Settings survive a trip through the config store
TEST_F(GenerationSettingsTest, ConfigBinding) {
    GenerationSettings settings;
    settings.width = 48;
    settings.roughness = 1.7;
    settings.completely_flat = true;
    settings.mountain_range.enabled = true;
    settings.mountain_range.snow_height = 44;
    settings.desert_dunes = true;

    core::Config config;
    store_settings(settings, config);
    GenerationSettings loaded = settings_from_config(config);

    EXPECT_EQ(loaded.width, 48);
    EXPECT_DOUBLE_EQ(loaded.roughness, 1.7);
    EXPECT_TRUE(loaded.completely_flat);
    EXPECT_TRUE(loaded.mountain_range.enabled);
    EXPECT_EQ(loaded.mountain_range.snow_height, 44);
    EXPECT_TRUE(loaded.desert_dunes);
}

// Test: Integer and text seeds in the config
TEST_F(GenerationSettingsTest, SeedFromConfig) {
    core::Config config;
    config.set_int(core::config_section::WORLD, core::config_key::SEED, 1234);
    EXPECT_EQ(seed_from_config(config), 1234);

    config.set_string(core::config_section::WORLD, core::config_key::SEED, "hello");
    EXPECT_EQ(seed_from_config(config), 99162322);
}

// Test: Default slider values reproduce the default settings
TEST_F(GenerationSettingsTest, DefaultOptionsMatchDefaults) {
    GenerationSettings settings = settings_from_options(WorldOptions{});
    GenerationSettings defaults;
    EXPECT_EQ(settings.width, defaults.width);
    EXPECT_EQ(settings.sea_level, 35);
    EXPECT_NEAR(settings.scale, 0.15, 1e-12);
    EXPECT_NEAR(settings.roughness, 1.0, 1e-12);
    EXPECT_NEAR(settings.ore_rarity, 0.74, 1e-12);
    EXPECT_NEAR(settings.flatness_factor, 0.15, 1e-12);
    EXPECT_FALSE(settings.completely_flat);
    EXPECT_FALSE(settings.mountain_range.enabled);
}

// Test: World sizes are clamped and scale adjusts for small and large worlds
TEST_F(GenerationSettingsTest, OptionsWorldSizeAdjustments) {
    WorldOptions small;
    small.width = 5;
    small.length = 50;
    GenerationSettings small_settings = settings_from_options(small);
    EXPECT_EQ(small_settings.width, 10);
    EXPECT_NEAR(small_settings.scale, 0.03 * (1000.0 / 50.0) * 3.0, 1e-12);

    WorldOptions large;
    large.width = 5000;
    large.length = 600;
    GenerationSettings large_settings = settings_from_options(large);
    EXPECT_EQ(large_settings.width, 1000);
    EXPECT_NEAR(large_settings.scale, 0.03 * (1000.0 / 1000.0) * 1.2, 1e-12);
}

// Test: Slider extremes for flatness, roughness and mountains
TEST_F(GenerationSettingsTest, OptionsSliderMapping) {
    WorldOptions options;
    options.terrain_flatness = 98;
    options.mountain_height = 10;
    options.mountain_range = 50;
    GenerationSettings settings = settings_from_options(options);

    EXPECT_TRUE(settings.completely_flat);
    EXPECT_NEAR(settings.roughness, 0.3 + (10.0 / 30.0) * 0.2, 1e-12);
    EXPECT_TRUE(settings.mountain_range.enabled);
    EXPECT_DOUBLE_EQ(settings.mountain_range.size, 0.5);
    EXPECT_EQ(settings.mountain_range.height, 35);
    EXPECT_EQ(settings.mountain_range.snow_height, 48);

    options.mountain_height = 100;
    EXPECT_NEAR(settings_from_options(options).roughness, 4.0, 1e-12);
}

}  // namespace
}  // namespace voxelforge::world
