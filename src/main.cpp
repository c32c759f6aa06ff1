// VoxelForge - Procedural Voxel Terrain Generator
// main.cpp - voxelforge-gen command line entry point

#include <voxelforge/core/config.hpp>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/core/progress.hpp>
#include <voxelforge/world/block_types.hpp>
#include <voxelforge/world/generation_settings.hpp>
#include <voxelforge/world/world_generator.hpp>

#include <charconv>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr const char* VERSION = "0.1.0";

struct CommandLine {
    std::string config_path;
    std::string blocks_path;
    std::string output_path = "world.json";
    std::string write_config_path;
    std::optional<int32_t> seed;
    std::optional<std::string> seed_text;
    std::optional<std::string> log_level;
    bool show_help = false;
};

void print_usage() {
    std::printf(
        "voxelforge-gen %s\n"
        "Usage: voxelforge-gen [options]\n"
        "  --config <file>        Generation settings (JSON)\n"
        "  --blocks <file>        Block type table (JSON role -> id object)\n"
        "  --seed <int>           World seed\n"
        "  --seed-text <text>     World seed derived from a phrase\n"
        "  --output <file>        Voxel map output (default world.json)\n"
        "  --write-config <file>  Save the resolved settings and seed (JSON)\n"
        "  --log-level <level>    trace, debug, info, warn or error\n"
        "  --help                 Show this message\n",
        VERSION);
}

std::optional<int32_t> parse_seed(std::string_view text) {
    int32_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::fprintf(stderr, "Missing value for %s\n", argv[i]);
            return std::nullopt;
        }
        const std::string_view value = argv[++i];

        if (arg == "--config") {
            cmd.config_path = value;
        } else if (arg == "--blocks") {
            cmd.blocks_path = value;
        } else if (arg == "--output") {
            cmd.output_path = value;
        } else if (arg == "--write-config") {
            cmd.write_config_path = value;
        } else if (arg == "--seed") {
            cmd.seed = parse_seed(value);
            if (!cmd.seed) {
                std::fprintf(stderr, "Invalid seed: %s\n", argv[i]);
                return std::nullopt;
            }
        } else if (arg == "--seed-text") {
            cmd.seed_text = std::string(value);
        } else if (arg == "--log-level") {
            cmd.log_level = std::string(value);
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i - 1]);
            return std::nullopt;
        }
    }
    return cmd;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace voxelforge;

    const auto cmd = parse_command_line(argc, argv);
    if (!cmd) {
        print_usage();
        return 2;
    }
    if (cmd->show_help) {
        print_usage();
        return 0;
    }

    core::Config config;
    if (!cmd->config_path.empty() && !config.load(cmd->config_path)) {
        std::fprintf(stderr, "Failed to load config: %s\n", cmd->config_path.c_str());
        return 1;
    }

    core::LoggerConfig log_config = core::logger_config_from(config);
    if (cmd->log_level) {
        const auto level = core::log_level_from_string(*cmd->log_level);
        if (!level) {
            std::fprintf(stderr, "Unknown log level: %s\n", cmd->log_level->c_str());
            return 2;
        }
        log_config.level = *level;
    }
    core::Logger::initialize(log_config);
    VOXELFORGE_LOG_INFO(core::log_category::ENGINE, "voxelforge-gen {}", VERSION);

    world::BlockTypeTable block_types = world::BlockTypeTable::defaults();
    if (!cmd->blocks_path.empty()) {
        block_types = world::BlockTypeTable();
        if (!block_types.load(cmd->blocks_path)) {
            VOXELFORGE_LOG_ERROR(core::log_category::ENGINE, "Failed to load block types from {}", cmd->blocks_path);
            core::Logger::shutdown();
            return 1;
        }
    }

    const world::GenerationSettings settings = world::settings_from_config(config);
    int32_t seed = world::seed_from_config(config);
    if (cmd->seed_text) {
        seed = world::seed_from_text(*cmd->seed_text);
    } else if (cmd->seed) {
        seed = *cmd->seed;
    }

    if (!cmd->write_config_path.empty()) {
        world::store_settings(settings, config);
        config.set_int(core::config_section::WORLD, core::config_key::SEED, seed);
        if (!config.save(cmd->write_config_path)) {
            core::Logger::shutdown();
            return 1;
        }
    }

    core::ProgressReporter progress([](std::string_view message, int percent) {
        VOXELFORGE_LOG_INFO(core::log_category::ENGINE, "[{:3}%] {}", percent, message);
    });

    world::WorldGenerator generator;
    const auto result = generator.generate(settings, seed, block_types, progress);
    if (!result) {
        VOXELFORGE_LOG_ERROR(core::log_category::ENGINE, "World generation failed");
        core::Logger::shutdown();
        return 1;
    }

    for (const auto& warning : result->warnings) {
        VOXELFORGE_LOG_WARN(core::log_category::ENGINE, "{}", warning);
    }

    if (!result->voxels.save_json(cmd->output_path)) {
        VOXELFORGE_LOG_ERROR(core::log_category::ENGINE, "Failed to write {}", cmd->output_path);
        core::Logger::shutdown();
        return 1;
    }
    VOXELFORGE_LOG_INFO(core::log_category::ENGINE, "Wrote {} voxels to {} ({:.0f} ms, {} warnings)",
                        result->voxels.size(), cmd->output_path, result->stats.elapsed_ms,
                        core::Logger::warning_count());

    core::Logger::shutdown();
    return 0;
}
