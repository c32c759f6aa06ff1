// VoxelForge Core
// progress.hpp - Progress reporting for long-running generation calls

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace voxelforge::core {

// Receives (message, percent) updates synchronously on the generating thread
using ProgressCallback = std::function<void(std::string_view message, int percent)>;

// Forwards stage updates to an optional callback.
// Percent values are clamped to [0, 100] and never decrease within a run; 100 is
// only emitted once per run, by finish(). reset() starts the next run.
class ProgressReporter {
public:
    ProgressReporter() = default;
    explicit ProgressReporter(ProgressCallback callback);

    void report(std::string_view message, int percent);

    // Emit the single 100% update. Later calls are ignored until reset().
    void finish(std::string_view message);

    // Clear the percent, update count and finished state for another run
    void reset();

    [[nodiscard]] int last_percent() const { return last_percent_; }
    [[nodiscard]] bool is_finished() const { return finished_; }
    [[nodiscard]] size_t update_count() const { return update_count_; }

private:
    ProgressCallback callback_;
    int last_percent_ = 0;
    size_t update_count_ = 0;
    bool finished_ = false;
};

}  // namespace voxelforge::core
