// VoxelForge Core
// progress.cpp - Progress reporting for long-running generation calls

#include <algorithm>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/core/progress.hpp>

namespace voxelforge::core {

ProgressReporter::ProgressReporter(ProgressCallback callback) : callback_(std::move(callback)) {}

void ProgressReporter::report(std::string_view message, int percent) {
    if (finished_) {
        return;
    }

    // 100 is reserved for finish()
    int clamped = std::clamp(percent, 0, 99);
    last_percent_ = std::max(last_percent_, clamped);
    ++update_count_;

    VOXELFORGE_LOG_DEBUG(log_category::WORLD, "[{:3}%] {}", last_percent_, message);
    if (callback_) {
        callback_(message, last_percent_);
    }
}

void ProgressReporter::finish(std::string_view message) {
    if (finished_) {
        return;
    }

    finished_ = true;
    last_percent_ = 100;
    ++update_count_;

    VOXELFORGE_LOG_INFO(log_category::WORLD, "{}", message);
    if (callback_) {
        callback_(message, 100);
    }
}

void ProgressReporter::reset() {
    last_percent_ = 0;
    update_count_ = 0;
    finished_ = false;
}

}  // namespace voxelforge::core
