#include "guidiar/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace guidiar {

static void require(bool condition, const std::string &message) {
    if (!condition) {
        throw std::invalid_argument("TaskConfig: " + message);
    }
}

void validate_config(const TaskConfig &config) {
    require(config.duration > 0.0, "duration must be positive");
    require(config.grid.step > 0.0, "frame step must be positive");
    require(config.grid.num_frames > 0, "num_frames must be positive");
    require(config.max_speakers_per_chunk >= 1,
            "max_speakers_per_chunk must be at least 1");
    require(config.max_speakers_per_frame >= 1 &&
                config.max_speakers_per_frame <= config.max_speakers_per_chunk,
            "max_speakers_per_frame must be in [1, max_speakers_per_chunk]");
    require(config.freedom >= 0.0f && config.freedom <= 1.0f,
            "freedom must be in [0, 1]");
    require(config.batch_size >= 1, "batch_size must be at least 1");

    const auto &guidance = config.guidance;
    require(!guidance.strategies.empty(),
            "at least one guide strategy is required");
    require(guidance.min_frames >= 0, "min_frames must be non-negative");
    require(guidance.min_frames <= guidance.max_frames,
            "min_frames must not exceed max_frames");

    bool uses_random_frames =
        std::find(guidance.strategies.begin(), guidance.strategies.end(),
                  GuideStrategy::RandomFrames) != guidance.strategies.end();
    if (uses_random_frames) {
        require(guidance.max_frames <= config.grid.num_frames,
                "max_frames (" + std::to_string(guidance.max_frames) +
                    ") exceeds num_frames (" +
                    std::to_string(config.grid.num_frames) + ")");
    }
}

} // namespace guidiar
