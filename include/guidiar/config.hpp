#pragma once

#include <vector>

namespace guidiar {

// ─── Frame Grid ─────────────────────────────────────────────────────────────

// Model output resolution. Targets and guides are defined on this grid.
struct FrameGrid {
    double step = 0.016875; // seconds per output frame (270 samples @ 16kHz)
    int num_frames = 589;   // output frames per chunk
};

// ─── Guidance Config ────────────────────────────────────────────────────────

enum class GuideStrategy {
    None,         // nothing is revealed
    Full,         // every frame is revealed
    FirstHalf,    // frames [0, num_frames / 2) are revealed
    RandomFrames, // k random frames are revealed, k in [min, max]
};

struct GuidanceConfig {
    int min_frames = 1;
    int max_frames = 10;

    // One entry is drawn uniformly per batch. Repeat an entry to weight it.
    // Default: 50% autonomous, 25% streaming, 25% interactive.
    std::vector<GuideStrategy> strategies = {
        GuideStrategy::None, GuideStrategy::None, GuideStrategy::FirstHalf,
        GuideStrategy::RandomFrames};
};

// ─── Task Config ────────────────────────────────────────────────────────────

struct TaskConfig {
    double duration = 10.0;         // chunk duration in seconds
    int max_speakers_per_chunk = 3; // speaker slots in the batch target
    int max_speakers_per_frame = 2; // powerset set size
    float freedom = 0.5f;           // 0 = follow guide, 1 = ignore guide
    int batch_size = 32;            // chunks per batch, read by the data loader
    FrameGrid grid;
    GuidanceConfig guidance;
};

// ─── Presets ────────────────────────────────────────────────────────────────

// pyannote/segmentation-3.0 resolution on 10s chunks, 3 speakers, 2 overlap.
inline TaskConfig make_default_task_config() {
    TaskConfig cfg;
    cfg.duration = 10.0;
    cfg.max_speakers_per_chunk = 3;
    cfg.max_speakers_per_frame = 2;
    cfg.freedom = 0.5f;
    cfg.batch_size = 32;
    cfg.grid.step = 0.016875;
    cfg.grid.num_frames = 589;
    cfg.guidance.min_frames = 1;
    cfg.guidance.max_frames = 10;
    return cfg;
}

// Throws std::invalid_argument describing the first inconsistent field.
void validate_config(const TaskConfig &config);

} // namespace guidiar
