#include "guidiar/discretize.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace guidiar {

std::vector<int> FrameTarget::activity_counts() const {
    std::vector<int> counts(labels.size(), 0);
    for (int f = 0; f < num_frames; ++f) {
        for (int c = 0; c < num_labels(); ++c) {
            counts[c] += at(f, c);
        }
    }
    return counts;
}

static int clip_frame(double index, int num_frames) {
    if (index < 0.0)
        return 0;
    if (index > static_cast<double>(num_frames))
        return num_frames;
    return static_cast<int>(index);
}

FrameTarget discretize_chunk(const std::vector<Annotation> &annotations,
                             const Chunk &chunk, const FrameGrid &grid,
                             Scope scope) {
    if (chunk.duration <= 0.0) {
        throw std::invalid_argument(
            "discretize_chunk: chunk duration must be positive");
    }
    if (grid.step <= 0.0 || grid.num_frames <= 0) {
        throw std::invalid_argument(
            "discretize_chunk: frame grid must have positive step and size");
    }

    std::vector<const Annotation *> turns;
    for (const auto &a : annotations) {
        if (intersects(a, chunk))
            turns.push_back(&a);
    }

    FrameTarget target;
    target.num_frames = grid.num_frames;
    for (const auto *a : turns)
        target.labels.push_back(a->label(scope));
    std::sort(target.labels.begin(), target.labels.end());
    target.labels.erase(
        std::unique(target.labels.begin(), target.labels.end()),
        target.labels.end());

    std::unordered_map<int, int> column_of;
    for (int c = 0; c < target.num_labels(); ++c)
        column_of[target.labels[c]] = c;

    const size_t width = target.labels.size();
    target.activity.assign(static_cast<size_t>(grid.num_frames) * width, 0);

    for (const auto *a : turns) {
        double start = std::max(a->start, chunk.start) - chunk.start;
        double end = std::min(a->end, chunk.end()) - chunk.start;
        int start_idx = clip_frame(std::floor(start / grid.step),
                                   grid.num_frames);
        int end_idx = clip_frame(std::ceil(end / grid.step), grid.num_frames);

        int column = column_of[a->label(scope)];
        for (int f = start_idx; f < end_idx; ++f) {
            target.activity[static_cast<size_t>(f) * width + column] = 1;
        }
    }

    return target;
}

} // namespace guidiar
