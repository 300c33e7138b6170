#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "guidiar/annotation.hpp"
#include "guidiar/config.hpp"

namespace guidiar {

// ─── Per-Chunk Multilabel Target ────────────────────────────────────────────

// (num_frames, num_labels) binary activity for one chunk. Width is the number
// of distinct labels in the chunk and is not bounded by the speaker budget.
struct FrameTarget {
    int num_frames = 0;
    std::vector<int> labels;       // column -> label identity, ascending
    std::vector<uint8_t> activity; // row-major (num_frames, num_labels)

    int num_labels() const { return static_cast<int>(labels.size()); }

    uint8_t at(int frame, int column) const {
        return activity[static_cast<size_t>(frame) * labels.size() + column];
    }

    // Active frames per column.
    std::vector<int> activity_counts() const;
};

// ─── Discretization ─────────────────────────────────────────────────────────

// Snap the turns overlapping `chunk` onto the frame grid.
//   start frame = floor((max(turn.start, chunk.start) - chunk.start) / step)
//   end frame   = ceil((min(turn.end, chunk.end) - chunk.start) / step)
// Frames [start, end) are marked active, clipped to [0, num_frames).
// Labels are read in `scope` and deduplicated.
//
// Throws std::invalid_argument on a non-positive duration, step or frame
// count.
FrameTarget discretize_chunk(const std::vector<Annotation> &annotations,
                             const Chunk &chunk, const FrameGrid &grid,
                             Scope scope);

} // namespace guidiar
