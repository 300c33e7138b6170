#pragma once

#include <vector>

#include <axiom/axiom.hpp>

#include "guidiar/discretize.hpp"
#include "guidiar/random.hpp"

namespace guidiar {

using namespace axiom;

// ─── Speaker Budget ─────────────────────────────────────────────────────────

// Columns of `target` that survive a budget of `max_speakers` slots.
// With more labels than slots, the most talkative columns are kept, in
// decreasing order of active frames. Otherwise every column is kept, in
// column order.
//
// Tie order among equally talkative labels is not part of the contract. The
// current implementation keeps the lower column first, which is reproducible
// but should not be relied on.
std::vector<int> select_speakers(const FrameTarget &target, int max_speakers);

// Fixed-width (num_frames, max_speakers) row-major activity for one chunk:
// truncated to the most talkative labels or padded with inactive phantom
// speakers, then slot order shuffled with `rng` so that the model cannot
// learn a prior from speaker position.
std::vector<float> fit_speaker_budget(const FrameTarget &target,
                                      int max_speakers, Rng &rng);

// Stack fitted chunks into a (batch, num_frames, max_speakers) tensor.
// Throws std::invalid_argument on an empty list, a non-positive budget or
// chunks with different frame counts.
Tensor collate_targets(const std::vector<FrameTarget> &targets,
                       int max_speakers, Rng &rng);

// ─── Batch Narrowing ────────────────────────────────────────────────────────

// Per sample of a (batch, frames, speakers) target, the `max_speakers` columns
// to keep: active columns first, then inactive ones, each ascending.
// Throws std::invalid_argument when a sample has more than `max_speakers`
// active columns or the target is narrower than `max_speakers`.
std::vector<std::vector<int>> budget_columns(const Tensor &target,
                                             int max_speakers);

// (batch, frames, columns[b].size()) made of columns[b] of each sample.
// Every sample must list the same number of columns.
Tensor gather_columns(const Tensor &t,
                      const std::vector<std::vector<int>> &columns);

} // namespace guidiar
