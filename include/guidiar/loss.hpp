#pragma once

#include <vector>

#include <axiom/axiom.hpp>

#include "guidiar/interfaces.hpp"

namespace guidiar {

using namespace axiom;

// ─── Loss Primitives ────────────────────────────────────────────────────────

// Negative log-likelihood of one-hot powerset targets.
//   log_probs: (batch, frames, classes) log-probabilities
//   target:    (batch, frames, classes) one-hot, class = argmax
//   weight:    (batch, frames, 1) or empty
// Unweighted: mean over frames. Weighted: sum(w * l) / sum(w), 0 when every
// weight is 0.
float nll_loss(const Tensor &log_probs, const Tensor &target,
               const Tensor &weight = Tensor());

// Indices of samples with at most `max_speakers` speakers active anywhere in
// the chunk. target: (batch, frames, speakers).
std::vector<int> keep_within_budget(const Tensor &target, int max_speakers);

bool has_guide(const Tensor &guide);

// {-1, 0, +1} guide -> {0, 1} multilabel (+1 -> 1, otherwise 0).
Tensor guide_to_multilabel(const Tensor &guide);

// (batch, frames, 1): 1 on frames with any non-zero guide entry.
Tensor guided_frame_weight(const Tensor &guide);

// ─── Dual Loss ──────────────────────────────────────────────────────────────

struct LossBreakdown {
    float segmentation = 0.0f;
    float guide = 0.0f;
    float total = 0.0f;
};

// Permutation-invariant segmentation loss blended with a loss on the guided
// frames:
//   total = freedom * segmentation + (1 - freedom) * guide
class DualLoss {
  public:
    // Throws std::invalid_argument when freedom is outside [0, 1] or the
    // codec does not cover `max_speakers` classes.
    DualLoss(int max_speakers, float freedom, const PowersetCodec &codec,
             const PermutationSolver &solver);

    // prediction: (batch, frames, num_powerset_classes) log-probabilities
    // target, guide: (batch, frames, max_speakers)
    LossBreakdown compute(const Tensor &prediction, const Tensor &target,
                          const Tensor &guide) const;

    // Loss against `target` permuted to best match `decoded`, the hard
    // multilabel decoding of `prediction`.
    float segmentation_loss(const Tensor &prediction, const Tensor &decoded,
                            const Tensor &target,
                            const Tensor &weight = Tensor()) const;

    // Throws std::invalid_argument unless prediction and target agree with
    // each other and with the codec.
    void check_shapes(const Tensor &prediction, const Tensor &target) const;

    float freedom() const { return freedom_; }
    int max_speakers() const { return max_speakers_; }

  private:
    int max_speakers_;
    float freedom_;
    const PowersetCodec &codec_;
    const PermutationSolver &solver_;
};

} // namespace guidiar
