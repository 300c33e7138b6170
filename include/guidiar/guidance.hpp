#pragma once

#include <axiom/axiom.hpp>

#include "guidiar/config.hpp"
#include "guidiar/random.hpp"

namespace guidiar {

using namespace axiom;

// ─── Guided Frame Masks ─────────────────────────────────────────────────────

const char *strategy_name(GuideStrategy strategy);

// (batch_size, num_frames) mask, 1.0 on frames revealed to the model.
// RandomFrames draws its frame count and frames independently per sample and
// throws std::invalid_argument when max_frames exceeds num_frames.
Tensor sample_guided_mask(GuideStrategy strategy, int batch_size,
                          int num_frames, const GuidanceConfig &config,
                          Rng &rng);

// Turn a (batch, num_frames, num_speakers) {0, 1} target into a guide:
//   +1 speaker known active, -1 known inactive, 0 frame not guided.
// `guided_mask` is (batch, num_frames) and applies to every speaker slot.
Tensor apply_guide(const Tensor &target, const Tensor &guided_mask);

// ─── Guidance Sampler ───────────────────────────────────────────────────────

struct Guidance {
    GuideStrategy strategy = GuideStrategy::None;
    Tensor mask;  // (batch, num_frames)
    Tensor guide; // (batch, num_frames, num_speakers)
};

// Draws one strategy per batch, uniformly among `config.strategies`.
class GuidanceSampler {
  public:
    explicit GuidanceSampler(GuidanceConfig config = {});

    GuideStrategy draw(Rng &rng) const;

    // target: (batch, num_frames, num_speakers)
    Guidance sample(const Tensor &target, Rng &rng) const;

    const GuidanceConfig &config() const { return config_; }

  private:
    GuidanceConfig config_;
};

} // namespace guidiar
