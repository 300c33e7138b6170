#include "guidiar/guidance.hpp"
#include "guidiar/tensor_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace guidiar {

const char *strategy_name(GuideStrategy strategy) {
    switch (strategy) {
    case GuideStrategy::None:
        return "none";
    case GuideStrategy::Full:
        return "full";
    case GuideStrategy::FirstHalf:
        return "first-half";
    case GuideStrategy::RandomFrames:
        return "random-frames";
    }
    return "unknown";
}

// ─── Masks ──────────────────────────────────────────────────────────────────

Tensor sample_guided_mask(GuideStrategy strategy, int batch_size,
                          int num_frames, const GuidanceConfig &config,
                          Rng &rng) {
    if (batch_size < 1 || num_frames < 1) {
        throw std::invalid_argument(
            "sample_guided_mask: batch_size and num_frames must be positive");
    }

    const size_t B = static_cast<size_t>(batch_size);
    const size_t T = static_cast<size_t>(num_frames);
    std::vector<float> mask(B * T, 0.0f);

    switch (strategy) {
    case GuideStrategy::None:
        break;

    case GuideStrategy::Full:
        std::fill(mask.begin(), mask.end(), 1.0f);
        break;

    case GuideStrategy::FirstHalf:
        for (size_t b = 0; b < B; ++b) {
            for (size_t t = 0; t < T / 2; ++t)
                mask[b * T + t] = 1.0f;
        }
        break;

    case GuideStrategy::RandomFrames:
        if (config.min_frames < 0 || config.min_frames > config.max_frames) {
            throw std::invalid_argument(
                "sample_guided_mask: invalid [min_frames, max_frames] range");
        }
        // rejected on the configured bound, before any draw
        if (config.max_frames > num_frames) {
            throw std::invalid_argument(
                "sample_guided_mask: cannot guide up to " +
                std::to_string(config.max_frames) + " frames out of " +
                std::to_string(num_frames));
        }
        for (size_t b = 0; b < B; ++b) {
            int k = rng.uniform_int(config.min_frames, config.max_frames);
            for (int t : rng.sample(num_frames, k))
                mask[b * T + static_cast<size_t>(t)] = 1.0f;
        }
        break;
    }

    return detail::from_vector(std::move(mask), Shape{B, T});
}

Tensor apply_guide(const Tensor &target, const Tensor &guided_mask) {
    detail::require_rank(target, 3, "apply_guide target");
    auto shape = target.shape();
    const size_t B = shape[0], T = shape[1], S = shape[2];
    detail::require_shape(guided_mask, {B, T}, "apply_guide mask");

    auto y = detail::to_vector(target);
    auto mask = detail::to_vector(guided_mask);

    std::vector<float> guide(y.size(), 0.0f);
    for (size_t b = 0; b < B; ++b) {
        for (size_t t = 0; t < T; ++t) {
            if (mask[b * T + t] == 0.0f)
                continue;
            for (size_t s = 0; s < S; ++s) {
                size_t i = (b * T + t) * S + s;
                // {0, 1} target space -> {-1, +1} guide space
                guide[i] = 2.0f * (y[i] - 0.5f);
            }
        }
    }

    return detail::from_vector(std::move(guide), Shape{B, T, S});
}

// ─── GuidanceSampler ────────────────────────────────────────────────────────

GuidanceSampler::GuidanceSampler(GuidanceConfig config)
    : config_(std::move(config)) {
    if (config_.strategies.empty()) {
        throw std::invalid_argument(
            "GuidanceSampler: at least one strategy is required");
    }
}

GuideStrategy GuidanceSampler::draw(Rng &rng) const {
    int n = static_cast<int>(config_.strategies.size());
    return config_.strategies[rng.uniform_int(0, n - 1)];
}

Guidance GuidanceSampler::sample(const Tensor &target, Rng &rng) const {
    detail::require_rank(target, 3, "GuidanceSampler target");
    auto shape = target.shape();

    Guidance g;
    g.strategy = draw(rng);
    g.mask = sample_guided_mask(g.strategy, static_cast<int>(shape[0]),
                                static_cast<int>(shape[1]), config_, rng);
    g.guide = apply_guide(target, g.mask);
    return g;
}

} // namespace guidiar
