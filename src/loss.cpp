#include "guidiar/loss.hpp"
#include "guidiar/tensor_utils.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace guidiar {

// ─── Loss Primitives ────────────────────────────────────────────────────────

float nll_loss(const Tensor &log_probs, const Tensor &target,
               const Tensor &weight) {
    detail::require_rank(log_probs, 3, "nll_loss log_probs");
    auto shape = log_probs.shape();
    const size_t B = shape[0], T = shape[1], C = shape[2];
    detail::require_shape(target, {B, T, C}, "nll_loss target");

    std::vector<float> w;
    if (weight.storage()) {
        detail::require_shape(weight, {B, T, 1}, "nll_loss weight");
        w = detail::to_vector(weight);
    }

    auto lp = detail::to_vector(log_probs);
    auto y = detail::to_vector(target);

    double sum = 0.0;
    double norm = 0.0;
    for (size_t i = 0; i < B * T; ++i) {
        // Manual argmax over the one-hot target
        const float *row = y.data() + i * C;
        size_t cls = 0;
        for (size_t c = 1; c < C; ++c) {
            if (row[c] > row[cls])
                cls = c;
        }

        double frame_weight = w.empty() ? 1.0 : static_cast<double>(w[i]);
        sum += frame_weight * -static_cast<double>(lp[i * C + cls]);
        norm += frame_weight;
    }

    if (norm == 0.0)
        return 0.0f;
    return static_cast<float>(sum / norm);
}

std::vector<int> keep_within_budget(const Tensor &target, int max_speakers) {
    detail::require_rank(target, 3, "keep_within_budget target");
    auto shape = target.shape();
    const size_t B = shape[0], T = shape[1], S = shape[2];
    auto y = detail::to_vector(target);

    std::vector<int> keep;
    for (size_t b = 0; b < B; ++b) {
        int num_speakers = 0;
        for (size_t s = 0; s < S; ++s) {
            for (size_t t = 0; t < T; ++t) {
                if (y[(b * T + t) * S + s] != 0.0f) {
                    ++num_speakers;
                    break;
                }
            }
        }
        if (num_speakers <= max_speakers)
            keep.push_back(static_cast<int>(b));
    }
    return keep;
}

bool has_guide(const Tensor &guide) {
    for (float g : detail::to_vector(guide)) {
        if (g != 0.0f)
            return true;
    }
    return false;
}

Tensor guide_to_multilabel(const Tensor &guide) {
    auto g = detail::to_vector(guide);
    for (auto &v : g)
        v = v > 0.0f ? 1.0f : 0.0f;
    return detail::from_vector(std::move(g), guide.shape());
}

Tensor guided_frame_weight(const Tensor &guide) {
    detail::require_rank(guide, 3, "guided_frame_weight guide");
    auto shape = guide.shape();
    const size_t B = shape[0], T = shape[1], S = shape[2];
    auto g = detail::to_vector(guide);

    std::vector<float> weight(B * T, 0.0f);
    for (size_t i = 0; i < B * T; ++i) {
        for (size_t s = 0; s < S; ++s) {
            if (g[i * S + s] != 0.0f) {
                weight[i] = 1.0f;
                break;
            }
        }
    }
    return detail::from_vector(std::move(weight), Shape{B, T, 1});
}

// ─── DualLoss ───────────────────────────────────────────────────────────────

DualLoss::DualLoss(int max_speakers, float freedom, const PowersetCodec &codec,
                   const PermutationSolver &solver)
    : max_speakers_(max_speakers), freedom_(freedom), codec_(codec),
      solver_(solver) {
    if (freedom < 0.0f || freedom > 1.0f) {
        throw std::invalid_argument("DualLoss: freedom must be in [0, 1]");
    }
    if (codec.num_classes() != max_speakers) {
        throw std::invalid_argument(
            "DualLoss: powerset codec covers " +
            std::to_string(codec.num_classes()) + " speakers, expected " +
            std::to_string(max_speakers));
    }
}

void DualLoss::check_shapes(const Tensor &prediction,
                            const Tensor &target) const {
    detail::require_rank(prediction, 3, "DualLoss prediction");
    auto shape = prediction.shape();
    detail::require_shape(
        prediction,
        {shape[0], shape[1],
         static_cast<size_t>(codec_.num_powerset_classes())},
        "DualLoss prediction");
    detail::require_shape(
        target, {shape[0], shape[1], static_cast<size_t>(max_speakers_)},
        "DualLoss target");
}

float DualLoss::segmentation_loss(const Tensor &prediction,
                                  const Tensor &decoded, const Tensor &target,
                                  const Tensor &weight) const {
    // permutate target in multilabel space, score it in powerset space
    auto permutation = solver_.permutate(decoded, target, weight);
    auto target_powerset = codec_.to_powerset(permutation.permuted);
    return nll_loss(prediction, target_powerset, weight);
}

LossBreakdown DualLoss::compute(const Tensor &prediction, const Tensor &target,
                                const Tensor &guide) const {
    check_shapes(prediction, target);
    auto shape = target.shape();
    detail::require_shape(guide, {shape[0], shape[1], shape[2]},
                          "DualLoss guide");

    auto decoded = codec_.to_multilabel(prediction);

    LossBreakdown losses;
    losses.segmentation = segmentation_loss(prediction, decoded, target);

    // guide loss only covers guided frames
    if (has_guide(guide)) {
        auto weight = guided_frame_weight(guide);
        losses.guide = segmentation_loss(prediction, decoded,
                                         guide_to_multilabel(guide), weight);
    }

    losses.total =
        freedom_ * losses.segmentation + (1.0f - freedom_) * losses.guide;
    return losses;
}

} // namespace guidiar
