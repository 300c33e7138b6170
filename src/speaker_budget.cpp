#include "guidiar/speaker_budget.hpp"
#include "guidiar/tensor_utils.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace guidiar {

std::vector<int> select_speakers(const FrameTarget &target, int max_speakers) {
    if (max_speakers < 1) {
        throw std::invalid_argument(
            "select_speakers: max_speakers must be at least 1");
    }

    std::vector<int> columns(target.labels.size());
    std::iota(columns.begin(), columns.end(), 0);
    if (target.num_labels() <= max_speakers)
        return columns;

    // Keep only the most talkative speakers
    auto counts = target.activity_counts();
    std::stable_sort(columns.begin(), columns.end(),
                     [&counts](int a, int b) { return counts[a] > counts[b]; });
    columns.resize(static_cast<size_t>(max_speakers));
    return columns;
}

std::vector<float> fit_speaker_budget(const FrameTarget &target,
                                      int max_speakers, Rng &rng) {
    // -1 marks an inactive phantom speaker
    auto slots = select_speakers(target, max_speakers);
    slots.resize(static_cast<size_t>(max_speakers), -1);

    // Speakers are sorted by talkativeness at this point, and that order is
    // partly computed from frames the model may not be guided on.
    rng.shuffle(slots);

    const int T = target.num_frames;
    const int S = max_speakers;
    std::vector<float> out(static_cast<size_t>(T) * S, 0.0f);
    for (int s = 0; s < S; ++s) {
        int column = slots[s];
        if (column < 0)
            continue;
        for (int t = 0; t < T; ++t) {
            out[static_cast<size_t>(t) * S + s] =
                static_cast<float>(target.at(t, column));
        }
    }
    return out;
}

Tensor collate_targets(const std::vector<FrameTarget> &targets,
                       int max_speakers, Rng &rng) {
    if (targets.empty()) {
        throw std::invalid_argument("collate_targets: empty batch");
    }

    const int num_frames = targets.front().num_frames;
    std::vector<float> data;
    data.reserve(targets.size() * static_cast<size_t>(num_frames) *
                 static_cast<size_t>(std::max(max_speakers, 0)));

    for (const auto &target : targets) {
        if (target.num_frames != num_frames) {
            throw std::invalid_argument(
                "collate_targets: chunks have " + std::to_string(num_frames) +
                " and " + std::to_string(target.num_frames) + " frames");
        }
        auto fitted = fit_speaker_budget(target, max_speakers, rng);
        data.insert(data.end(), fitted.begin(), fitted.end());
    }

    return detail::from_vector(std::move(data),
                               Shape{targets.size(),
                                     static_cast<size_t>(num_frames),
                                     static_cast<size_t>(max_speakers)});
}

// ─── Batch Narrowing ────────────────────────────────────────────────────────

std::vector<std::vector<int>> budget_columns(const Tensor &target,
                                             int max_speakers) {
    detail::require_rank(target, 3, "budget_columns target");
    auto shape = target.shape();
    const size_t B = shape[0], T = shape[1], S = shape[2];
    if (max_speakers < 1 || S < static_cast<size_t>(max_speakers)) {
        throw std::invalid_argument(
            "budget_columns: cannot keep " + std::to_string(max_speakers) +
            " of " + std::to_string(S) + " speakers");
    }

    auto y = detail::to_vector(target);
    std::vector<std::vector<int>> columns(B);
    for (size_t b = 0; b < B; ++b) {
        std::vector<int> active, inactive;
        for (size_t s = 0; s < S; ++s) {
            bool is_active = false;
            for (size_t t = 0; t < T && !is_active; ++t)
                is_active = y[(b * T + t) * S + s] != 0.0f;
            (is_active ? active : inactive).push_back(static_cast<int>(s));
        }
        if (active.size() > static_cast<size_t>(max_speakers)) {
            throw std::invalid_argument(
                "budget_columns: sample " + std::to_string(b) + " has " +
                std::to_string(active.size()) + " active speakers, budget is " +
                std::to_string(max_speakers));
        }
        // inactive columns fill the remaining slots
        active.insert(active.end(), inactive.begin(), inactive.end());
        active.resize(static_cast<size_t>(max_speakers));
        columns[b] = std::move(active);
    }
    return columns;
}

Tensor gather_columns(const Tensor &t,
                      const std::vector<std::vector<int>> &columns) {
    detail::require_rank(t, 3, "gather_columns input");
    auto shape = t.shape();
    const size_t B = shape[0], T = shape[1], S = shape[2];
    if (columns.size() != B || columns.empty()) {
        throw std::invalid_argument(
            "gather_columns: expected column lists for " + std::to_string(B) +
            " samples, got " + std::to_string(columns.size()));
    }

    const size_t W = columns.front().size();
    auto src = detail::to_vector(t);
    std::vector<float> out(B * T * W, 0.0f);
    for (size_t b = 0; b < B; ++b) {
        if (columns[b].size() != W) {
            throw std::invalid_argument(
                "gather_columns: samples keep different numbers of columns");
        }
        for (size_t w = 0; w < W; ++w) {
            int s = columns[b][w];
            if (s < 0 || static_cast<size_t>(s) >= S) {
                throw std::invalid_argument(
                    "gather_columns: column " + std::to_string(s) +
                    " out of range for " + detail::shape_str(t));
            }
            for (size_t f = 0; f < T; ++f)
                out[(b * T + f) * W + w] = src[(b * T + f) * S + s];
        }
    }
    return detail::from_vector(std::move(out), Shape{B, T, W});
}

} // namespace guidiar
