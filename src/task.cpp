#include "guidiar/task.hpp"
#include "guidiar/speaker_budget.hpp"
#include "guidiar/tensor_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace guidiar {

static const TaskConfig &validated(const TaskConfig &config) {
    validate_config(config);
    return config;
}

GuidedDiarizationTask::GuidedDiarizationTask(const TaskConfig &config,
                                             AnnotationIndex annotations,
                                             const PowersetCodec &codec,
                                             const PermutationSolver &solver,
                                             uint64_t seed)
    : config_(validated(config)), annotations_(std::move(annotations)),
      codec_(codec), guidance_(config.guidance),
      loss_(config.max_speakers_per_chunk, config.freedom, codec, solver),
      rng_(seed) {
    if (codec.max_set_size() != config.max_speakers_per_frame) {
        throw std::invalid_argument(
            "GuidedDiarizationTask: powerset codec allows " +
            std::to_string(codec.max_set_size()) +
            " simultaneous speakers, expected " +
            std::to_string(config.max_speakers_per_frame));
    }
}

Specifications GuidedDiarizationTask::specifications() const {
    Specifications spec;
    spec.problem = Problem::MonoLabelClassification;
    spec.resolution = Resolution::Frame;
    spec.duration = config_.duration;
    spec.num_frames = config_.grid.num_frames;
    spec.frame_step = config_.grid.step;
    for (int i = 0; i < config_.max_speakers_per_chunk; ++i)
        spec.classes.push_back("speaker#" + std::to_string(i + 1));
    spec.powerset_max_classes = config_.max_speakers_per_frame;
    spec.permutation_invariant = true;
    return spec;
}

// ─── Samples & Batches ──────────────────────────────────────────────────────

Sample GuidedDiarizationTask::prepare_chunk(int file_id,
                                            double start_time) const {
    return prepare_chunk(file_id, start_time, config_.duration);
}

Sample GuidedDiarizationTask::prepare_chunk(int file_id, double start_time,
                                            double duration) const {
    const auto &metadata = annotations_.metadata(file_id);
    Chunk chunk{start_time, duration};

    Sample sample;
    if (audio_)
        sample.waveform = audio_->crop(file_id, chunk);

    // Width is not bounded here. Truncation to the speaker budget happens at
    // collation, where the full label set is needed for ranking.
    sample.target =
        discretize_chunk(annotations_.overlapping(file_id, chunk), chunk,
                         config_.grid, metadata.scope);

    sample.meta.scope = metadata.scope;
    sample.meta.database = metadata.database;
    sample.meta.file = file_id;
    return sample;
}

Batch GuidedDiarizationTask::collate(const std::vector<Sample> &samples,
                                     Stage stage) {
    if (samples.empty()) {
        throw std::invalid_argument("GuidedDiarizationTask: empty batch");
    }

    Batch batch;

    std::vector<Tensor> waveforms;
    for (const auto &s : samples) {
        if (s.waveform.storage())
            waveforms.push_back(s.waveform);
    }
    if (!waveforms.empty()) {
        if (waveforms.size() != samples.size()) {
            throw std::invalid_argument(
                "GuidedDiarizationTask: some samples have no waveform");
        }
        batch.waveforms = Tensor::stack(waveforms, /*axis=*/0);

        if (stage == Stage::Train && augmentation_) {
            auto shape = batch.waveforms.shape();
            auto augmented = augmentation_->augment(batch.waveforms);
            detail::require_shape(augmented, {shape[0], shape[1], shape[2]},
                                  "Augmented waveforms");
            batch.waveforms = std::move(augmented);
        }
    }

    std::vector<FrameTarget> targets;
    targets.reserve(samples.size());
    for (const auto &s : samples)
        targets.push_back(s.target);
    batch.target =
        collate_targets(targets, config_.max_speakers_per_chunk, rng_);

    auto guidance = guidance_.sample(batch.target, rng_);
    batch.guide = std::move(guidance.guide);
    batch.strategy = guidance.strategy;

    for (const auto &s : samples)
        batch.meta.push_back(s.meta);

    return batch;
}

void GuidedDiarizationTask::check_batch_(const Batch &batch,
                                         bool exact_width) const {
    detail::require_rank(batch.target, 3, "Batch target");
    auto shape = batch.target.shape();
    const auto budget = static_cast<size_t>(config_.max_speakers_per_chunk);
    size_t width = exact_width ? budget : std::max(shape[2], budget);
    detail::require_shape(
        batch.target,
        {shape[0], static_cast<size_t>(config_.grid.num_frames), width},
        "Batch target");
    detail::require_shape(batch.guide, {shape[0], shape[1], shape[2]},
                          "Batch guide");
    if (batch.waveforms.storage() && batch.waveforms.shape()[0] != shape[0]) {
        throw std::invalid_argument(
            "Batch waveforms: " + detail::shape_str(batch.waveforms) +
            " does not match target " + detail::shape_str(batch.target));
    }
}

void GuidedDiarizationTask::log_(const std::string &name, float value) {
    if (logger_)
        logger_->log(name, value);
}

// ─── Steps ──────────────────────────────────────────────────────────────────

LossBreakdown
GuidedDiarizationTask::training_step(const Batch &batch,
                                     const SegmentationModel &model) {
    check_batch_(batch, /*exact_width=*/false);

    // drop samples that contain too many speakers
    auto keep =
        keep_within_budget(batch.target, config_.max_speakers_per_chunk);
    if (keep.empty())
        return {};

    Tensor waveforms = batch.waveforms;
    Tensor target = batch.target;
    Tensor guide = batch.guide;
    if (keep.size() != batch.target.shape()[0]) {
        target = detail::select_rows(target, keep);
        guide = detail::select_rows(guide, keep);
        if (waveforms.storage())
            waveforms = detail::select_rows(waveforms, keep);
    }

    // narrow wider targets to the active speakers
    const int budget = config_.max_speakers_per_chunk;
    if (target.shape()[2] > static_cast<size_t>(budget)) {
        auto columns = budget_columns(target, budget);
        target = gather_columns(target, columns);
        guide = gather_columns(guide, columns);
    }

    auto prediction = model(waveforms, guide);
    auto losses = loss_.compute(prediction, target, guide);

    log_("loss/train/segmentation", losses.segmentation);
    log_("loss/train/guide", losses.guide);
    log_("loss/train", losses.total);
    return losses;
}

float GuidedDiarizationTask::validation_step(const Batch &batch,
                                             const SegmentationModel &model,
                                             ValidationMetric *metric) {
    check_batch_(batch, /*exact_width=*/true);

    auto prediction = model(batch.waveforms);
    loss_.check_shapes(prediction, batch.target);

    auto decoded = codec_.to_multilabel(prediction);
    float seg_loss = loss_.segmentation_loss(prediction, decoded, batch.target);
    log_("loss/val/segmentation", seg_loss);

    if (metric)
        metric->update(decoded, batch.target);
    return seg_loss;
}

} // namespace guidiar
