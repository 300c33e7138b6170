#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <axiom/axiom.hpp>

#include "guidiar/annotation.hpp"
#include "guidiar/config.hpp"
#include "guidiar/discretize.hpp"
#include "guidiar/guidance.hpp"
#include "guidiar/interfaces.hpp"
#include "guidiar/loss.hpp"
#include "guidiar/random.hpp"

namespace guidiar {

using namespace axiom;

// ─── Task Types ─────────────────────────────────────────────────────────────

enum class Problem {
    BinaryClassification,
    MonoLabelClassification,
    MultiLabelClassification,
};

enum class Resolution {
    Frame, // one output per frame
    Chunk, // one output per chunk
};

enum class Stage { Train, Validation };

// What the model is expected to produce for this task.
struct Specifications {
    Problem problem = Problem::MonoLabelClassification;
    Resolution resolution = Resolution::Frame;
    double duration = 0.0;            // chunk duration in seconds
    int num_frames = 0;               // output frames per chunk
    double frame_step = 0.0;          // seconds per output frame
    std::vector<std::string> classes; // "speaker#1", "speaker#2", ...
    int powerset_max_classes = 0;     // speakers active in one frame
    bool permutation_invariant = true;
};

struct SampleMeta {
    Scope scope = Scope::File;
    int database = 0;
    int file = 0;
};

struct Sample {
    Tensor waveform; // (channels, samples), empty without an audio source
    FrameTarget target;
    SampleMeta meta;
};

struct Batch {
    Tensor waveforms; // (batch, channels, samples) or empty
    Tensor target;    // (batch, num_frames, speakers)
    Tensor guide;     // (batch, num_frames, speakers)
    GuideStrategy strategy = GuideStrategy::None;
    std::vector<SampleMeta> meta;

    int size() const { return static_cast<int>(meta.size()); }
};

// ─── Guided Speaker Diarization Task ────────────────────────────────────────

// Training targets and losses for guided speaker diarization.
//
// 50% of batches carry no guide (autonomous use), 25% are guided on their
// first half (streaming use) and 25% on a few random frames (interactive use)
// with the default guidance config.
//
//   GuidedDiarizationTask task(cfg, index, codec, solver, /*seed=*/42);
//   std::vector<Sample> samples;
//   for (auto [file, start] : chunks)
//       samples.push_back(task.prepare_chunk(file, start));
//   auto batch = task.collate(samples);
//   auto losses = task.training_step(batch, model);
//
class GuidedDiarizationTask {
  public:
    // Throws std::invalid_argument on an invalid config or a codec that does
    // not match the speaker budget.
    GuidedDiarizationTask(const TaskConfig &config, AnnotationIndex annotations,
                          const PowersetCodec &codec,
                          const PermutationSolver &solver, uint64_t seed = 0);

    Specifications specifications() const;

    // Not owned. Pass nullptr to detach.
    void set_audio_source(const AudioSource *source) { audio_ = source; }
    void set_logger(MetricLogger *logger) { logger_ = logger; }
    void set_augmentation(const WaveformAugmentation *augmentation) {
        augmentation_ = augmentation;
    }

    void seed(uint64_t seed) { rng_.seed(seed); }

    // Waveform, multilabel target (in the file's label scope) and metadata
    // for one chunk. Throws std::out_of_range on an unknown file id.
    Sample prepare_chunk(int file_id, double start_time) const;
    Sample prepare_chunk(int file_id, double start_time,
                         double duration) const;

    // Stacks waveforms, fits targets to the speaker budget, draws the guide.
    // Waveforms go through the augmentation, when one is attached, at the
    // Train stage only.
    Batch collate(const std::vector<Sample> &samples,
                  Stage stage = Stage::Train);

    // Samples with more speakers than the budget are dropped; if none is
    // left the step returns zero losses without calling the model. Targets
    // wider than the budget are narrowed to the active speakers first.
    // Logs loss/train/segmentation, loss/train/guide and loss/train.
    LossBreakdown training_step(const Batch &batch,
                                const SegmentationModel &model);

    // Unguided forward pass. Logs loss/val/segmentation and feeds the decoded
    // prediction to `metric` when one is given.
    float validation_step(const Batch &batch, const SegmentationModel &model,
                          ValidationMetric *metric = nullptr);

    const TaskConfig &config() const { return config_; }
    const AnnotationIndex &annotations() const { return annotations_; }
    const DualLoss &loss() const { return loss_; }

  private:
    TaskConfig config_;
    AnnotationIndex annotations_;
    const PowersetCodec &codec_;
    GuidanceSampler guidance_;
    DualLoss loss_;
    Rng rng_;

    const AudioSource *audio_ = nullptr;
    const WaveformAugmentation *augmentation_ = nullptr;
    MetricLogger *logger_ = nullptr;

    // Throws std::invalid_argument on inconsistent batch shapes. With
    // `exact_width` false the target may be wider than the speaker budget.
    void check_batch_(const Batch &batch, bool exact_width) const;
    void log_(const std::string &name, float value);
};

} // namespace guidiar
