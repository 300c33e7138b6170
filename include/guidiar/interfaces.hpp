#pragma once

#include <string>
#include <vector>

#include <axiom/axiom.hpp>

#include "guidiar/annotation.hpp"

namespace guidiar {

using namespace axiom;

// Capabilities the training core consumes but does not implement.

// ─── Powerset Codec ─────────────────────────────────────────────────────────

// Bijection between "at most max_set_size active out of num_classes" powerset
// classes and per-speaker multilabel activity.
class PowersetCodec {
  public:
    virtual ~PowersetCodec() = default;

    virtual int num_classes() const = 0;
    virtual int max_set_size() const = 0;
    virtual int num_powerset_classes() const = 0;

    // (batch, frames, num_powerset_classes) scores -> (batch, frames,
    // num_classes) hard {0, 1} multilabel.
    virtual Tensor to_multilabel(const Tensor &prediction) const = 0;

    // (batch, frames, num_classes) {0, 1} multilabel -> (batch, frames,
    // num_powerset_classes) one-hot.
    virtual Tensor to_powerset(const Tensor &multilabel) const = 0;
};

// ─── Permutation Solver ─────────────────────────────────────────────────────

struct Permutation {
    Tensor permuted; // candidate with columns reordered, same shape
    // mapping[b][s] = candidate column placed in slot s for sample b
    std::vector<std::vector<int>> mapping;
};

class PermutationSolver {
  public:
    virtual ~PermutationSolver() = default;

    // reference, candidate: (batch, frames, speakers)
    // weight: (batch, frames, 1), empty for uniform weighting
    virtual Permutation permutate(const Tensor &reference,
                                  const Tensor &candidate,
                                  const Tensor &weight = Tensor()) const = 0;
};

// ─── Model ──────────────────────────────────────────────────────────────────

class SegmentationModel {
  public:
    virtual ~SegmentationModel() = default;

    // waveforms: (batch, channels, samples), may be empty
    // guide: (batch, frames, speakers) in {-1, 0, +1}, empty when unguided
    // returns (batch, frames, num_powerset_classes) log-probabilities
    virtual Tensor forward(const Tensor &waveforms,
                           const Tensor &guide = Tensor()) const = 0;

    Tensor operator()(const Tensor &waveforms,
                      const Tensor &guide = Tensor()) const {
        return forward(waveforms, guide);
    }
};

// ─── Data & Reporting ───────────────────────────────────────────────────────

// Applied to training batches only.
class WaveformAugmentation {
  public:
    virtual ~WaveformAugmentation() = default;

    // (batch, channels, samples) -> same shape
    virtual Tensor augment(const Tensor &waveforms) const = 0;
};

class AudioSource {
  public:
    virtual ~AudioSource() = default;

    // (channels, samples) excerpt of `file_id` covering `chunk`.
    virtual Tensor crop(int file_id, const Chunk &chunk) const = 0;
};

class MetricLogger {
  public:
    virtual ~MetricLogger() = default;
    virtual void log(const std::string &name, float value) = 0;
};

class ValidationMetric {
  public:
    virtual ~ValidationMetric() = default;

    // Both (batch, frames, speakers).
    virtual void update(const Tensor &prediction, const Tensor &target) = 0;
};

} // namespace guidiar
