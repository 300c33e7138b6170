#pragma once

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

namespace guidiar {

// Seedable random source threaded through the speaker budget selector and the
// guidance sampler. Same seed, same draws.
class Rng {
  public:
    explicit Rng(uint64_t seed = 0) : engine_(seed) {}

    void seed(uint64_t seed) { engine_.seed(seed); }

    // Uniform integer in [lo, hi], both inclusive.
    int uniform_int(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(engine_);
    }

    template <typename T> void shuffle(std::vector<T> &values) {
        std::shuffle(values.begin(), values.end(), engine_);
    }

    // k distinct values drawn uniformly from [0, n) (partial Fisher-Yates).
    std::vector<int> sample(int n, int k) {
        std::vector<int> pool(static_cast<size_t>(n));
        std::iota(pool.begin(), pool.end(), 0);
        for (int i = 0; i < k; ++i) {
            int j = uniform_int(i, n - 1);
            std::swap(pool[i], pool[j]);
        }
        pool.resize(static_cast<size_t>(k));
        return pool;
    }

    std::mt19937_64 &engine() { return engine_; }

  private:
    std::mt19937_64 engine_;
};

} // namespace guidiar
