#include "guidiar/guidiar.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static uint64_t flag_seed = 0;
static int flag_frames = 589;
static bool flag_markdown = false;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--seed="))
            flag_seed = std::stoull(arg.substr(7));
        else if (arg.starts_with("--frames="))
            flag_frames = std::stoi(arg.substr(9));
        else if (arg == "--markdown")
            flag_markdown = true;
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Split "collate/32/real_time" into ("collate", 32)
static std::pair<std::string, int> parse_name_arg(const std::string &name) {
    auto first_slash = name.find('/');
    if (first_slash == std::string::npos)
        return {name, 0};
    auto second_slash = name.find('/', first_slash + 1);
    std::string arg_str = (second_slash != std::string::npos)
                              ? name.substr(first_slash + 1,
                                            second_slash - first_slash - 1)
                              : name.substr(first_slash + 1);
    int arg = 0;
    if (!arg_str.empty() &&
        arg_str.find_first_not_of("0123456789") == std::string::npos)
        arg = std::stoi(arg_str);
    return {name.substr(0, first_slash), arg};
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Benchmark | Size | Time (us) | Chunks/s |\n";
        std::cout << "|-----------|------|-----------|----------|\n";

        for (const auto &r : runs_) {
            if (r.skipped != benchmark::internal::NotSkipped)
                continue;

            auto [name, size] = parse_name_arg(r.benchmark_name());
            double time_us = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1e6;
            auto it = r.counters.find("Chunks");
            double chunks = it != r.counters.end() ? it->second.value : 0;

            std::cout << "| " << name << " | " << size << " | " << std::fixed
                      << std::setprecision(1) << time_us << " | "
                      << std::setprecision(0) << chunks << " |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Synthetic data ─────────────────────────────────────────────────────────

static guidiar::FrameGrid bench_grid() {
    guidiar::FrameGrid grid;
    grid.num_frames = flag_frames;
    grid.step = 10.0 / flag_frames;
    return grid;
}

// `num_turns` turns of 0.5 to 3 seconds over a 10s chunk, drawn among
// `num_speakers` labels.
static std::vector<guidiar::Annotation>
synthetic_turns(int num_turns, int num_speakers, guidiar::Rng &rng) {
    std::vector<guidiar::Annotation> turns;
    turns.reserve(num_turns);
    for (int i = 0; i < num_turns; ++i) {
        guidiar::Annotation a;
        a.start = rng.uniform_int(-10, 95) / 10.0;
        a.end = a.start + rng.uniform_int(5, 30) / 10.0;
        int label = rng.uniform_int(0, num_speakers - 1);
        a.labels = {label, label, label};
        turns.push_back(a);
    }
    return turns;
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static void add_size_args(benchmark::Benchmark *b,
                          const std::vector<int64_t> &sizes) {
    for (auto s : sizes)
        b->Arg(s);
    b->UseRealTime()->Unit(benchmark::kMicrosecond);
}

static void register_benchmarks() {
    // Turns per chunk
    add_size_args(
        benchmark::RegisterBenchmark(
            "discretize",
            [](benchmark::State &state) {
                guidiar::Rng rng(flag_seed);
                auto turns =
                    synthetic_turns(static_cast<int>(state.range(0)), 6, rng);
                auto grid = bench_grid();
                guidiar::Chunk chunk{0.0, 10.0};

                for (auto _ : state) {
                    auto y = guidiar::discretize_chunk(turns, chunk, grid,
                                                       guidiar::Scope::File);
                    benchmark::DoNotOptimize(y.activity.data());
                }

                state.counters["Chunks"] = benchmark::Counter(
                    static_cast<double>(state.iterations()),
                    benchmark::Counter::kIsRate);
            }),
        {4, 16, 64, 256});

    // Batch size
    add_size_args(
        benchmark::RegisterBenchmark(
            "collate",
            [](benchmark::State &state) {
                int batch_size = static_cast<int>(state.range(0));
                guidiar::Rng rng(flag_seed);
                auto grid = bench_grid();
                std::vector<guidiar::FrameTarget> targets;
                for (int b = 0; b < batch_size; ++b) {
                    targets.push_back(guidiar::discretize_chunk(
                        synthetic_turns(16, 6, rng), guidiar::Chunk{0.0, 10.0},
                        grid, guidiar::Scope::File));
                }

                for (auto _ : state) {
                    auto y = guidiar::collate_targets(targets, 3, rng);
                    auto s = y.strides();
                    benchmark::DoNotOptimize(s);
                }

                state.counters["Chunks"] = benchmark::Counter(
                    static_cast<double>(state.iterations()) * batch_size,
                    benchmark::Counter::kIsRate);
            }),
        {1, 8, 32, 128});

    // Batch size, guide drawn with the default strategy mix
    add_size_args(
        benchmark::RegisterBenchmark(
            "guidance",
            [](benchmark::State &state) {
                int batch_size = static_cast<int>(state.range(0));
                guidiar::Rng rng(flag_seed);
                std::vector<guidiar::FrameTarget> targets;
                for (int b = 0; b < batch_size; ++b) {
                    targets.push_back(guidiar::discretize_chunk(
                        synthetic_turns(16, 3, rng), guidiar::Chunk{0.0, 10.0},
                        bench_grid(), guidiar::Scope::File));
                }
                auto y = guidiar::collate_targets(targets, 3, rng);
                guidiar::GuidanceSampler sampler;

                for (auto _ : state) {
                    auto g = sampler.sample(y, rng);
                    auto s = g.guide.strides();
                    benchmark::DoNotOptimize(s);
                }

                state.counters["Chunks"] = benchmark::Counter(
                    static_cast<double>(state.iterations()) * batch_size,
                    benchmark::Counter::kIsRate);
            }),
        {1, 8, 32, 128});
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    try {
        parse_custom_flags(&argc, argv);
    } catch (const std::exception &e) {
        std::cerr << "Invalid flag value: " << e.what() << "\n\n"
                  << "Usage: guidiar_bench [options] [benchmark flags]\n\n"
                  << "Options:\n"
                  << "  --seed=N            Seed for synthetic data\n"
                  << "  --frames=N          Output frames per 10s chunk\n"
                  << "  --markdown          Output as markdown table\n"
                  << "\nGoogle Benchmark flags (passed through):\n"
                  << "  --benchmark_filter=REGEX\n"
                  << "  --benchmark_repetitions=N\n"
                  << "  --benchmark_format={console|json|csv}\n"
                  << std::endl;
        return 1;
    }
    // random-frame guidance reveals up to 10 frames
    if (flag_frames < 10) {
        std::cerr << "--frames must be at least 10" << std::endl;
        return 1;
    }

    benchmark::Initialize(&argc, argv);
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
