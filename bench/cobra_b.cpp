#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>

#include "cobra/branch/branch_data.hpp"
#include "cobra/seeds/trimming.hpp"
#include "cobra/wire/codec.hpp"

namespace cobra::branch {

class BranchFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        npoints = static_cast<size_t>(state.range(0));
        ndim    = 8;
    }

    void TearDown(const ::benchmark::State& /*unused*/) override {}

    ContinuationBranchData generate_branch(std::mt19937& gen) const {
        std::uniform_real_distribution<double> dis(-1.0, 1.0);
        ContinuationBranchData data;
        data.points.resize(npoints);
        for (size_t i = 0; i < npoints; ++i) {
            auto& point       = data.points[i];
            point.param_value = static_cast<double>(i) * 1e-3;
            point.state.resize(ndim);
            std::generate(point.state.begin(), point.state.end(),
                          [&]() { return dis(gen); });
            point.eigenvalues.resize(ndim);
            std::generate(point.eigenvalues.begin(), point.eigenvalues.end(),
                          [&]() { return Eigenvalue{dis(gen), dis(gen)}; });
        }
        data.indices = sequential_indices(npoints);
        return data;
    }

    size_t npoints{};
    size_t ndim{};
};

BENCHMARK_DEFINE_F(BranchFixture, BM_cobra_trim)(benchmark::State& state) {
    std::mt19937 gen(42);
    const auto data = generate_branch(gen);
    for (auto _ : state) {
        auto trimmed = seeds::discard_initial_approximation_point(data);
        benchmark::DoNotOptimize(trimmed);
    }
}

BENCHMARK_DEFINE_F(BranchFixture,
                   BM_cobra_codec_round_trip)(benchmark::State& state) {
    std::mt19937 gen(42);
    const auto data = generate_branch(gen);
    for (auto _ : state) {
        const auto payload = wire::serialize_branch_data(data);
        auto restored      = wire::normalize_branch_eigenvalues(payload);
        benchmark::DoNotOptimize(restored);
    }
}

BENCHMARK_DEFINE_F(BranchFixture,
                   BM_cobra_sorted_order)(benchmark::State& state) {
    std::mt19937 gen(42);
    std::vector<std::int64_t> labels(npoints);
    std::iota(labels.begin(), labels.end(),
              -static_cast<std::int64_t>(npoints / 2));
    std::ranges::shuffle(labels, gen);
    const auto indices = to_logical(labels);
    for (auto _ : state) {
        auto order = sorted_array_order(indices);
        benchmark::DoNotOptimize(order);
    }
}

constexpr size_t kMinPoints = 1 << 8;
constexpr size_t kMaxPoints = 1 << 14;

BENCHMARK_REGISTER_F(BranchFixture, BM_cobra_trim)
    ->RangeMultiplier(4)
    ->Range(kMinPoints, kMaxPoints);

BENCHMARK_REGISTER_F(BranchFixture, BM_cobra_codec_round_trip)
    ->RangeMultiplier(4)
    ->Range(kMinPoints, kMaxPoints);

BENCHMARK_REGISTER_F(BranchFixture, BM_cobra_sorted_order)
    ->RangeMultiplier(4)
    ->Range(kMinPoints, kMaxPoints);

} // namespace cobra::branch
