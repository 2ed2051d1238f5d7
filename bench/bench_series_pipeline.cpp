/**
 * @file  bench/bench_series_pipeline.cpp
 * @brief Google Benchmark suite for the MarketLens series pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_MatrixFilter_Apply        — predicate pass over N records
 *   BM_Prepare_MultiLevel        — raw-key grouping
 *   BM_Prepare_Aggregated        — segment rollup grouping (level 2)
 *   BM_Engine_Compute            — filter + prepare + names, matrix mode
 *   BM_SeriesCache_Hit           — repeated identical request
 *   BM_Geography_Resolve         — template reconciliation of L labels
 *   BM_Heatmap_Build             — Eigen pivot of N records
 *
 * Build (CMake):
 *   cmake -DMKTLENS_BENCH=ON ..
 *   cmake --build build --target bench_series_pipeline
 *   ./build/bench_series_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (records processed).
 */

#include "benchmark/benchmark.h"

#include "mktlens/engine.hpp"
#include "mktlens/heatmap.hpp"
#include "mktlens/matrix_filter.hpp"
#include "mktlens/series.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

namespace {

const std::vector<std::string> kGeographies = {
    "U.S.", "Canada", "U.K.", "Germany", "France", "China", "India", "Japan",
    "Brazil", "Mexico", "GCC", "North Africa", "Rest of Europe", "Atlantis",
};
const std::vector<std::string> kSegments = {
    "Tablets", "Capsules", "Powders", "Granules", "Syrups", "Suspensions",
    "Intravenous", "Creams", "Gels", "Nebulizers",
};

/// Deterministic synthetic dataset of `n` value records over 2020–2032.
mktlens::core::Dataset make_dataset(std::size_t n) {
    mktlens::core::Dataset d;
    d.all_geographies = kGeographies;
    d.value_records.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        d.value_records.push_back(mktlens::MarketRecord{
            .year         = 2020 + static_cast<int>(i % 13),
            .geography    = kGeographies[(i / 13) % kGeographies.size()],
            .segment      = kSegments[(i / 7) % kSegments.size()],
            .segment_type = "By Type",
            .value        = static_cast<double>(i % 997) * 0.5,
        });
    }
    d.identity = mktlens::core::next_dataset_identity();
    return d;
}

void set_items(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

}  // anonymous namespace

// ── Filter ─────────────────────────────────────────────────────────────────────

static void BM_MatrixFilter_Apply(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto dataset = make_dataset(n);
    mktlens::FilterCriteria criteria;
    criteria.geographies = {"U.S.", "Germany", "India"};

    for (auto _ : state) {
        auto out = mktlens::MatrixFilter::apply(dataset.value_records, criteria);
        benchmark::DoNotOptimize(out.data());
    }
    set_items(state, n);
}
BENCHMARK(BM_MatrixFilter_Apply)->RangeMultiplier(4)->Range(1024, 262144)->Unit(benchmark::kMicrosecond);

// ── Preparation ────────────────────────────────────────────────────────────────

static void BM_Prepare_MultiLevel(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto dataset = make_dataset(n);
    const mktlens::core::Engine engine;
    const mktlens::geography::GeographyRollup rollup(engine.resolve_geographies(dataset));
    const mktlens::segment::SegmentRollupResolver segments;
    const mktlens::series::SeriesPreparer preparer(rollup, segments);

    for (auto _ : state) {
        auto points = preparer.prepare_multi_level(dataset.value_records, mktlens::ViewMode::Matrix);
        benchmark::DoNotOptimize(points.data());
    }
    set_items(state, n);
}
BENCHMARK(BM_Prepare_MultiLevel)->RangeMultiplier(4)->Range(1024, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Prepare_Aggregated(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto dataset = make_dataset(n);
    const mktlens::core::Engine engine;
    const mktlens::geography::GeographyRollup rollup(engine.resolve_geographies(dataset));
    const mktlens::segment::SegmentRollupResolver segments;
    const mktlens::series::SeriesPreparer preparer(rollup, segments);

    for (auto _ : state) {
        auto points = preparer.prepare_aggregated(
            dataset.value_records, mktlens::ViewMode::SegmentMode, 2);
        benchmark::DoNotOptimize(points.data());
    }
    set_items(state, n);
}
BENCHMARK(BM_Prepare_Aggregated)->RangeMultiplier(4)->Range(1024, 262144)->Unit(benchmark::kMicrosecond);

// ── End to end ─────────────────────────────────────────────────────────────────

static void BM_Engine_Compute(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto dataset = make_dataset(n);
    const mktlens::core::Engine engine;
    mktlens::FilterCriteria criteria;
    criteria.view_mode = mktlens::ViewMode::Matrix;

    for (auto _ : state) {
        auto result = engine.compute(dataset, criteria);
        benchmark::DoNotOptimize(result.points.data());
    }
    set_items(state, n);
}
BENCHMARK(BM_Engine_Compute)->RangeMultiplier(4)->Range(1024, 262144)->Unit(benchmark::kMicrosecond);

static void BM_SeriesCache_Hit(benchmark::State& state) {
    const auto dataset = make_dataset(65536);
    const mktlens::core::Engine engine;
    mktlens::core::SeriesCache cache(engine);
    const auto criteria = engine.derive_effective(mktlens::FilterCriteria{});
    (void)cache.get(dataset, criteria);

    for (auto _ : state) {
        const auto& result = cache.get(dataset, criteria);
        benchmark::DoNotOptimize(&result);
    }
}
BENCHMARK(BM_SeriesCache_Hit);

// ── Geography / heatmap ────────────────────────────────────────────────────────

static void BM_Geography_Resolve(benchmark::State& state) {
    const mktlens::geography::GeographyHierarchyResolver resolver;
    std::vector<std::string> labels = kGeographies;
    labels.insert(labels.end(), {"North America", "Europe", "Asia Pacific", "Rest of Asia Pacific"});

    for (auto _ : state) {
        auto resolved = resolver.resolve(labels);
        benchmark::DoNotOptimize(resolved.tree.data());
    }
    set_items(state, labels.size());
}
BENCHMARK(BM_Geography_Resolve);

static void BM_Heatmap_Build(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto dataset = make_dataset(n);

    for (auto _ : state) {
        auto map = mktlens::heatmap::Heatmap::build(dataset.value_records);
        benchmark::DoNotOptimize(map.values().data());
    }
    set_items(state, n);
}
BENCHMARK(BM_Heatmap_Build)->RangeMultiplier(4)->Range(1024, 262144)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
