/// @file src/core/engine.cpp
/// @brief Series Engine — pipeline orchestration and effective criteria.

#include "mktlens/engine.hpp"
#include "mktlens/matrix_filter.hpp"
#include "mktlens/series.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <initializer_list>
#include <unordered_set>
#include <utility>

namespace mktlens::core {

// ─── Dataset ──────────────────────────────────────────────────────────────────

std::span<const MarketRecord> Dataset::partition(DataType type) const noexcept {
    return type == DataType::Value ? std::span<const MarketRecord>(value_records)
                                   : std::span<const MarketRecord>(volume_records);
}

std::vector<std::string> Dataset::geography_labels() const {
    if (!all_geographies.empty()) {
        return all_geographies;
    }

    std::vector<std::string>        labels;
    std::unordered_set<std::string> seen;
    for (const auto* records : {&value_records, &volume_records}) {
        for (const auto& r : *records) {
            if (seen.insert(r.geography).second) {
                labels.push_back(r.geography);
            }
        }
    }
    return labels;
}

std::uint64_t next_dataset_identity() noexcept {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

// ─── Engine::compute ──────────────────────────────────────────────────────────

SeriesResult
Engine::compute(const Dataset& dataset, const FilterCriteria& criteria) const {
    const geography::GeographyRollup rollup(resolve_geographies(dataset));
    return compute(dataset, criteria, rollup);
}

SeriesResult
Engine::compute(const Dataset& dataset,
                const FilterCriteria& criteria,
                const geography::GeographyRollup& rollup) const {
    return run(dataset.partition(criteria.data_type), criteria, rollup);
}

SeriesResult
Engine::compute_records(std::span<const MarketRecord> records,
                        const std::vector<std::string>& geography_labels,
                        const FilterCriteria& criteria) const {
    const geography::GeographyRollup rollup(geography_resolver_.resolve(geography_labels));
    return run(records, criteria, rollup);
}

// ─── Engine::run ──────────────────────────────────────────────────────────────

SeriesResult
Engine::run(std::span<const MarketRecord> records,
            const FilterCriteria& criteria,
            const geography::GeographyRollup& rollup) const {
    // ── Step 1: Filter ────────────────────────────────────────────────────────
    const auto filtered = MatrixFilter::apply(records, criteria);

    // ── Step 2: Prepare points ────────────────────────────────────────────────
    const series::SeriesPreparer preparer(rollup, segment_resolver_, config_.key_separator);

    SeriesResult result;
    result.points = criteria.aggregation_level
        ? preparer.prepare_aggregated(filtered, criteria.view_mode, *criteria.aggregation_level)
        : preparer.prepare_multi_level(filtered, criteria.view_mode);

    // ── Step 3: Series names come from the prepared keys ──────────────────────
    result.series_names = series::SeriesNameExtractor::extract(result.points);

    if (config_.verbose) {
        fmt::print(stderr,
            "[mktlens] mode={} type='{}' level={} filtered={} points={} series={}\n",
            to_string(criteria.view_mode),
            criteria.segment_type,
            criteria.aggregation_level ? fmt::format("{}", *criteria.aggregation_level)
                                       : std::string("none"),
            filtered.size(),
            result.points.size(),
            result.series_names.size());
    }

    return result;
}

// ─── Engine::derive_effective ─────────────────────────────────────────────────

FilterCriteria Engine::derive_effective(const FilterCriteria& criteria) const {
    FilterCriteria effective = criteria;

    const bool has_advanced_selection = std::any_of(
        criteria.advanced_segments.begin(), criteria.advanced_segments.end(),
        [&criteria](const SegmentSelection& s) { return s.type == criteria.segment_type; });

    if (has_advanced_selection) {
        effective.aggregation_level = std::nullopt;
    } else if (!effective.aggregation_level) {
        effective.aggregation_level = config_.default_aggregation_level;
    }

    const bool no_segment_selected = !has_advanced_selection && criteria.segments.empty();
    if (criteria.view_mode == ViewMode::GeographyMode && no_segment_selected) {
        effective.segment_type = config_.region_segment_type;
    }

    return effective;
}

// ─── Engine::resolve_geographies ──────────────────────────────────────────────

geography::GeographyResolution
Engine::resolve_geographies(const Dataset& dataset) const {
    return geography_resolver_.resolve(dataset.geography_labels());
}

// ─── SeriesCache ──────────────────────────────────────────────────────────────

SeriesCache::SeriesCache(const Engine& engine)
    : engine_(engine)
{}

const SeriesResult& SeriesCache::get(const Dataset& dataset,
                                     const FilterCriteria& criteria) {
    // Identity 0 is unassigned: compute every time and leave no key behind.
    if (dataset.identity == 0) {
        ++misses_;
        key_.reset();
        rollup_.reset();
        rollup_dataset_.reset();
        result_ = engine_.compute(dataset, criteria);
        return result_;
    }

    const std::size_t h = hash_value(criteria);
    if (key_ && key_->dataset == dataset.identity &&
        key_->criteria_hash == h && key_->criteria == criteria) {
        ++hits_;
        return result_;
    }

    ++misses_;
    if (!rollup_ || rollup_dataset_ != dataset.identity) {
        rollup_.emplace(engine_.resolve_geographies(dataset));
        rollup_dataset_ = dataset.identity;
    }

    result_ = engine_.compute(dataset, criteria, *rollup_);
    key_    = Key{.dataset = dataset.identity, .criteria_hash = h, .criteria = criteria};
    return result_;
}

void SeriesCache::invalidate() noexcept {
    key_.reset();
    rollup_.reset();
    rollup_dataset_.reset();
    result_ = SeriesResult{};
}

}  // namespace mktlens::core
