#pragma once

/// @file include/mktlens/engine.hpp
/// @brief Series Engine — public API.
///
/// # Module: Series Engine
///
/// ## Responsibility
/// Orchestrate the full pipeline for one chart:
///   Dataset + FilterCriteria → MatrixFilter → SeriesPreparer
///   (GeographyRollup / SegmentRollupResolver) → SeriesNameExtractor →
///   SeriesResult { points, series_names }
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto dataset = DatasetLoader::load_json("dataset.json");
/// if (dataset) {
///     auto criteria = engine.derive_effective(ui_criteria);
///     auto result   = engine.compute(*dataset, criteria);
///     fmt::print("{}\n", result.to_string());
/// }
/// ```
///
/// ## Guarantees
/// - Synchronous and side-effect free (apart from optional verbose output)
/// - Empty dataset or fully excluding filter → empty points and names
/// - `compute` applies criteria literally; the dashboard's implicit rules
///   live in `derive_effective`

#include "mktlens/constants.hpp"
#include "mktlens/geography.hpp"
#include "mktlens/segment_taxonomy.hpp"
#include "mktlens/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mktlens::core {

// ─── Dataset ──────────────────────────────────────────────────────────────────

/// Units and currency the dataset was published in. Display only.
struct DatasetMetadata {
    std::string currency    = "USD";
    std::string value_unit  = "Million";
    std::string volume_unit = "Units";
};

/// A loaded market dataset. Immutable for the session once built.
struct Dataset {
    std::vector<std::string>  all_geographies;  ///< dimensions.geographies.all_geographies
    std::vector<MarketRecord> value_records;    ///< data.value.geography_segment_matrix
    std::vector<MarketRecord> volume_records;   ///< data.volume.geography_segment_matrix
    DatasetMetadata           metadata;

    /// Identity token for caching. Two datasets with different contents must
    /// carry different tokens; use next_dataset_identity() when building one.
    /// 0 means unassigned and is never cached.
    std::uint64_t identity = 0;

    /// Records of the requested partition.
    [[nodiscard]] std::span<const MarketRecord> partition(DataType type) const noexcept;

    /// `all_geographies` if present, otherwise the distinct geographies of
    /// both partitions in first-seen order.
    [[nodiscard]] std::vector<std::string> geography_labels() const;
};

/// A process-unique, non-zero dataset identity token.
[[nodiscard]] std::uint64_t next_dataset_identity() noexcept;

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration parameters for the engine.
struct EngineConfig {
    /// Level `derive_effective` falls back to when nothing finer is selected.
    int default_aggregation_level = constants::DEFAULT_AGGREGATION_LEVEL;

    /// Segment type geography views read when no segments are selected.
    std::string region_segment_type = constants::REGION_SEGMENT_TYPE;

    /// Separator in matrix-mode series keys.
    std::string key_separator = constants::MATRIX_KEY_SEPARATOR;

    /// If true, emit one diagnostic line per computation to stderr.
    bool verbose = false;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

/// Turns a dataset and a filter snapshot into chart-ready series.
class Engine {
public:
    /// Construct with optional configuration.
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Run the full pipeline on `dataset`.
    ///
    /// # Pipeline
    /// 1. Select the partition named by `criteria.data_type`.
    /// 2. Filter with MatrixFilter.
    /// 3. If `criteria.aggregation_level` is set, prepare level-aggregated
    ///    points; otherwise prepare multi-level (leaf) points.
    /// 4. Extract series names from the prepared points.
    [[nodiscard]] SeriesResult
    compute(const Dataset& dataset, const FilterCriteria& criteria) const;

    /// Same as `compute`, reusing a rollup index built for this dataset.
    [[nodiscard]] SeriesResult
    compute(const Dataset& dataset,
            const FilterCriteria& criteria,
            const geography::GeographyRollup& rollup) const;

    /// Pipeline over a bare record partition (no Dataset wrapper).
    /// `geography_labels` feeds the geography hierarchy resolution.
    [[nodiscard]] SeriesResult
    compute_records(std::span<const MarketRecord> records,
                    const std::vector<std::string>& geography_labels,
                    const FilterCriteria& criteria) const;

    /// Apply the dashboard's dynamic filter semantics.
    ///
    /// # Rules
    /// - Aggregation level: if the user picked advanced segments of the
    ///   current segment type, no level (show individual segments). If not,
    ///   and no level is set, fall back to `default_aggregation_level`.
    /// - Geography mode with no segment selected at all (neither `segments`
    ///   nor advanced segments of the current type): read the region
    ///   segment type instead of `criteria.segment_type`.
    [[nodiscard]] FilterCriteria derive_effective(const FilterCriteria& criteria) const;

    /// Resolve the dataset's geography labels against the reference hierarchy.
    [[nodiscard]] geography::GeographyResolution
    resolve_geographies(const Dataset& dataset) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] SeriesResult
    run(std::span<const MarketRecord> records,
        const FilterCriteria& criteria,
        const geography::GeographyRollup& rollup) const;

    EngineConfig                          config_;
    geography::GeographyHierarchyResolver geography_resolver_;
    segment::SegmentRollupResolver        segment_resolver_;
};

// ─── SeriesCache ──────────────────────────────────────────────────────────────

/// Single-entry memo of Engine::compute keyed by (dataset identity, criteria).
///
/// Changing either key component recomputes. The geography rollup index is
/// memoized separately per dataset identity, so criteria changes on the same
/// dataset skip hierarchy resolution. Not thread-safe; owned by one caller.
class SeriesCache {
public:
    /// `engine` must outlive the cache.
    explicit SeriesCache(const Engine& engine);

    /// Cached result for (dataset, criteria), computing it on a miss.
    [[nodiscard]] const SeriesResult& get(const Dataset& dataset,
                                          const FilterCriteria& criteria);

    /// Drop the cached result and rollup index.
    void invalidate() noexcept;

    [[nodiscard]] std::size_t hits()   const noexcept { return hits_; }
    [[nodiscard]] std::size_t misses() const noexcept { return misses_; }

private:
    struct Key {
        std::uint64_t  dataset;
        std::size_t    criteria_hash;
        FilterCriteria criteria;
    };

    const Engine&                            engine_;
    std::optional<Key>                       key_;
    SeriesResult                             result_;
    std::optional<std::uint64_t>             rollup_dataset_;
    std::optional<geography::GeographyRollup> rollup_;
    std::size_t                              hits_   = 0;
    std::size_t                              misses_ = 0;
};

}  // namespace mktlens::core
