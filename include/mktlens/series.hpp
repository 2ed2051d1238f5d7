#pragma once

/// @file include/mktlens/series.hpp
/// @brief SeriesPreparer and SeriesNameExtractor — filtered records to
///        chart-ready, year-indexed series.
///
/// # Module: Series Preparation
///
/// ## Strategies
/// (a) Level-aggregated: group by (year, rollup key):
///       segment mode   : SegmentRollupResolver::rollup(segment, L)
///       geography mode : GeographyRollup::rollup(geography, L)
///       matrix         : geography + "::" + rollup(segment, L)
/// (b) Multi-level: group by (year, raw key):
///       segment mode   : segment
///       geography mode : geography
///       matrix         : geography + "::" + segment
///
/// ## Ordering
/// - Points ascending by year
/// - Keys within a point in first-appearance order across the whole filtered
///   sequence (display order only; values are unaffected)
///
/// ## Guarantees
/// - A (year, key) pair with no contributing record is absent, never 0
/// - Summation is plain double addition; grouping order never changes the
///   set of contributing records
///
/// ## Example
/// ```cpp
/// geography::GeographyRollup geo(resolution);
/// segment::SegmentRollupResolver seg;
/// SeriesPreparer prep(geo, seg);
/// auto points = prep.prepare_aggregated(filtered, ViewMode::SegmentMode, 2);
/// auto names  = SeriesNameExtractor::extract(points);
/// ```

#include "mktlens/constants.hpp"
#include "mktlens/geography.hpp"
#include "mktlens/segment_taxonomy.hpp"
#include "mktlens/types.hpp"

#include <functional>
#include <span>
#include <string>
#include <vector>

namespace mktlens::series {

/// Maps a record to the series it contributes to.
using KeyFunction = std::function<std::string(const MarketRecord&)>;

// ─── SeriesPreparer ───────────────────────────────────────────────────────────

/// Groups filtered records into SeriesPoints.
///
/// Holds references to the rollup resolvers; they must outlive the preparer.
class SeriesPreparer {
public:
    SeriesPreparer(const geography::GeographyRollup& geography,
                   const segment::SegmentRollupResolver& segments,
                   std::string key_separator = constants::MATRIX_KEY_SEPARATOR);

    /// Strategy (a): sum by (year, ancestor at `level`).
    [[nodiscard]] std::vector<SeriesPoint>
    prepare_aggregated(std::span<const MarketRecord> filtered,
                       ViewMode mode,
                       int level) const;

    /// Strategy (b): sum by (year, leaf key). No rollup.
    [[nodiscard]] std::vector<SeriesPoint>
    prepare_multi_level(std::span<const MarketRecord> filtered,
                        ViewMode mode) const;

    /// Series key for `record` under strategy (a).
    [[nodiscard]] std::string
    aggregated_key(const MarketRecord& record, ViewMode mode, int level) const;

    /// Series key for `record` under strategy (b).
    [[nodiscard]] std::string
    raw_key(const MarketRecord& record, ViewMode mode) const;

    /// Shared grouping core: sum `value` by (year, key_of(record)).
    [[nodiscard]] static std::vector<SeriesPoint>
    group(std::span<const MarketRecord> records, const KeyFunction& key_of);

private:
    const geography::GeographyRollup&       geography_;
    const segment::SegmentRollupResolver&   segments_;
    std::string                             separator_;
};

// ─── SeriesNameExtractor ──────────────────────────────────────────────────────

/// Derives the authoritative series list from prepared points, so names
/// always reflect the granularity actually applied (rollup names, not leaf
/// names, when a rollup ran).
class SeriesNameExtractor {
public:
    SeriesNameExtractor() = delete;

    /// Distinct keys across all points, first-seen order.
    [[nodiscard]] static std::vector<std::string>
    extract(std::span<const SeriesPoint> points);
};

}  // namespace mktlens::series
