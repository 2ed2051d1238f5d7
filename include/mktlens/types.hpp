#pragma once

/// @file include/mktlens/types.hpp
/// @brief Shared value types for the MarketLens series engine.
///
/// Every module includes this file. It defines the raw record shape, the
/// filter snapshot handed in by the dashboard, and the chart-ready series
/// points handed back.

#include "mktlens/constants.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mktlens {

// ─── Raw Data ─────────────────────────────────────────────────────────────────

/// One cell of the geography × segment matrix for a single year.
///
/// (year, geography, segment, segment_type) is not guaranteed unique within
/// a partition; duplicates are summed.
struct MarketRecord {
    int         year;          ///< Calendar year
    std::string geography;     ///< Canonical geography label as in the dataset
    std::string segment;       ///< Segment label (leaf or parent)
    std::string segment_type;  ///< Taxonomy dimension, e.g. "By Type"
    double      value;         ///< Market value or volume for this cell
};

/// Which partition of the dataset a computation reads.
enum class DataType {
    Value,   ///< Market value (currency)
    Volume,  ///< Market volume (units)
};

/// Which dimension forms the chart's series axis.
enum class ViewMode {
    SegmentMode,    ///< One series per segment
    GeographyMode,  ///< One series per geography
    Matrix,         ///< One series per (geography, segment) pair
};

[[nodiscard]] const char* to_string(DataType t) noexcept;
[[nodiscard]] const char* to_string(ViewMode m) noexcept;

/// Parse "value" / "volume". Returns `nullopt` for anything else.
[[nodiscard]] std::optional<DataType> parse_data_type(std::string_view s) noexcept;

/// Parse "segment" / "segment-mode" / "geography" / "geography-mode" /
/// "matrix". Returns `nullopt` for anything else.
[[nodiscard]] std::optional<ViewMode> parse_view_mode(std::string_view s) noexcept;

// ─── Filter Criteria ──────────────────────────────────────────────────────────

/// A segment picked in the advanced (per-type) segment selector.
struct SegmentSelection {
    std::string type;  ///< Segment type the selection was made under
    std::string name;  ///< Segment label

    bool operator==(const SegmentSelection&) const = default;
};

/// Inclusive [start, end] year window.
struct YearRange {
    int start = constants::DEFAULT_START_YEAR;
    int end   = constants::DEFAULT_END_YEAR;

    /// The range with `start <= end`; a reversed range is swapped.
    [[nodiscard]] YearRange normalized() const noexcept;

    /// True if `year` lies within the normalized range, both ends inclusive.
    [[nodiscard]] bool contains(int year) const noexcept;

    bool operator==(const YearRange&) const = default;
};

/// Immutable filter snapshot for one computation.
///
/// Empty `geographies` / `segments` mean "no restriction on this dimension".
struct FilterCriteria {
    DataType                      data_type    = DataType::Value;
    ViewMode                      view_mode    = ViewMode::SegmentMode;
    std::string                   segment_type = constants::DEFAULT_SEGMENT_TYPE;
    std::set<std::string>         geographies;
    std::set<std::string>         segments;
    std::vector<SegmentSelection> advanced_segments;
    std::optional<int>            aggregation_level;
    YearRange                     year_range;

    bool operator==(const FilterCriteria&) const = default;
};

/// Stable content hash of a FilterCriteria (used as a cache key).
[[nodiscard]] std::size_t hash_value(const FilterCriteria& c) noexcept;

struct FilterCriteriaHash {
    std::size_t operator()(const FilterCriteria& c) const noexcept {
        return hash_value(c);
    }
};

// ─── Series Output ────────────────────────────────────────────────────────────

/// One x-axis position of a line chart: a year plus the summed value of
/// every series that has at least one contributing record in that year.
///
/// A missing key means "no data", never zero.
struct SeriesPoint {
    int year = 0;
    std::vector<std::pair<std::string, double>> values;  ///< Ordered key → sum

    /// Value for `key`, or `nullopt` if no record contributed.
    [[nodiscard]] std::optional<double> value(std::string_view key) const noexcept;

    [[nodiscard]] bool contains(std::string_view key) const noexcept;
};

/// What the rendering layer receives.
struct SeriesResult {
    std::vector<SeriesPoint> points;
    std::vector<std::string> series_names;

    [[nodiscard]] bool empty() const noexcept { return points.empty(); }

    /// Year-by-series text table, one row per year. Missing cells print "-".
    [[nodiscard]] std::string to_string() const;
};

} // namespace mktlens
