/// @file src/series/series_preparer.cpp
/// @brief SeriesPreparer — (year, key) grouping with optional rollup.
///
/// group() makes one pass over the records:
///   1. Assign each key an ordinal on first sight (display order)
///   2. Accumulate into year → (ordinal → sum); both levels are ordered maps,
///      so the output falls out sorted by year, then by first appearance

#include "mktlens/series.hpp"

#include <map>
#include <unordered_map>
#include <utility>

namespace mktlens::series {

// ─── Constructor ──────────────────────────────────────────────────────────────

SeriesPreparer::SeriesPreparer(const geography::GeographyRollup& geography,
                               const segment::SegmentRollupResolver& segments,
                               std::string key_separator)
    : geography_(geography)
    , segments_(segments)
    , separator_(std::move(key_separator))
{}

// ─── Keys ─────────────────────────────────────────────────────────────────────

std::string SeriesPreparer::aggregated_key(const MarketRecord& record,
                                           ViewMode mode,
                                           int level) const {
    switch (mode) {
        case ViewMode::SegmentMode:
            return segments_.rollup(record.segment, level);
        case ViewMode::GeographyMode:
            return geography_.rollup(record.geography, level);
        case ViewMode::Matrix:
            return record.geography + separator_ + segments_.rollup(record.segment, level);
    }
    return record.segment;
}

std::string SeriesPreparer::raw_key(const MarketRecord& record, ViewMode mode) const {
    switch (mode) {
        case ViewMode::SegmentMode:   return record.segment;
        case ViewMode::GeographyMode: return record.geography;
        case ViewMode::Matrix:        return record.geography + separator_ + record.segment;
    }
    return record.segment;
}

// ─── Strategies ───────────────────────────────────────────────────────────────

std::vector<SeriesPoint>
SeriesPreparer::prepare_aggregated(std::span<const MarketRecord> filtered,
                                   ViewMode mode,
                                   int level) const {
    return group(filtered, [this, mode, level](const MarketRecord& r) {
        return aggregated_key(r, mode, level);
    });
}

std::vector<SeriesPoint>
SeriesPreparer::prepare_multi_level(std::span<const MarketRecord> filtered,
                                    ViewMode mode) const {
    return group(filtered, [this, mode](const MarketRecord& r) {
        return raw_key(r, mode);
    });
}

// ─── group ────────────────────────────────────────────────────────────────────

std::vector<SeriesPoint>
SeriesPreparer::group(std::span<const MarketRecord> records, const KeyFunction& key_of) {
    std::unordered_map<std::string, std::size_t> ordinal_of;
    std::vector<std::string>                     keys;
    std::map<int, std::map<std::size_t, double>> sums;

    for (const auto& record : records) {
        std::string key = key_of(record);

        auto [it, inserted] = ordinal_of.try_emplace(key, keys.size());
        if (inserted) {
            keys.push_back(std::move(key));
        }
        sums[record.year][it->second] += record.value;
    }

    std::vector<SeriesPoint> points;
    points.reserve(sums.size());
    for (const auto& [year, by_key] : sums) {
        SeriesPoint point;
        point.year = year;
        point.values.reserve(by_key.size());
        for (const auto& [ordinal, total] : by_key) {
            point.values.emplace_back(keys[ordinal], total);
        }
        points.push_back(std::move(point));
    }
    return points;
}

}  // namespace mktlens::series
