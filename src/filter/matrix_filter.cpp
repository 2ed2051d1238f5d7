/// @file src/filter/matrix_filter.cpp
/// @brief MatrixFilter — year / geography / segment / segment-type predicate.

#include "mktlens/matrix_filter.hpp"

#include <algorithm>
#include <iterator>

namespace mktlens {

// ─── MatrixFilter::accepts ────────────────────────────────────────────────────

bool MatrixFilter::accepts(const MarketRecord& record,
                           const FilterCriteria& criteria) {
    if (!criteria.year_range.contains(record.year)) {
        return false;
    }

    // Empty selection sets place no restriction on their dimension.
    if (!criteria.geographies.empty() &&
        criteria.geographies.count(record.geography) == 0) {
        return false;
    }
    if (!criteria.segments.empty() &&
        criteria.segments.count(record.segment) == 0) {
        return false;
    }

    if (!criteria.segment_type.empty() &&
        record.segment_type != criteria.segment_type) {
        return false;
    }

    return true;
}

// ─── MatrixFilter::apply ──────────────────────────────────────────────────────

std::vector<MarketRecord>
MatrixFilter::apply(std::span<const MarketRecord> records,
                    const FilterCriteria& criteria) {
    std::vector<MarketRecord> out;
    std::copy_if(records.begin(), records.end(), std::back_inserter(out),
        [&criteria](const MarketRecord& r) { return accepts(r, criteria); });
    return out;
}

// ─── MatrixFilter::count ──────────────────────────────────────────────────────

std::size_t MatrixFilter::count(std::span<const MarketRecord> records,
                                const FilterCriteria& criteria) {
    return static_cast<std::size_t>(std::count_if(records.begin(), records.end(),
        [&criteria](const MarketRecord& r) { return accepts(r, criteria); }));
}

}  // namespace mktlens
