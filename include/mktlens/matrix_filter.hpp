#pragma once

/// @file include/mktlens/matrix_filter.hpp
/// @brief MatrixFilter — applies a FilterCriteria snapshot to raw records.
///
/// # Module: Matrix Filter
///
/// ## Inclusion Predicate
/// A record is kept iff all of:
///   - `year` ∈ year_range (inclusive; a reversed range is swapped)
///   - `geography` ∈ geographies, or geographies is empty
///   - `segment`   ∈ segments,    or segments is empty
///   - `segment_type` == criteria.segment_type, or segment_type is empty
///
/// The segment type is taken literally. Substituting the region segment type
/// for geography views is Engine::derive_effective's job, not the filter's.
///
/// ## Guarantees
/// - Stable: output keeps the input's relative order
/// - Never fails: a fully excluding filter returns an empty vector

#include "mktlens/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace mktlens {

/// Record filter over one dataset partition.
///
/// All methods are static. MatrixFilter holds no state.
class MatrixFilter {
public:
    MatrixFilter() = delete;

    /// Records of `records` accepted by `criteria`, in input order.
    [[nodiscard]] static std::vector<MarketRecord>
    apply(std::span<const MarketRecord> records, const FilterCriteria& criteria);

    /// Number of records `apply` would return, without copying them.
    [[nodiscard]] static std::size_t
    count(std::span<const MarketRecord> records, const FilterCriteria& criteria);

    /// Inclusion predicate for a single record.
    [[nodiscard]] static bool
    accepts(const MarketRecord& record, const FilterCriteria& criteria);
};

}  // namespace mktlens
