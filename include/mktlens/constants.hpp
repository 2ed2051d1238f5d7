#pragma once

#include <cstddef>

/// @file include/mktlens/constants.hpp
/// @brief Fixed labels and defaults for the MarketLens series engine.
///
/// These are the values the dashboard treats as configuration baked into the
/// product: the region-oriented segment type, the composite key separator
/// and the rollup level used when the user has made no finer selection.

namespace mktlens::constants {

// ─── Segment Types ────────────────────────────────────────────────────────────

/// Segment type carried by records that slice a market by region.
/// Geography-mode views substitute it when the user selected no segments.
static constexpr const char* REGION_SEGMENT_TYPE = "By Region";

/// Segment type used when a criteria snapshot does not name one.
static constexpr const char* DEFAULT_SEGMENT_TYPE = "By Type";

// ─── Series Keys ──────────────────────────────────────────────────────────────

/// Separator between geography and segment in matrix-mode series keys,
/// e.g. `"U.S.::Tablets"`.
static constexpr const char* MATRIX_KEY_SEPARATOR = "::";

// ─── Aggregation Levels ───────────────────────────────────────────────────────

/// Level the dashboard falls back to when no segments are selected:
/// parent segments (level 2) rather than leaves.
static constexpr int DEFAULT_AGGREGATION_LEVEL = 2;

/// Geography taxonomy depth: level 1 = region, level 2 = country.
static constexpr int GEOGRAPHY_REGION_LEVEL  = 1;
static constexpr int GEOGRAPHY_COUNTRY_LEVEL = 2;

/// Segment taxonomy root level (the segment type itself, e.g. `By Type`).
static constexpr int SEGMENT_ROOT_LEVEL = 1;

// ─── Year Range Defaults ──────────────────────────────────────────────────────

/// Inclusive year range used by FilterCriteria when none is supplied.
static constexpr int DEFAULT_START_YEAR = 2020;
static constexpr int DEFAULT_END_YEAR   = 2032;

// ─── Customer Table ───────────────────────────────────────────────────────────

/// Placeholder value the customer workbook uses for "not filled in".
static constexpr const char* CUSTOMER_MISSING_SENTINEL = "xx";

/// Filter value that disables a customer-table column filter.
static constexpr const char* CUSTOMER_FILTER_ALL = "all";

static constexpr const char* CUSTOMER_REGION_COLUMN = "Region";
static constexpr const char* CUSTOMER_SCORE_COLUMN =
    "Trivi Opportunity Score (High / Medium / Emerging)";

} // namespace mktlens::constants
