#pragma once

/// @file include/mktlens/data_loader.hpp
/// @brief JSON dataset loader for the geography × segment matrix.
///
/// # Module: DatasetLoader
///
/// ## Responsibility
/// Turn the dashboard's dataset JSON into a `Dataset`. Records that are
/// malformed (missing fields, wrong types, non-finite values) are skipped;
/// the loader never crashes on bad input.
///
/// ## Expected Shape
/// ```
/// {
///   "dimensions": { "geographies": { "all_geographies": ["U.S.", ...] } },
///   "data": {
///     "value":  { "geography_segment_matrix": [ {record}, ... ] },
///     "volume": { "geography_segment_matrix": [ {record}, ... ] }
///   },
///   "metadata": { "currency": "USD", "value_unit": "Million",
///                 "volume_unit": "Units" }
/// }
/// ```
/// A record is `{"year": 2021, "geography": "U.S.", "segment": "Tablets",
/// "segment_type": "By Type", "value": 12.5}`. `segmentType` is accepted as
/// an alias of `segment_type`.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Missing sections load as empty; only unparseable JSON or a non-object
///   root is unrecoverable
/// - Every returned dataset carries a fresh identity token

#include "mktlens/engine.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mktlens::core {

/// Counts from the most recent parse, for diagnostics.
struct LoadStats {
    std::size_t value_records   = 0;
    std::size_t volume_records  = 0;
    std::size_t skipped_records = 0;
};

/// Loads market datasets from JSON files and strings.
class DatasetLoader {
public:
    DatasetLoader() = delete;

    /// Load a dataset from a JSON file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or is not a JSON object
    /// - Dataset otherwise (possibly with no records)
    [[nodiscard]] static std::optional<Dataset>
    load_json(const std::string& filepath, LoadStats* stats = nullptr) noexcept;

    /// Parse a dataset from a JSON string (useful for testing).
    [[nodiscard]] static std::optional<Dataset>
    parse_json_string(std::string_view json_text, LoadStats* stats = nullptr) noexcept;

    /// Validate a single record: finite value, non-empty geography and
    /// segment.
    [[nodiscard]] static bool validate_record(const MarketRecord& record) noexcept;
};

}  // namespace mktlens::core
