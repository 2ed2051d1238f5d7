/// @file src/core/data_loader.cpp
/// @brief JSON DatasetLoader for the geography × segment matrix.

#include "mktlens/data_loader.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>
#include <vector>

namespace mktlens::core {

namespace {

using json = nlohmann::json;

/// Integer year from a JSON number or numeric string.
std::optional<int> parse_year(const json& j) {
    if (j.is_number_integer()) {
        const auto v = j.get<std::int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(v);
    }
    if (j.is_number_float()) {
        const double d = j.get<double>();
        if (!std::isfinite(d) || d != std::floor(d) ||
            std::abs(d) > static_cast<double>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(d);
    }
    if (j.is_string()) {
        const auto& s = j.get_ref<const std::string&>();
        int year = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), year);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return year;
    }
    return std::nullopt;
}

std::optional<std::string> string_field(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<MarketRecord> parse_record(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    const auto year_it = j.find("year");
    if (year_it == j.end()) {
        return std::nullopt;
    }
    const auto year = parse_year(*year_it);

    const auto geography = string_field(j, "geography");
    const auto segment   = string_field(j, "segment");
    auto segment_type    = string_field(j, "segment_type");
    if (!segment_type) {
        segment_type = string_field(j, "segmentType");
    }

    const auto value_it = j.find("value");
    if (!year || !geography || !segment || !segment_type ||
        value_it == j.end() || !value_it->is_number()) {
        return std::nullopt;
    }

    MarketRecord record{
        .year         = *year,
        .geography    = *geography,
        .segment      = *segment,
        .segment_type = *segment_type,
        .value        = value_it->get<double>(),
    };

    if (!DatasetLoader::validate_record(record)) {
        return std::nullopt;
    }
    return record;
}

/// Parse `data.<partition>.geography_segment_matrix`. Missing → empty.
std::vector<MarketRecord> parse_partition(const json& root,
                                          const char* partition,
                                          std::size_t& skipped) {
    std::vector<MarketRecord> records;

    const auto data_it = root.find("data");
    if (data_it == root.end() || !data_it->is_object()) {
        return records;
    }
    const auto part_it = data_it->find(partition);
    if (part_it == data_it->end() || !part_it->is_object()) {
        return records;
    }
    const auto matrix_it = part_it->find("geography_segment_matrix");
    if (matrix_it == part_it->end() || !matrix_it->is_array()) {
        return records;
    }

    records.reserve(matrix_it->size());
    for (const auto& entry : *matrix_it) {
        if (auto record = parse_record(entry)) {
            records.push_back(std::move(*record));
        } else {
            ++skipped;
        }
    }
    return records;
}

std::vector<std::string> parse_geographies(const json& root) {
    std::vector<std::string> labels;

    const auto dims = root.find("dimensions");
    if (dims == root.end() || !dims->is_object()) {
        return labels;
    }
    const auto geos = dims->find("geographies");
    if (geos == dims->end() || !geos->is_object()) {
        return labels;
    }
    const auto all = geos->find("all_geographies");
    if (all == geos->end() || !all->is_array()) {
        return labels;
    }

    for (const auto& g : *all) {
        if (g.is_string()) {
            labels.push_back(g.get<std::string>());
        }
    }
    return labels;
}

DatasetMetadata parse_metadata(const json& root) {
    DatasetMetadata meta;

    const auto it = root.find("metadata");
    if (it == root.end() || !it->is_object()) {
        return meta;
    }
    if (auto v = string_field(*it, "currency"))    meta.currency    = *v;
    if (auto v = string_field(*it, "value_unit"))  meta.value_unit  = *v;
    if (auto v = string_field(*it, "volume_unit")) meta.volume_unit = *v;
    return meta;
}

}  // anonymous namespace

// ─── DatasetLoader::validate_record ───────────────────────────────────────────

bool DatasetLoader::validate_record(const MarketRecord& record) noexcept {
    if (!std::isfinite(record.value)) return false;
    if (record.geography.empty())     return false;
    if (record.segment.empty())       return false;
    return true;
}

// ─── DatasetLoader::parse_json_string ─────────────────────────────────────────

std::optional<Dataset>
DatasetLoader::parse_json_string(std::string_view json_text, LoadStats* stats) noexcept {
    try {
        const json root = json::parse(json_text.begin(), json_text.end(),
                                      /*cb=*/nullptr, /*allow_exceptions=*/false);
        if (root.is_discarded() || !root.is_object()) {
            return std::nullopt;
        }

        std::size_t skipped = 0;
        Dataset dataset;
        dataset.all_geographies = parse_geographies(root);
        dataset.value_records   = parse_partition(root, "value", skipped);
        dataset.volume_records  = parse_partition(root, "volume", skipped);
        dataset.metadata        = parse_metadata(root);
        dataset.identity        = next_dataset_identity();

        if (stats) {
            *stats = LoadStats{
                .value_records   = dataset.value_records.size(),
                .volume_records  = dataset.volume_records.size(),
                .skipped_records = skipped,
            };
        }
        return dataset;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ─── DatasetLoader::load_json ─────────────────────────────────────────────────

std::optional<Dataset>
DatasetLoader::load_json(const std::string& filepath, LoadStats* stats) noexcept {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    const std::string contents{std::istreambuf_iterator<char>(file),
                               std::istreambuf_iterator<char>()};
    return parse_json_string(contents, stats);
}

}  // namespace mktlens::core
