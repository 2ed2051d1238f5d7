/// @file src/core/types.cpp
/// @brief Enum conversions, year-range helpers and criteria hashing.

#include "mktlens/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <functional>

namespace mktlens {

// ─── Enum conversions ─────────────────────────────────────────────────────────

const char* to_string(DataType t) noexcept {
    switch (t) {
        case DataType::Value:  return "value";
        case DataType::Volume: return "volume";
    }
    return "unknown";
}

const char* to_string(ViewMode m) noexcept {
    switch (m) {
        case ViewMode::SegmentMode:   return "segment-mode";
        case ViewMode::GeographyMode: return "geography-mode";
        case ViewMode::Matrix:        return "matrix";
    }
    return "unknown";
}

std::optional<DataType> parse_data_type(std::string_view s) noexcept {
    if (s == "value")  return DataType::Value;
    if (s == "volume") return DataType::Volume;
    return std::nullopt;
}

std::optional<ViewMode> parse_view_mode(std::string_view s) noexcept {
    if (s == "segment" || s == "segment-mode")     return ViewMode::SegmentMode;
    if (s == "geography" || s == "geography-mode") return ViewMode::GeographyMode;
    if (s == "matrix")                             return ViewMode::Matrix;
    return std::nullopt;
}

// ─── YearRange ────────────────────────────────────────────────────────────────

YearRange YearRange::normalized() const noexcept {
    if (start > end) {
        return YearRange{.start = end, .end = start};
    }
    return *this;
}

bool YearRange::contains(int year) const noexcept {
    const YearRange r = normalized();
    return year >= r.start && year <= r.end;
}

// ─── hash_value ───────────────────────────────────────────────────────────────

namespace {

/// boost-style hash_combine.
void combine(std::size_t& seed, std::size_t h) noexcept {
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // anonymous namespace

std::size_t hash_value(const FilterCriteria& c) noexcept {
    const std::hash<std::string> hs;
    const std::hash<int>         hi;

    std::size_t seed = 0;
    combine(seed, hi(static_cast<int>(c.data_type)));
    combine(seed, hi(static_cast<int>(c.view_mode)));
    combine(seed, hs(c.segment_type));

    // Separate the two label sets so {a}{} and {}{a} hash differently.
    combine(seed, c.geographies.size());
    for (const auto& g : c.geographies) combine(seed, hs(g));
    combine(seed, c.segments.size());
    for (const auto& s : c.segments) combine(seed, hs(s));

    combine(seed, c.advanced_segments.size());
    for (const auto& sel : c.advanced_segments) {
        combine(seed, hs(sel.type));
        combine(seed, hs(sel.name));
    }

    combine(seed, c.aggregation_level ? hi(*c.aggregation_level) + 1 : 0);
    combine(seed, hi(c.year_range.start));
    combine(seed, hi(c.year_range.end));
    return seed;
}

// ─── SeriesPoint ──────────────────────────────────────────────────────────────

std::optional<double> SeriesPoint::value(std::string_view key) const noexcept {
    const auto it = std::find_if(values.begin(), values.end(),
        [key](const auto& kv) { return kv.first == key; });
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SeriesPoint::contains(std::string_view key) const noexcept {
    return value(key).has_value();
}

// ─── SeriesResult ─────────────────────────────────────────────────────────────

std::string SeriesResult::to_string() const {
    if (points.empty()) {
        return "(no data)";
    }

    std::string out = fmt::format("{:>6}", "year");
    for (const auto& name : series_names) {
        out += fmt::format("  {:>16}", name);
    }
    out += '\n';

    for (const auto& point : points) {
        out += fmt::format("{:>6}", point.year);
        for (const auto& name : series_names) {
            const auto v = point.value(name);
            out += v ? fmt::format("  {:>16.2f}", *v) : fmt::format("  {:>16}", "-");
        }
        out += '\n';
    }
    return out;
}

}  // namespace mktlens
