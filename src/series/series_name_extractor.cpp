/// @file src/series/series_name_extractor.cpp
/// @brief SeriesNameExtractor — ordered distinct keys of prepared points.

#include "mktlens/series.hpp"

#include <unordered_set>

namespace mktlens::series {

std::vector<std::string>
SeriesNameExtractor::extract(std::span<const SeriesPoint> points) {
    std::vector<std::string>        names;
    std::unordered_set<std::string> seen;

    for (const auto& point : points) {
        for (const auto& entry : point.values) {
            if (seen.insert(entry.first).second) {
                names.push_back(entry.first);
            }
        }
    }
    return names;
}

}  // namespace mktlens::series
