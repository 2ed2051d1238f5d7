/**
 * @file  fuzz_series_engine.cpp
 * @brief libFuzzer target for the Engine pipeline (filter → prepare → names)
 *
 * Build:
 *   cmake -DMKTLENS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_series_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_series_engine -max_total_time=60
 *
 * Input layout (bytes are consumed front to back, missing bytes read as 0):
 *   [0]      view mode (mod 3)
 *   [1]      aggregation level (0 → none, else mod 5)
 *   [2]      year range start offset, [3] end offset (may be reversed)
 *   [4..]    records, 4 bytes each: year offset, geography, segment, value
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB for any byte sequence.
 *   2. Points are strictly ascending by year.
 *   3. No key appears twice within a point.
 *   4. series_names are distinct and cover every key of every point.
 *   5. Σ over all points == Σ over the records MatrixFilter accepts.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "mktlens/engine.hpp"
#include "mktlens/matrix_filter.hpp"

using namespace mktlens;
using namespace mktlens::core;

namespace {

const char* const kGeographies[] = {
    "North America", "U.S.", "US", "Canada", "Germany", "India", "Atlantis", "",
};
const char* const kSegments[] = {
    "Tablets", "Capsules", "Solid Dosage", "By Type", "Syrups",
    "Extended Release Tablets", "Gummies", "tablets",
};

}  // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto byte = [&](std::size_t i) -> uint8_t { return i < size ? data[i] : 0; };

    FilterCriteria criteria;
    criteria.view_mode = static_cast<ViewMode>(byte(0) % 3);
    if (byte(1) != 0) {
        criteria.aggregation_level = byte(1) % 5;
    }
    criteria.year_range = YearRange{.start = 2018 + byte(2) % 16, .end = 2018 + byte(3) % 16};

    std::vector<MarketRecord> records;
    for (std::size_t i = 4; i + 3 < size; i += 4) {
        records.push_back(MarketRecord{
            .year         = 2018 + data[i] % 16,
            .geography    = kGeographies[data[i + 1] % 8],
            .segment      = kSegments[data[i + 2] % 8],
            .segment_type = "By Type",
            .value        = static_cast<double>(data[i + 3]),
        });
    }

    std::vector<std::string> labels;
    for (const auto* g : kGeographies) labels.emplace_back(g);

    const Engine engine;
    const auto result = engine.compute_records(records, labels, criteria);

    double total = 0.0;
    std::set<std::string> keys;
    for (std::size_t p = 0; p < result.points.size(); ++p) {
        const auto& point = result.points[p];
        // Invariant 2
        assert(p == 0 || result.points[p - 1].year < point.year);

        std::set<std::string> in_point;
        for (const auto& [key, value] : point.values) {
            // Invariant 3
            assert(in_point.insert(key).second);
            keys.insert(key);
            total += value;
        }
    }

    // Invariant 4
    const std::set<std::string> names(result.series_names.begin(), result.series_names.end());
    assert(names.size() == result.series_names.size());
    assert(names == keys);

    // Invariant 5: values are small integers, so the sums are exact.
    double expected = 0.0;
    for (const auto& r : MatrixFilter::apply(records, criteria)) expected += r.value;
    assert(total == expected);

    (void)total;
    (void)expected;
    return 0;
}
