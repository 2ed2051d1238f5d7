/**
 * @file  prop_filter_stability.cpp
 * @brief Property: MatrixFilter output is the ordered subsequence of accepted
 *        records.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_filter_stability
 *
 *   1. apply() keeps exactly the records accepts() admits, in input order
 *   2. A reversed year range filters identically to its swapped form
 *   3. Empty geography and segment sets restrict nothing
 */

#include <rapidcheck.h>

#include "mktlens/matrix_filter.hpp"

#include <set>
#include <string>
#include <vector>

using namespace mktlens;

namespace {

const std::vector<std::string> kGeographies = {"U.S.", "Canada", "Germany", "Japan"};
const std::vector<std::string> kSegments    = {"Tablets", "Capsules", "Syrups"};
const std::vector<std::string> kTypes       = {"By Type", "By Application", "By Region"};

std::vector<MarketRecord> random_records() {
    const auto n = *rc::gen::inRange<std::size_t>(0, 50);
    std::vector<MarketRecord> records;
    records.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        records.push_back(MarketRecord{
            .year         = *rc::gen::inRange(2015, 2035),
            .geography    = *rc::gen::elementOf(kGeographies),
            .segment      = *rc::gen::elementOf(kSegments),
            .segment_type = *rc::gen::elementOf(kTypes),
            // Index doubles as identity for the order check.
            .value        = static_cast<double>(i),
        });
    }
    return records;
}

FilterCriteria random_criteria() {
    FilterCriteria c;
    c.segment_type = *rc::gen::elementOf(kTypes);
    c.year_range   = YearRange{
        .start = *rc::gen::inRange(2015, 2035),
        .end   = *rc::gen::inRange(2015, 2035),
    };
    for (const auto& g : kGeographies) {
        if (*rc::gen::arbitrary<bool>()) c.geographies.insert(g);
    }
    for (const auto& s : kSegments) {
        if (*rc::gen::arbitrary<bool>()) c.segments.insert(s);
    }
    return c;
}

std::vector<double> ids(const std::vector<MarketRecord>& records) {
    std::vector<double> out;
    out.reserve(records.size());
    for (const auto& r : records) out.push_back(r.value);
    return out;
}

}  // anonymous namespace

int main() {
    bool ok = true;

    ok &= rc::check(
        "filter_stability: apply == ordered accepts()",
        [] {
            const auto records  = random_records();
            const auto criteria = random_criteria();

            std::vector<double> expected;
            for (const auto& r : records) {
                if (MatrixFilter::accepts(r, criteria)) expected.push_back(r.value);
            }
            RC_ASSERT(ids(MatrixFilter::apply(records, criteria)) == expected);
            RC_ASSERT(MatrixFilter::count(records, criteria) == expected.size());
        }
    );

    ok &= rc::check(
        "filter_stability: reversed year range == swapped range",
        [] {
            const auto records = random_records();
            auto a = random_criteria();
            auto b = a;
            b.year_range = YearRange{.start = a.year_range.end, .end = a.year_range.start};
            RC_ASSERT(ids(MatrixFilter::apply(records, a)) == ids(MatrixFilter::apply(records, b)));
        }
    );

    ok &= rc::check(
        "filter_stability: empty sets restrict nothing",
        [] {
            const auto records = random_records();
            auto c = random_criteria();
            c.geographies.clear();
            c.segments.clear();

            for (const auto& r : records) {
                const bool expected = c.year_range.contains(r.year) &&
                                      r.segment_type == c.segment_type;
                RC_ASSERT(MatrixFilter::accepts(r, c) == expected);
            }
        }
    );

    return ok ? 0 : 1;
}
