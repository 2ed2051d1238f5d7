/// @file tests/core/test_series_cache.cpp
/// @brief Unit tests for SeriesCache (single-entry memo over Engine::compute).
///
/// Test categories:
///   - Repeated identical requests hit
///   - Criteria change recomputes
///   - Dataset identity change recomputes
///   - Unassigned identity (0) is never served from the cache
///   - invalidate() forces recomputation
///   - Cached result equals a direct compute

#include <gtest/gtest.h>
#include "mktlens/engine.hpp"

#include <vector>

using namespace mktlens;
using namespace mktlens::core;

namespace {

Dataset make_dataset(double us_value) {
    Dataset d;
    d.all_geographies = {"U.S.", "Canada"};
    d.value_records = {
        {2020, "U.S.",   "Tablets", "By Type", us_value},
        {2020, "Canada", "Tablets", "By Type", 5.0},
    };
    d.identity = next_dataset_identity();
    return d;
}

Dataset make_unassigned(const char* geography, const char* segment, double value) {
    Dataset d;
    d.value_records = {{2020, geography, segment, "By Type", value}};
    return d;
}

}  // anonymous namespace

TEST(SeriesCache, FirstRequestMissesSecondHits) {
    const Engine engine;
    SeriesCache cache(engine);
    const auto dataset = make_dataset(10.0);
    const FilterCriteria criteria;

    (void)cache.get(dataset, criteria);
    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.hits(), 0u);

    (void)cache.get(dataset, criteria);
    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.hits(), 1u);
}

TEST(SeriesCache, CriteriaChangeRecomputes) {
    const Engine engine;
    SeriesCache cache(engine);
    const auto dataset = make_dataset(10.0);

    FilterCriteria criteria;
    const auto& first = cache.get(dataset, criteria);
    EXPECT_DOUBLE_EQ(*first.points[0].value("Tablets"), 15.0);

    criteria.geographies = {"Canada"};
    const auto& second = cache.get(dataset, criteria);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_DOUBLE_EQ(*second.points[0].value("Tablets"), 5.0);
}

TEST(SeriesCache, DatasetIdentityChangeRecomputes) {
    const Engine engine;
    SeriesCache cache(engine);
    const FilterCriteria criteria;

    const auto a = make_dataset(10.0);
    const auto b = make_dataset(20.0);

    EXPECT_DOUBLE_EQ(*cache.get(a, criteria).points[0].value("Tablets"), 15.0);
    EXPECT_DOUBLE_EQ(*cache.get(b, criteria).points[0].value("Tablets"), 25.0);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_EQ(cache.hits(), 0u);
}

TEST(SeriesCache, InvalidateForcesRecompute) {
    const Engine engine;
    SeriesCache cache(engine);
    auto dataset = make_dataset(10.0);
    const FilterCriteria criteria;

    (void)cache.get(dataset, criteria);
    // Same identity with edited records is only seen after invalidate().
    dataset.value_records[0].value = 100.0;
    EXPECT_DOUBLE_EQ(*cache.get(dataset, criteria).points[0].value("Tablets"), 15.0);

    cache.invalidate();
    EXPECT_DOUBLE_EQ(*cache.get(dataset, criteria).points[0].value("Tablets"), 105.0);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_EQ(cache.hits(), 1u);
}

TEST(SeriesCache, CachedResultMatchesDirectCompute) {
    const Engine engine;
    SeriesCache cache(engine);
    const auto dataset = make_dataset(10.0);

    FilterCriteria criteria;
    criteria.view_mode = ViewMode::Matrix;
    criteria.aggregation_level = 2;

    const auto direct = engine.compute(dataset, criteria);
    const auto& cached = cache.get(dataset, criteria);
    EXPECT_EQ(cached.series_names, direct.series_names);
    ASSERT_EQ(cached.points.size(), direct.points.size());
    EXPECT_EQ(cached.points[0].values, direct.points[0].values);
}

TEST(SeriesCache, AlternatingCriteriaAlwaysMiss) {
    const Engine engine;
    SeriesCache cache(engine);
    const auto dataset = make_dataset(10.0);

    FilterCriteria a;
    FilterCriteria b;
    b.view_mode = ViewMode::GeographyMode;

    (void)cache.get(dataset, a);
    (void)cache.get(dataset, b);
    (void)cache.get(dataset, a);
    EXPECT_EQ(cache.misses(), 3u);
    EXPECT_EQ(cache.hits(), 0u);
}

TEST(SeriesCache, UnassignedIdentityNeverHits) {
    const Engine engine;
    SeriesCache cache(engine);
    const FilterCriteria criteria;

    const auto a = make_unassigned("U.S.", "Tablets", 10.0);
    const auto b = make_unassigned("Canada", "Capsules", 99.0);
    ASSERT_EQ(a.identity, 0u);
    ASSERT_EQ(b.identity, 0u);

    const auto& first = cache.get(a, criteria);
    ASSERT_EQ(first.series_names.size(), 1u);
    EXPECT_EQ(first.series_names[0], "Tablets");

    const auto direct = engine.compute(b, criteria);
    const auto& second = cache.get(b, criteria);
    ASSERT_EQ(second.series_names.size(), 1u);
    EXPECT_EQ(second.series_names[0], "Capsules");
    EXPECT_EQ(second.series_names, direct.series_names);
    EXPECT_DOUBLE_EQ(*second.points[0].value("Capsules"), 99.0);

    EXPECT_EQ(cache.hits(), 0u);
    EXPECT_EQ(cache.misses(), 2u);
}

TEST(SeriesCache, AssignedIdentityCachesAfterUnassigned) {
    const Engine engine;
    SeriesCache cache(engine);
    const FilterCriteria criteria;

    (void)cache.get(make_unassigned("U.S.", "Tablets", 10.0), criteria);
    const auto dataset = make_dataset(10.0);
    (void)cache.get(dataset, criteria);
    (void)cache.get(dataset, criteria);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_EQ(cache.hits(), 1u);
}
