/// @file tests/heatmap/test_heatmap.cpp
/// @brief Unit tests for the Eigen-backed Heatmap pivot.
///
/// Test categories:
///   - Row / column layout in first-seen order
///   - Cell sums and empty cells
///   - Single-year restriction
///   - Row, column and grand totals
///   - max_value over populated cells
///   - Empty input

#include <gtest/gtest.h>
#include "mktlens/heatmap.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

using namespace mktlens;
using namespace mktlens::heatmap;

namespace {

std::vector<MarketRecord> sample_records() {
    return {
        {2020, "U.S.",    "Tablets",  "By Type", 10.0},
        {2020, "Canada",  "Tablets",  "By Type",  5.0},
        {2021, "U.S.",    "Tablets",  "By Type", 12.0},
        {2020, "U.S.",    "Capsules", "By Type",  3.0},
        {2021, "Germany", "Capsules", "By Type",  0.0},
    };
}

}  // anonymous namespace

// ─── Layout ──────────────────────────────────────────────────────────────────

TEST(Heatmap, LabelsInFirstSeenOrder) {
    const auto records = sample_records();
    const auto map = Heatmap::build(records);
    EXPECT_EQ(map.rows(), (std::vector<std::string>{"U.S.", "Canada", "Germany"}));
    EXPECT_EQ(map.columns(), (std::vector<std::string>{"Tablets", "Capsules"}));
    EXPECT_EQ(map.values().rows(), 3);
    EXPECT_EQ(map.values().cols(), 2);
}

// ─── Cells ───────────────────────────────────────────────────────────────────

TEST(Heatmap, CellsSumAcrossYears) {
    const auto records = sample_records();
    const auto map = Heatmap::build(records);
    EXPECT_DOUBLE_EQ(*map.cell("U.S.", "Tablets"), 22.0);
    EXPECT_DOUBLE_EQ(*map.cell("Canada", "Tablets"), 5.0);
    EXPECT_DOUBLE_EQ(*map.cell("U.S.", "Capsules"), 3.0);
    EXPECT_EQ(map.counts()(0, 0), 2);
}

TEST(Heatmap, EmptyCellDiffersFromZeroCell) {
    const auto records = sample_records();
    const auto map = Heatmap::build(records);
    EXPECT_FALSE(map.cell("Canada", "Capsules").has_value());
    ASSERT_TRUE(map.cell("Germany", "Capsules").has_value());
    EXPECT_DOUBLE_EQ(*map.cell("Germany", "Capsules"), 0.0);
}

TEST(Heatmap, UnknownLabelsOrIndicesAreNullopt) {
    const auto records = sample_records();
    const auto map = Heatmap::build(records);
    EXPECT_FALSE(map.cell("Japan", "Tablets").has_value());
    EXPECT_FALSE(map.cell("U.S.", "Syrups").has_value());
    EXPECT_FALSE(map.cell(3, 0).has_value());
    EXPECT_FALSE(map.cell(0, 2).has_value());
}

TEST(Heatmap, HugeIndicesAreNullopt) {
    const auto records = sample_records();
    const auto map = Heatmap::build(records);
    constexpr auto max = std::numeric_limits<std::size_t>::max();
    EXPECT_FALSE(map.cell(max, 0).has_value());
    EXPECT_FALSE(map.cell(0, max).has_value());
    EXPECT_FALSE(map.cell(max, max).has_value());

    const std::vector<MarketRecord> none;
    EXPECT_FALSE(Heatmap::build(none).cell(max, max).has_value());
}

TEST(Heatmap, SingleYear) {
    const auto records = sample_records();
    const auto map = Heatmap::build(records, 2021);
    EXPECT_EQ(map.rows(), (std::vector<std::string>{"U.S.", "Germany"}));
    EXPECT_DOUBLE_EQ(*map.cell("U.S.", "Tablets"), 12.0);
    EXPECT_FALSE(map.cell("U.S.", "Capsules").has_value());
}

// ─── Totals ──────────────────────────────────────────────────────────────────

TEST(Heatmap, TotalsMatchRecordSums) {
    const auto records = sample_records();
    const auto map = Heatmap::build(records);

    const Eigen::VectorXd rows = map.row_totals();
    ASSERT_EQ(rows.size(), 3);
    EXPECT_DOUBLE_EQ(rows(0), 25.0);
    EXPECT_DOUBLE_EQ(rows(1), 5.0);
    EXPECT_DOUBLE_EQ(rows(2), 0.0);

    const Eigen::VectorXd cols = map.column_totals();
    ASSERT_EQ(cols.size(), 2);
    EXPECT_DOUBLE_EQ(cols(0), 27.0);
    EXPECT_DOUBLE_EQ(cols(1), 3.0);

    EXPECT_DOUBLE_EQ(map.total(), 30.0);
    EXPECT_DOUBLE_EQ(rows.sum(), cols.sum());
}

TEST(Heatmap, MaxValueOverPopulatedCells) {
    const std::vector<MarketRecord> negatives = {
        {2020, "U.S.",   "Tablets",  "By Type", -4.0},
        {2020, "Canada", "Capsules", "By Type", -2.0},
    };
    const auto map = Heatmap::build(negatives);
    // The empty (U.S., Capsules) cell holds 0 but must not win.
    EXPECT_DOUBLE_EQ(*map.max_value(), -2.0);
}

// ─── Empty ───────────────────────────────────────────────────────────────────

TEST(Heatmap, EmptyInput) {
    const std::vector<MarketRecord> none;
    const auto map = Heatmap::build(none);
    EXPECT_TRUE(map.rows().empty());
    EXPECT_EQ(map.values().size(), 0);
    EXPECT_DOUBLE_EQ(map.total(), 0.0);
    EXPECT_FALSE(map.max_value().has_value());
    EXPECT_EQ(map.to_string(), "(empty heatmap)");
}

TEST(Heatmap, YearWithNoRecordsIsEmpty) {
    const auto records = sample_records();
    EXPECT_TRUE(Heatmap::build(records, 1999).rows().empty());
}

TEST(Heatmap, TextRenderingHasTotalsColumn) {
    const auto records = sample_records();
    const auto text = Heatmap::build(records).to_string();
    EXPECT_NE(text.find("total"), std::string::npos);
    EXPECT_NE(text.find("22.00"), std::string::npos);
}
