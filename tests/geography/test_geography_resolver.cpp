/// @file tests/geography/test_geography_resolver.cpp
/// @brief Unit tests for GeographyHierarchyResolver.
///
/// Test categories:
///   - Every input label lands in exactly one place (tree or unmatched)
///   - Placeholders for regions absent from the data
///   - Canonical dataset spelling is kept on matched nodes
///   - Pruning of regions with no data
///   - Duplicate and near-duplicate labels
///   - Custom reference hierarchies
///   - search() filtering of tree and unmatched bucket

#include <gtest/gtest.h>
#include "mktlens/geography.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace mktlens::geography;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

const GeographyNode* find_region(const GeographyResolution& r, const std::string& name) {
    const auto it = std::find_if(r.tree.begin(), r.tree.end(),
        [&name](const GeographyNode& n) { return n.name == name; });
    return it == r.tree.end() ? nullptr : &*it;
}

std::vector<std::string> child_names(const GeographyNode& node) {
    std::vector<std::string> out;
    for (const auto& c : node.children) {
        out.push_back(c.name);
    }
    return out;
}

std::vector<std::string> sorted(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return v;
}

}  // anonymous namespace

// ─── Partition ───────────────────────────────────────────────────────────────

TEST(GeographyResolver, EveryLabelAppearsExactlyOnce) {
    const std::vector<std::string> labels = {
        "U.S.", "Canada", "Germany", "Atlantis", "Europe", "Rest of Europe",
    };
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve(labels);

    EXPECT_EQ(sorted(result.all_labels()), sorted(labels));
}

TEST(GeographyResolver, UnknownLabelGoesToUnmatched) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"U.S.", "Atlantis", "Lemuria"});

    EXPECT_EQ(result.unmatched, (std::vector<std::string>{"Atlantis", "Lemuria"}));
    EXPECT_EQ(result.matched_labels(), (std::vector<std::string>{"U.S."}));
}

TEST(GeographyResolver, EmptyInputGivesEmptyResolution) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({});
    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(result.tree.empty());
    EXPECT_TRUE(result.unmatched.empty());
}

// ─── Placeholders ────────────────────────────────────────────────────────────

TEST(GeographyResolver, RegionAbsentFromDataBecomesPlaceholder) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"U.S.", "Canada"});

    const auto* na = find_region(result, "North America");
    ASSERT_NE(na, nullptr);
    EXPECT_FALSE(na->exists_in_data);
    EXPECT_EQ(child_names(*na), (std::vector<std::string>{"U.S.", "Canada"}));
    for (const auto& c : na->children) {
        EXPECT_TRUE(c.exists_in_data);
    }
}

TEST(GeographyResolver, RegionPresentInDataIsSelectable) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"North America", "U.S."});

    const auto* na = find_region(result, "North America");
    ASSERT_NE(na, nullptr);
    EXPECT_TRUE(na->exists_in_data);
    EXPECT_EQ(child_names(*na), (std::vector<std::string>{"U.S."}));
}

TEST(GeographyResolver, PlaceholderNamesAreNotReportedAsMatched) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"Germany"});
    const auto matched = result.matched_labels();
    EXPECT_EQ(matched, (std::vector<std::string>{"Germany"}));
    EXPECT_EQ(std::count(matched.begin(), matched.end(), "Europe"), 0);
}

// ─── Canonical spelling ──────────────────────────────────────────────────────

TEST(GeographyResolver, MatchedNodeKeepsDatasetSpelling) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"US", "uk"});

    const auto* na = find_region(result, "North America");
    const auto* eu = find_region(result, "Europe");
    ASSERT_NE(na, nullptr);
    ASSERT_NE(eu, nullptr);
    EXPECT_EQ(child_names(*na), (std::vector<std::string>{"US"}));
    EXPECT_EQ(child_names(*eu), (std::vector<std::string>{"uk"}));
    EXPECT_TRUE(result.unmatched.empty());
}

// ─── Pruning ─────────────────────────────────────────────────────────────────

TEST(GeographyResolver, RegionsWithoutDataArePruned) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"India"});

    ASSERT_EQ(result.tree.size(), 1u);
    EXPECT_EQ(result.tree[0].name, "Asia Pacific");
    EXPECT_EQ(find_region(result, "Europe"), nullptr);
    EXPECT_EQ(find_region(result, "North America"), nullptr);
}

TEST(GeographyResolver, TreeFollowsReferenceOrderNotInputOrder) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"Japan", "Germany", "Canada", "U.S."});

    ASSERT_EQ(result.tree.size(), 3u);
    EXPECT_EQ(result.tree[0].name, "North America");
    EXPECT_EQ(result.tree[1].name, "Europe");
    EXPECT_EQ(result.tree[2].name, "Asia Pacific");
    EXPECT_EQ(child_names(result.tree[0]), (std::vector<std::string>{"U.S.", "Canada"}));
}

TEST(GeographyResolver, RestOfRegionIsTopLevelLeaf) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"Rest of Europe"});

    ASSERT_EQ(result.tree.size(), 1u);
    EXPECT_EQ(result.tree[0].name, "Rest of Europe");
    EXPECT_TRUE(result.tree[0].exists_in_data);
    EXPECT_TRUE(result.tree[0].children.empty());
}

// ─── Duplicates ──────────────────────────────────────────────────────────────

TEST(GeographyResolver, ExactDuplicatesCollapse) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"U.S.", "U.S.", "Canada", "Atlantis", "Atlantis"});

    EXPECT_EQ(result.matched_labels(), (std::vector<std::string>{"U.S.", "Canada"}));
    EXPECT_EQ(result.unmatched, (std::vector<std::string>{"Atlantis"}));
}

TEST(GeographyResolver, NodeClaimsOnlyOneOfTwoEquivalentSpellings) {
    const GeographyHierarchyResolver resolver;
    const auto result = resolver.resolve({"U.S.", "US"});

    EXPECT_EQ(result.matched_labels(), (std::vector<std::string>{"U.S."}));
    EXPECT_EQ(result.unmatched, (std::vector<std::string>{"US"}));
}

// ─── Custom reference ────────────────────────────────────────────────────────

TEST(GeographyResolver, CustomReferenceHierarchy) {
    const GeographyHierarchyResolver resolver({
        TemplateNode{.name = "Nordics", .children = {
            TemplateNode{.name = "Sweden", .children = {}},
            TemplateNode{.name = "Norway", .children = {}},
        }},
    });
    const auto result = resolver.resolve({"Norway", "U.S."});

    ASSERT_EQ(result.tree.size(), 1u);
    EXPECT_EQ(result.tree[0].name, "Nordics");
    EXPECT_EQ(child_names(result.tree[0]), (std::vector<std::string>{"Norway"}));
    EXPECT_EQ(result.unmatched, (std::vector<std::string>{"U.S."}));
}

TEST(GeographyResolver, DefaultReferenceIsBuiltIn) {
    const GeographyHierarchyResolver resolver;
    EXPECT_EQ(resolver.reference().size(), reference_hierarchy().size());
    EXPECT_EQ(reference_hierarchy().front().name, "North America");
}

// ─── search ──────────────────────────────────────────────────────────────────

TEST(GeographyResolver, SearchKeepsOnlyMatchingChildren) {
    const GeographyHierarchyResolver resolver;
    const auto full = resolver.resolve({"U.S.", "Canada", "Germany"});
    const auto hit  = GeographyHierarchyResolver::search(full, "can");

    ASSERT_EQ(hit.tree.size(), 1u);
    EXPECT_EQ(hit.tree[0].name, "North America");
    EXPECT_EQ(child_names(hit.tree[0]), (std::vector<std::string>{"Canada"}));
}

TEST(GeographyResolver, SearchMatchingRegionKeepsWholeSubtree) {
    const GeographyHierarchyResolver resolver;
    const auto full = resolver.resolve({"U.S.", "Canada", "Germany"});
    const auto hit  = GeographyHierarchyResolver::search(full, "NORTH");

    ASSERT_EQ(hit.tree.size(), 1u);
    EXPECT_EQ(child_names(hit.tree[0]), (std::vector<std::string>{"U.S.", "Canada"}));
}

TEST(GeographyResolver, SearchFiltersUnmatchedBucket) {
    const GeographyHierarchyResolver resolver;
    const auto full = resolver.resolve({"U.S.", "Atlantis", "Lemuria"});
    const auto hit  = GeographyHierarchyResolver::search(full, "lant");

    EXPECT_TRUE(hit.tree.empty());
    EXPECT_EQ(hit.unmatched, (std::vector<std::string>{"Atlantis"}));
}

TEST(GeographyResolver, EmptySearchTermReturnsEverything) {
    const GeographyHierarchyResolver resolver;
    const auto full = resolver.resolve({"U.S.", "Germany", "Atlantis"});
    const auto hit  = GeographyHierarchyResolver::search(full, "");

    EXPECT_EQ(hit.all_labels(), full.all_labels());
    EXPECT_EQ(hit.tree.size(), full.tree.size());
}

TEST(GeographyResolver, SearchWithNoHitsIsEmpty) {
    const GeographyHierarchyResolver resolver;
    const auto full = resolver.resolve({"U.S.", "Germany"});
    EXPECT_TRUE(GeographyHierarchyResolver::search(full, "zzz").empty());
}
