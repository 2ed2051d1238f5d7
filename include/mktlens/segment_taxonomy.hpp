#pragma once

/// @file include/mktlens/segment_taxonomy.hpp
/// @brief SegmentRollupResolver — leaf segment → ancestor at a target level.
///
/// # Module: Segment Rollup
///
/// ## Responsibility
/// The segment-side counterpart of GeographyRollup. Given a segment label and
/// a target level L, return the label of its ancestor at L:
///
///   level 1 — segment type root      ("By Type")
///   level 2 — parent segment         ("Solid Dosage")
///   level 3 — leaf segment           ("Tablets")
///   level 4 — sub-leaf, where present ("Extended Release Tablets")
///
/// ## Guarantees
/// - Pure, deterministic and total: labels outside the taxonomy, labels
///   already at or coarser than L, and L < 1 all return the input unchanged
/// - Lookup tolerates formatting drift (LabelNormalizer); returned ancestors
///   are the taxonomy's own spelling
/// - The built-in taxonomy is an immutable table built once per process

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mktlens::segment {

/// A node of a segment taxonomy.
struct SegmentNode {
    std::string              name;
    std::vector<SegmentNode> children;
};

/// The built-in segment taxonomy: one root per segment type.
[[nodiscard]] const std::vector<SegmentNode>& reference_taxonomy();

/// Ancestor lookup over a segment taxonomy forest.
class SegmentRollupResolver {
public:
    /// Resolver over the built-in taxonomy.
    SegmentRollupResolver();

    /// Resolver over a caller-supplied forest. When a label appears more than
    /// once, the first occurrence (pre-order) wins.
    explicit SegmentRollupResolver(const std::vector<SegmentNode>& taxonomy);

    /// Ancestor of `label` at `level`, or `label` unchanged (see file docs).
    [[nodiscard]] std::string rollup(std::string_view label, int level) const;

    /// Depth of `label` (1 = segment type root), or 0 if unknown.
    [[nodiscard]] int level_of(std::string_view label) const;

    /// Direct children of `label` in taxonomy order; empty for leaves and
    /// unknown labels.
    [[nodiscard]] std::vector<std::string> children_of(std::string_view label) const;

    /// True if `label` is part of the taxonomy.
    [[nodiscard]] bool knows(std::string_view label) const;

private:
    struct Entry {
        std::vector<std::string> path;      ///< Root → self
        std::vector<std::string> children;
    };

    void index(const SegmentNode& node, std::vector<std::string>& path);

    std::unordered_map<std::string, Entry> entries_;  ///< keyed by normalized label
};

}  // namespace mktlens::segment
