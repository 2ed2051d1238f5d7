#pragma once

/// @file include/mktlens/geography.hpp
/// @brief GeographyHierarchyResolver — reference region → country taxonomy
///        reconciled against the geography labels present in a dataset.
///
/// # Module: Geography Hierarchy
///
/// ## Responsibility
/// Every selector and every geography rollup works off one shared
/// resolution of the fixed reference hierarchy:
///
///   resolve(labels) → { tree, unmatched }
///
/// ## Matching
/// For each template node (depth-first, in template order) the first
/// still-unclaimed dataset label whose normalized form equals the node's
/// normalized name becomes the node's canonical name. Otherwise the template
/// name is kept as a display-only placeholder (`exists_in_data == false`).
/// A node survives iff it self-matched or at least one child survived.
/// Labels that no node claimed go to `unmatched`, in input order.
///
/// ## Guarantees
/// - Partition: tree labels ∪ unmatched == distinct input labels, and no
///   label appears twice (duplicate inputs collapse to the first occurrence)
/// - Never fails: a missing match only prunes the tree
/// - The reference hierarchy is an immutable table built once per process
///
/// ## NOT Responsible For
/// - Segment rollups (see segment_taxonomy.hpp)
/// - Selection state (see selection.hpp)

#include "mktlens/constants.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mktlens::geography {

// ─── Reference Taxonomy ───────────────────────────────────────────────────────

/// A node of the reference (template) hierarchy. Names are matching keys,
/// not necessarily the labels a dataset uses.
struct TemplateNode {
    std::string               name;
    std::vector<TemplateNode> children;
};

/// The built-in region → country hierarchy. Initialized on first use and
/// never mutated.
[[nodiscard]] const std::vector<TemplateNode>& reference_hierarchy();

// ─── Resolved Tree ────────────────────────────────────────────────────────────

/// A node of the resolved tree.
struct GeographyNode {
    std::string                name;            ///< Canonical label, or template name for placeholders
    std::vector<GeographyNode> children;        ///< Surviving children, template order
    bool                       exists_in_data;  ///< False → placeholder, not selectable
};

/// Output of GeographyHierarchyResolver::resolve.
struct GeographyResolution {
    std::vector<GeographyNode> tree;
    std::vector<std::string>   unmatched;

    /// Every dataset label claimed by the tree, pre-order.
    [[nodiscard]] std::vector<std::string> matched_labels() const;

    /// matched_labels() followed by unmatched: every distinct input label
    /// in selector display order.
    [[nodiscard]] std::vector<std::string> all_labels() const;

    [[nodiscard]] bool empty() const noexcept {
        return tree.empty() && unmatched.empty();
    }
};

// ─── GeographyHierarchyResolver ───────────────────────────────────────────────

/// Matches a reference hierarchy against dataset labels.
class GeographyHierarchyResolver {
public:
    /// Resolver over the built-in reference hierarchy.
    GeographyHierarchyResolver();

    /// Resolver over a caller-supplied template (tests, other taxonomies).
    explicit GeographyHierarchyResolver(std::vector<TemplateNode> reference);

    /// Reconcile the reference hierarchy with `labels`.
    [[nodiscard]] GeographyResolution
    resolve(const std::vector<std::string>& labels) const;

    /// Narrow a resolution to a case-insensitive search term.
    ///
    /// A node whose name matches keeps its whole subtree; otherwise it keeps
    /// only matching descendants and is dropped if none match. The unmatched
    /// bucket is filtered by the same substring test. An empty term returns
    /// the resolution unchanged.
    [[nodiscard]] static GeographyResolution
    search(const GeographyResolution& resolution, std::string_view term);

    [[nodiscard]] const std::vector<TemplateNode>& reference() const noexcept {
        return reference_;
    }

private:
    std::vector<TemplateNode> reference_;
};

// ─── GeographyRollup ──────────────────────────────────────────────────────────

/// Ancestor lookup over a resolved tree.
///
/// Level 1 is the top (region), level 2 its children (countries), and so on.
/// Built once per resolution; lookups are O(1) on average.
class GeographyRollup {
public:
    explicit GeographyRollup(const GeographyResolution& resolution);

    /// Name of `label`'s ancestor at `level`.
    ///
    /// Returns `label` unchanged if it already sits at or above `level`, if
    /// `level < 1`, or if the label is not part of the tree (unmatched
    /// labels such as "Global" roll up to themselves).
    [[nodiscard]] std::string rollup(std::string_view label, int level) const;

    /// Depth of `label` in the tree (1 = region), or 0 if absent.
    [[nodiscard]] int level_of(std::string_view label) const;

private:
    /// label → names of its ancestors from level 1 down to itself.
    std::unordered_map<std::string, std::vector<std::string>> paths_;
};

}  // namespace mktlens::geography
