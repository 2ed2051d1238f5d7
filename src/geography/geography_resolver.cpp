/// @file src/geography/geography_resolver.cpp
/// @brief GeographyHierarchyResolver — template/data reconciliation, search
///        and ancestor rollup.

#include "mktlens/geography.hpp"
#include "mktlens/constants.hpp"
#include "mktlens/normalizer.hpp"

#include <optional>
#include <unordered_set>
#include <utility>

namespace mktlens::geography {

namespace {

/// Dataset labels being claimed by template nodes during one resolve().
class MatchState {
public:
    explicit MatchState(const std::vector<std::string>& labels) {
        std::unordered_set<std::string> seen;
        for (const auto& label : labels) {
            if (seen.insert(label).second) {
                labels_.push_back(label);
                normalized_.push_back(LabelNormalizer::normalize(label));
            }
        }
        claimed_.assign(labels_.size(), false);
    }

    /// Claim the first unclaimed label matching `template_name`.
    std::optional<std::string> claim(const std::string& template_name) {
        const std::string key = LabelNormalizer::normalize(template_name);
        for (std::size_t i = 0; i < labels_.size(); ++i) {
            if (!claimed_[i] && normalized_[i] == key) {
                claimed_[i] = true;
                return labels_[i];
            }
        }
        return std::nullopt;
    }

    /// Labels no node claimed, in first-occurrence order.
    std::vector<std::string> unclaimed() const {
        std::vector<std::string> out;
        for (std::size_t i = 0; i < labels_.size(); ++i) {
            if (!claimed_[i]) {
                out.push_back(labels_[i]);
            }
        }
        return out;
    }

private:
    std::vector<std::string> labels_;
    std::vector<std::string> normalized_;
    std::vector<bool>        claimed_;
};

std::optional<GeographyNode> build_node(const TemplateNode& tmpl, MatchState& state) {
    auto canonical = state.claim(tmpl.name);

    std::vector<GeographyNode> children;
    for (const auto& child : tmpl.children) {
        if (auto node = build_node(child, state)) {
            children.push_back(std::move(*node));
        }
    }

    if (!canonical && children.empty()) {
        return std::nullopt;
    }

    return GeographyNode{
        .name           = canonical ? *canonical : tmpl.name,
        .children       = std::move(children),
        .exists_in_data = canonical.has_value(),
    };
}

void collect_matched(const GeographyNode& node, std::vector<std::string>& out) {
    if (node.exists_in_data) {
        out.push_back(node.name);
    }
    for (const auto& child : node.children) {
        collect_matched(child, out);
    }
}

/// Search filter for one node. A matching node keeps its whole subtree.
std::optional<GeographyNode> filter_node(const GeographyNode& node,
                                         std::string_view term) {
    if (LabelNormalizer::contains_ignore_case(node.name, term)) {
        return node;
    }

    std::vector<GeographyNode> kept;
    for (const auto& child : node.children) {
        if (auto c = filter_node(child, term)) {
            kept.push_back(std::move(*c));
        }
    }
    if (kept.empty()) {
        return std::nullopt;
    }
    return GeographyNode{
        .name           = node.name,
        .children       = std::move(kept),
        .exists_in_data = node.exists_in_data,
    };
}

void index_paths(const GeographyNode& node,
                 std::vector<std::string>& path,
                 std::unordered_map<std::string, std::vector<std::string>>& out) {
    path.push_back(node.name);
    if (node.exists_in_data) {
        out.emplace(node.name, path);
    }
    for (const auto& child : node.children) {
        index_paths(child, path, out);
    }
    path.pop_back();
}

}  // anonymous namespace

// ─── GeographyResolution ──────────────────────────────────────────────────────

std::vector<std::string> GeographyResolution::matched_labels() const {
    std::vector<std::string> out;
    for (const auto& node : tree) {
        collect_matched(node, out);
    }
    return out;
}

std::vector<std::string> GeographyResolution::all_labels() const {
    auto out = matched_labels();
    out.insert(out.end(), unmatched.begin(), unmatched.end());
    return out;
}

// ─── GeographyHierarchyResolver ───────────────────────────────────────────────

GeographyHierarchyResolver::GeographyHierarchyResolver()
    : reference_(reference_hierarchy())
{}

GeographyHierarchyResolver::GeographyHierarchyResolver(std::vector<TemplateNode> reference)
    : reference_(std::move(reference))
{}

GeographyResolution
GeographyHierarchyResolver::resolve(const std::vector<std::string>& labels) const {
    GeographyResolution result;
    if (labels.empty()) {
        return result;
    }

    MatchState state(labels);
    for (const auto& tmpl : reference_) {
        if (auto node = build_node(tmpl, state)) {
            result.tree.push_back(std::move(*node));
        }
    }
    result.unmatched = state.unclaimed();
    return result;
}

GeographyResolution
GeographyHierarchyResolver::search(const GeographyResolution& resolution,
                                   std::string_view term) {
    if (term.empty()) {
        return resolution;
    }

    GeographyResolution out;
    for (const auto& node : resolution.tree) {
        if (auto kept = filter_node(node, term)) {
            out.tree.push_back(std::move(*kept));
        }
    }
    for (const auto& label : resolution.unmatched) {
        if (LabelNormalizer::contains_ignore_case(label, term)) {
            out.unmatched.push_back(label);
        }
    }
    return out;
}

// ─── GeographyRollup ──────────────────────────────────────────────────────────

GeographyRollup::GeographyRollup(const GeographyResolution& resolution) {
    std::vector<std::string> path;
    for (const auto& node : resolution.tree) {
        index_paths(node, path, paths_);
    }
}

std::string GeographyRollup::rollup(std::string_view label, int level) const {
    const auto it = paths_.find(std::string(label));
    if (level < constants::GEOGRAPHY_REGION_LEVEL || it == paths_.end()) {
        return std::string(label);
    }
    const auto& path = it->second;
    if (static_cast<std::size_t>(level) >= path.size()) {
        return std::string(label);
    }
    return path[static_cast<std::size_t>(level) - 1];
}

int GeographyRollup::level_of(std::string_view label) const {
    const auto it = paths_.find(std::string(label));
    if (it == paths_.end()) {
        return 0;
    }
    return static_cast<int>(it->second.size());
}

}  // namespace mktlens::geography
