/// @file src/segment/segment_taxonomy.cpp
/// @brief Built-in segment taxonomy and SegmentRollupResolver.

#include "mktlens/segment_taxonomy.hpp"
#include "mktlens/constants.hpp"
#include "mktlens/normalizer.hpp"

#include <utility>

namespace mktlens::segment {

namespace {

SegmentNode node(const char* name, std::vector<SegmentNode> children = {}) {
    return SegmentNode{.name = name, .children = std::move(children)};
}

std::vector<SegmentNode> build_taxonomy() {
    return {
        node("By Type", {
            node("Solid Dosage", {
                node("Tablets", {
                    node("Immediate Release Tablets"),
                    node("Extended Release Tablets"),
                    node("Orally Disintegrating Tablets"),
                }),
                node("Capsules", {
                    node("Hard Gelatin Capsules"),
                    node("Soft Gelatin Capsules"),
                }),
                node("Powders"),
                node("Granules"),
            }),
            node("Liquid Dosage", {
                node("Syrups"),
                node("Suspensions"),
                node("Solutions"),
                node("Emulsions"),
            }),
            node("Parenteral", {
                node("Intravenous"),
                node("Intramuscular"),
                node("Subcutaneous"),
            }),
            node("Topical", {
                node("Creams"),
                node("Ointments"),
                node("Gels"),
                node("Transdermal Patches"),
            }),
            node("Inhalation", {
                node("Metered Dose Inhalers"),
                node("Dry Powder Inhalers"),
                node("Nebulizers"),
            }),
        }),
        node("By Application", {
            node("Chronic Diseases", {
                node("Cardiovascular"),
                node("Diabetes"),
                node("Respiratory"),
            }),
            node("Acute Conditions", {
                node("Infections"),
                node("Pain Management"),
            }),
            node("Oncology"),
        }),
        node("By End User", {
            node("Hospitals", {
                node("Public Hospitals"),
                node("Private Hospitals"),
            }),
            node("Retail Pharmacies"),
            node("Online Pharmacies"),
            node("Homecare"),
        }),
    };
}

}  // anonymous namespace

const std::vector<SegmentNode>& reference_taxonomy() {
    static const std::vector<SegmentNode> taxonomy = build_taxonomy();
    return taxonomy;
}

// ─── SegmentRollupResolver ────────────────────────────────────────────────────

SegmentRollupResolver::SegmentRollupResolver()
    : SegmentRollupResolver(reference_taxonomy())
{}

SegmentRollupResolver::SegmentRollupResolver(const std::vector<SegmentNode>& taxonomy) {
    std::vector<std::string> path;
    for (const auto& root : taxonomy) {
        index(root, path);
    }
}

void SegmentRollupResolver::index(const SegmentNode& n, std::vector<std::string>& path) {
    path.push_back(n.name);

    Entry entry;
    entry.path = path;
    entry.children.reserve(n.children.size());
    for (const auto& child : n.children) {
        entry.children.push_back(child.name);
    }
    // try_emplace keeps the first occurrence of a repeated label.
    entries_.try_emplace(LabelNormalizer::normalize(n.name), std::move(entry));

    for (const auto& child : n.children) {
        index(child, path);
    }
    path.pop_back();
}

std::string SegmentRollupResolver::rollup(std::string_view label, int level) const {
    if (level < constants::SEGMENT_ROOT_LEVEL) {
        return std::string(label);
    }
    const auto it = entries_.find(LabelNormalizer::normalize(label));
    if (it == entries_.end()) {
        return std::string(label);
    }
    const auto& path = it->second.path;
    if (static_cast<std::size_t>(level) >= path.size()) {
        return std::string(label);
    }
    return path[static_cast<std::size_t>(level) - 1];
}

int SegmentRollupResolver::level_of(std::string_view label) const {
    const auto it = entries_.find(LabelNormalizer::normalize(label));
    return it == entries_.end() ? 0 : static_cast<int>(it->second.path.size());
}

std::vector<std::string> SegmentRollupResolver::children_of(std::string_view label) const {
    const auto it = entries_.find(LabelNormalizer::normalize(label));
    if (it == entries_.end()) {
        return {};
    }
    return it->second.children;
}

bool SegmentRollupResolver::knows(std::string_view label) const {
    return entries_.count(LabelNormalizer::normalize(label)) > 0;
}

}  // namespace mktlens::segment
