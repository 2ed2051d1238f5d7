/// @file src/selection/geography_selection.cpp
/// @brief Region toggling and tri-state checks for geography selectors.

#include "mktlens/selection.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace mktlens::selection {

namespace {

void collect_members(const geography::GeographyNode& node, std::vector<std::string>& out) {
    if (node.exists_in_data) {
        out.push_back(node.name);
    }
    for (const auto& child : node.children) {
        collect_members(child, out);
    }
}

std::size_t count_selected(const Selection& current, const std::vector<std::string>& members) {
    const std::unordered_set<std::string> selected(current.begin(), current.end());
    return static_cast<std::size_t>(std::count_if(members.begin(), members.end(),
        [&selected](const std::string& m) { return selected.count(m) > 0; }));
}

}  // anonymous namespace

std::vector<std::string> region_members(const geography::GeographyNode& region) {
    std::vector<std::string> members;
    collect_members(region, members);
    return members;
}

Selection toggle_label(const Selection& current, const std::string& label) {
    Selection next = current;
    const auto it = std::find(next.begin(), next.end(), label);
    if (it != next.end()) {
        next.erase(it);
    } else {
        next.push_back(label);
    }
    return next;
}

Selection toggle_region(const Selection& current, const geography::GeographyNode& region) {
    const auto members = region_members(region);
    if (members.empty()) {
        return current;
    }

    const std::unordered_set<std::string> member_set(members.begin(), members.end());
    Selection next;

    if (count_selected(current, members) == members.size()) {
        // Fully selected: deselect every member.
        std::copy_if(current.begin(), current.end(), std::back_inserter(next),
            [&member_set](const std::string& s) { return member_set.count(s) == 0; });
        return next;
    }

    next = current;
    std::unordered_set<std::string> present(current.begin(), current.end());
    for (const auto& m : members) {
        if (present.insert(m).second) {
            next.push_back(m);
        }
    }
    return next;
}

bool is_fully_selected(const Selection& current, const geography::GeographyNode& region) {
    const auto members = region_members(region);
    return !members.empty() && count_selected(current, members) == members.size();
}

bool is_partially_selected(const Selection& current, const geography::GeographyNode& region) {
    const auto members  = region_members(region);
    const auto selected = count_selected(current, members);
    return selected > 0 && selected < members.size();
}

Selection select_all(const geography::GeographyResolution& resolution) {
    return resolution.all_labels();
}

std::set<std::string> to_filter_set(const Selection& current) {
    return std::set<std::string>(current.begin(), current.end());
}

}  // namespace mktlens::selection
