#pragma once

/// @file include/mktlens/selection.hpp
/// @brief Geography selection helpers over a resolved hierarchy.
///
/// The selectors hold an ordered list of selected geography labels. These
/// functions compute the next list for a user action and the tri-state
/// (none / partial / full) of a region checkbox. All are pure: the input
/// selection is never modified.
///
/// Placeholders (`exists_in_data == false`) are display-only groupings and
/// never enter a selection themselves.

#include "mktlens/geography.hpp"

#include <set>
#include <string>
#include <vector>

namespace mktlens::selection {

/// Ordered list of selected geography labels.
using Selection = std::vector<std::string>;

/// Selectable labels under `region`: itself (if present in data) and every
/// present descendant, pre-order.
[[nodiscard]] std::vector<std::string> region_members(const geography::GeographyNode& region);

/// Add `label` if absent, remove it if present.
[[nodiscard]] Selection toggle_label(const Selection& current, const std::string& label);

/// Select every member of `region`, or deselect them all if every member is
/// already selected. Newly selected labels are appended in member order.
[[nodiscard]] Selection toggle_region(const Selection& current,
                                      const geography::GeographyNode& region);

/// True if `region` has members and all of them are selected.
[[nodiscard]] bool is_fully_selected(const Selection& current,
                                     const geography::GeographyNode& region);

/// True if some, but not all, members of `region` are selected.
[[nodiscard]] bool is_partially_selected(const Selection& current,
                                         const geography::GeographyNode& region);

/// Every label of the resolution, in selector display order.
[[nodiscard]] Selection select_all(const geography::GeographyResolution& resolution);

/// The selection as the label set FilterCriteria expects.
[[nodiscard]] std::set<std::string> to_filter_set(const Selection& current);

}  // namespace mktlens::selection
