/// @file src/geography/reference_hierarchy.cpp
/// @brief Built-in region → country reference hierarchy.
///
/// Region order is the order the selectors display. "Rest of …" regions carry
/// no countries; they are matched as regions in their own right.

#include "mktlens/geography.hpp"

namespace mktlens::geography {

namespace {

TemplateNode leaf(const char* name) {
    return TemplateNode{.name = name, .children = {}};
}

std::vector<TemplateNode> build_reference() {
    return {
        TemplateNode{.name = "North America", .children = {
            leaf("U.S."), leaf("Canada"),
        }},
        TemplateNode{.name = "Europe", .children = {
            leaf("U.K."), leaf("Germany"), leaf("Italy"),
            leaf("France"), leaf("Spain"), leaf("Russia"),
        }},
        leaf("Rest of Europe"),
        TemplateNode{.name = "Asia Pacific", .children = {
            leaf("China"), leaf("India"), leaf("Japan"),
            leaf("South Korea"), leaf("ASEAN"), leaf("Australia"),
        }},
        leaf("Rest of Asia Pacific"),
        TemplateNode{.name = "Latin America", .children = {
            leaf("Brazil"), leaf("Argentina"), leaf("Mexico"),
        }},
        leaf("Rest of Latin America"),
        TemplateNode{.name = "Middle East", .children = {
            leaf("GCC"), leaf("Israel"),
        }},
        leaf("Rest of Middle East"),
        TemplateNode{.name = "Africa", .children = {
            leaf("North Africa"),
        }},
    };
}

}  // anonymous namespace

const std::vector<TemplateNode>& reference_hierarchy() {
    static const std::vector<TemplateNode> reference = build_reference();
    return reference;
}

}  // namespace mktlens::geography
