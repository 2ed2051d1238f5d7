/// @file src/normalizer/label_normalizer.cpp
/// @brief LabelNormalizer — lower-case, trim, strip periods, collapse spaces.
///
/// Single pass over the input:
///   1. Skip '.' characters entirely
///   2. Map whitespace runs to one pending space
///   3. Emit the pending space only before the next visible character,
///      which trims both ends for free

#include "mktlens/normalizer.hpp"

#include <algorithm>
#include <cctype>

namespace mktlens {

namespace {

char lower_ascii(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // anonymous namespace

// ─── normalize ────────────────────────────────────────────────────────────────

std::string LabelNormalizer::normalize(std::string_view label) {
    std::string out;
    out.reserve(label.size());

    bool pending_space = false;
    for (const char c : label) {
        if (c == '.') {
            continue;
        }
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(lower_ascii(c));
    }
    return out;
}

// ─── labels_match ─────────────────────────────────────────────────────────────

bool LabelNormalizer::labels_match(std::string_view a, std::string_view b) {
    return normalize(a) == normalize(b);
}

// ─── contains_ignore_case ─────────────────────────────────────────────────────

bool LabelNormalizer::contains_ignore_case(std::string_view haystack,
                                           std::string_view needle) noexcept {
    if (needle.empty()) {
        return true;
    }
    const auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) { return lower_ascii(a) == lower_ascii(b); });
    return it != haystack.end();
}

}  // namespace mktlens
