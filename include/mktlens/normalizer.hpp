#pragma once

/// @file include/mktlens/normalizer.hpp
/// @brief LabelNormalizer — formatting-drift tolerant label comparison.
///
/// # Module: Label Normalizer
///
/// ## Responsibility
/// Reduce taxonomy and dataset labels to a comparison form so that the
/// reference taxonomy matches whatever spelling a given dataset uses.
///
/// ## Formula
///   normalize(s) = collapse_ws(strip('.', trim(lower(s))))
///
/// - lower:       ASCII lower-case
/// - trim:        leading/trailing whitespace removed
/// - strip:       every '.' removed
/// - collapse_ws: runs of whitespace become a single ' '
///
/// Two labels match iff their normalized forms are exactly equal. There is
/// no fuzzy or alias matching: "U.S." matches "us" and "u.s." but never
/// "united states".
///
/// ## Guarantees
/// - Pure, deterministic, never throws
/// - Idempotent: normalize(normalize(s)) == normalize(s)

#include <string>
#include <string_view>

namespace mktlens {

/// Normalization for geography and segment labels.
///
/// All methods are static. LabelNormalizer holds no state.
class LabelNormalizer {
public:
    LabelNormalizer() = delete;

    /// Normalized comparison form of `label`.
    [[nodiscard]] static std::string normalize(std::string_view label);

    /// True if `a` and `b` normalize to the same string.
    [[nodiscard]] static bool labels_match(std::string_view a,
                                           std::string_view b);

    /// Case-insensitive (ASCII) substring test used by selector search.
    /// An empty `needle` matches everything.
    [[nodiscard]] static bool contains_ignore_case(std::string_view haystack,
                                                   std::string_view needle) noexcept;
};

}  // namespace mktlens
