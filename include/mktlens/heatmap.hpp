#pragma once

/// @file include/mktlens/heatmap.hpp
/// @brief Heatmap — geography × segment matrix for the matrix view.
///
/// # Module: Heatmap
///
/// ## Responsibility
/// The line chart cannot show the matrix view; the heatmap tab does. This
/// module pivots filtered records into a dense matrix:
///
///   rows    = geographies, first-seen order
///   columns = segments,    first-seen order
///   cell    = Σ value over records with that (geography, segment)
///
/// A parallel count matrix records how many records fed each cell, so an
/// empty cell (no records) stays distinguishable from a cell that sums to 0.
///
/// ## Guarantees
/// - Row and column totals equal the sum over contributing records
/// - Empty input → 0×0 matrices

#include "mktlens/types.hpp"

#include <Eigen/Dense>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mktlens::heatmap {

/// Dense geography × segment pivot of a record set.
class Heatmap {
public:
    /// Pivot `records`. If `year` is set, only that year's records count;
    /// otherwise all years are summed.
    [[nodiscard]] static Heatmap build(std::span<const MarketRecord> records,
                                       std::optional<int> year = std::nullopt);

    /// Summed value at (row, col), or `nullopt` if no record contributed or
    /// either index is out of range.
    [[nodiscard]] std::optional<double> cell(std::size_t row, std::size_t col) const noexcept;

    /// Same as `cell`, addressed by labels.
    [[nodiscard]] std::optional<double> cell(const std::string& geography,
                                             const std::string& segment) const;

    [[nodiscard]] Eigen::VectorXd row_totals() const;
    [[nodiscard]] Eigen::VectorXd column_totals() const;

    /// Sum of every cell.
    [[nodiscard]] double total() const noexcept;

    /// Largest populated cell, or `nullopt` for an empty heatmap.
    [[nodiscard]] std::optional<double> max_value() const noexcept;

    [[nodiscard]] const std::vector<std::string>& rows() const noexcept    { return rows_; }
    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }
    [[nodiscard]] const Eigen::MatrixXd& values() const noexcept           { return values_; }
    [[nodiscard]] const Eigen::MatrixXi& counts() const noexcept           { return counts_; }

    /// Fixed-width text rendering for the CLI.
    [[nodiscard]] std::string to_string() const;

private:
    std::vector<std::string> rows_;
    std::vector<std::string> columns_;
    Eigen::MatrixXd          values_;
    Eigen::MatrixXi          counts_;
};

}  // namespace mktlens::heatmap
