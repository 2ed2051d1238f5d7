/// @file src/heatmap/heatmap.cpp
/// @brief Heatmap — Eigen-backed geography × segment pivot.

#include "mktlens/heatmap.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace mktlens::heatmap {

namespace {

/// Index of `label` in `labels`, appending it on first sight.
Eigen::Index intern(const std::string& label,
                    std::vector<std::string>& labels,
                    std::unordered_map<std::string, Eigen::Index>& index) {
    const auto [it, inserted] =
        index.try_emplace(label, static_cast<Eigen::Index>(labels.size()));
    if (inserted) {
        labels.push_back(label);
    }
    return it->second;
}

Eigen::Index find_label(const std::vector<std::string>& labels, const std::string& label) {
    const auto it = std::find(labels.begin(), labels.end(), label);
    return it == labels.end() ? -1 : static_cast<Eigen::Index>(std::distance(labels.begin(), it));
}

}  // anonymous namespace

// ─── Heatmap::build ───────────────────────────────────────────────────────────

Heatmap Heatmap::build(std::span<const MarketRecord> records, std::optional<int> year) {
    Heatmap map;

    // Pass 1: fix the row/column layout.
    std::unordered_map<std::string, Eigen::Index> row_index;
    std::unordered_map<std::string, Eigen::Index> col_index;
    for (const auto& r : records) {
        if (year && r.year != *year) {
            continue;
        }
        intern(r.geography, map.rows_, row_index);
        intern(r.segment, map.columns_, col_index);
    }

    const auto n_rows = static_cast<Eigen::Index>(map.rows_.size());
    const auto n_cols = static_cast<Eigen::Index>(map.columns_.size());
    map.values_ = Eigen::MatrixXd::Zero(n_rows, n_cols);
    map.counts_ = Eigen::MatrixXi::Zero(n_rows, n_cols);

    // Pass 2: accumulate.
    for (const auto& r : records) {
        if (year && r.year != *year) {
            continue;
        }
        const Eigen::Index i = row_index.at(r.geography);
        const Eigen::Index j = col_index.at(r.segment);
        map.values_(i, j) += r.value;
        map.counts_(i, j) += 1;
    }

    return map;
}

// ─── Cell access ──────────────────────────────────────────────────────────────

std::optional<double> Heatmap::cell(std::size_t row, std::size_t col) const noexcept {
    if (row >= static_cast<std::size_t>(values_.rows()) ||
        col >= static_cast<std::size_t>(values_.cols())) {
        return std::nullopt;
    }
    const auto i = static_cast<Eigen::Index>(row);
    const auto j = static_cast<Eigen::Index>(col);
    if (counts_(i, j) == 0) {
        return std::nullopt;
    }
    return values_(i, j);
}

std::optional<double> Heatmap::cell(const std::string& geography,
                                    const std::string& segment) const {
    const Eigen::Index i = find_label(rows_, geography);
    const Eigen::Index j = find_label(columns_, segment);
    if (i < 0 || j < 0) {
        return std::nullopt;
    }
    return cell(static_cast<std::size_t>(i), static_cast<std::size_t>(j));
}

// ─── Aggregates ───────────────────────────────────────────────────────────────

Eigen::VectorXd Heatmap::row_totals() const {
    return values_.rowwise().sum();
}

Eigen::VectorXd Heatmap::column_totals() const {
    return values_.colwise().sum().transpose();
}

double Heatmap::total() const noexcept {
    return values_.size() == 0 ? 0.0 : values_.sum();
}

std::optional<double> Heatmap::max_value() const noexcept {
    std::optional<double> best;
    for (Eigen::Index i = 0; i < values_.rows(); ++i) {
        for (Eigen::Index j = 0; j < values_.cols(); ++j) {
            if (counts_(i, j) > 0 && (!best || values_(i, j) > *best)) {
                best = values_(i, j);
            }
        }
    }
    return best;
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string Heatmap::to_string() const {
    if (rows_.empty()) {
        return "(empty heatmap)";
    }

    std::string out = fmt::format("{:<22}", "");
    for (const auto& c : columns_) {
        out += fmt::format(" {:>14.14}", c);
    }
    out += fmt::format(" {:>14}\n", "total");

    const Eigen::VectorXd totals = row_totals();
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        out += fmt::format("{:<22.22}", rows_[i]);
        for (std::size_t j = 0; j < columns_.size(); ++j) {
            const auto v = cell(i, j);
            out += v ? fmt::format(" {:>14.2f}", *v) : fmt::format(" {:>14}", "-");
        }
        out += fmt::format(" {:>14.2f}\n", totals(static_cast<Eigen::Index>(i)));
    }
    return out;
}

}  // namespace mktlens::heatmap
