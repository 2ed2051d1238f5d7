#pragma once

/// @file include/mktlens/customer_table.hpp
/// @brief CustomerTable — cross-customer intelligence rows with search,
///        column filters and sorting.
///
/// # Module: Customer Table
///
/// ## Responsibility
/// Hold the rows the workbook endpoint produces (`{headers, rows}` JSON) and
/// answer the table's queries:
///   - free-text search (case-insensitive substring over every cell)
///   - region and opportunity-score filters ("all" disables a filter)
///   - single-column sort, ascending or descending
///   - the distinct values offered by the two filter dropdowns
///
/// ## Sorting
/// Two numeric cells compare numerically; anything else compares as text.
/// Missing cells read as "". The sort is stable, so equal keys keep their
/// workbook order in both directions.
///
/// ## NOT Responsible For
/// Reading the workbook, CSV export, pagination.

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mktlens::customers {

/// A table cell: text or number, as the workbook stored it.
using Cell = std::variant<std::string, double>;

/// Cell rendered the way the table displays it.
[[nodiscard]] std::string cell_text(const Cell& cell);

/// One customer row, keyed by header.
struct CustomerRow {
    std::unordered_map<std::string, Cell> cells;

    /// Cell under `header`, or `nullptr` if the row lacks it.
    [[nodiscard]] const Cell* get(const std::string& header) const noexcept;

    /// Display text under `header`; "" if missing.
    [[nodiscard]] std::string text(const std::string& header) const;
};

enum class SortDirection { Ascending, Descending };

/// One table interaction's worth of query state.
struct CustomerQuery {
    std::string                search;
    std::string                region            = "all";
    std::string                opportunity_score = "all";
    std::optional<std::string> sort_column;
    SortDirection              direction         = SortDirection::Ascending;
};

/// Values offered by the filter dropdowns.
struct FilterOptions {
    std::vector<std::string> regions;             ///< Sorted, distinct
    std::vector<std::string> opportunity_scores;  ///< Sorted, distinct
};

/// Cross-customer rows plus their header order.
class CustomerTable {
public:
    CustomerTable() = default;
    CustomerTable(std::vector<std::string> headers, std::vector<CustomerRow> rows);

    /// Parse `{"headers": [...], "rows": [{...}, ...]}`. Rows whose cells are
    /// all empty are dropped. Returns `nullopt` for malformed JSON or a
    /// missing `headers` / `rows` array. Never throws.
    [[nodiscard]] static std::optional<CustomerTable>
    parse_json_string(std::string_view json_text) noexcept;

    /// Load and parse a JSON file. `nullopt` if unreadable or malformed.
    [[nodiscard]] static std::optional<CustomerTable>
    load_json(const std::string& filepath) noexcept;

    /// Distinct non-empty regions and opportunity scores, excluding the
    /// workbook's "xx" placeholder.
    [[nodiscard]] FilterOptions filter_options() const;

    /// Rows matching `query`, sorted as requested.
    [[nodiscard]] std::vector<CustomerRow> query(const CustomerQuery& query) const;

    [[nodiscard]] const std::vector<std::string>& headers() const noexcept { return headers_; }
    [[nodiscard]] const std::vector<CustomerRow>& rows() const noexcept    { return rows_; }

private:
    std::vector<std::string> headers_;
    std::vector<CustomerRow> rows_;
};

}  // namespace mktlens::customers
