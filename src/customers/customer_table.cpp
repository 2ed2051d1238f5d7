/// @file src/customers/customer_table.cpp
/// @brief CustomerTable — parsing, filtering and sorting of customer rows.

#include "mktlens/customer_table.hpp"
#include "mktlens/constants.hpp"
#include "mktlens/normalizer.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <set>
#include <utility>

namespace mktlens::customers {

namespace {

using json = nlohmann::json;

std::optional<Cell> to_cell(const json& j) {
    if (j.is_string()) {
        return Cell{j.get<std::string>()};
    }
    if (j.is_number()) {
        const double d = j.get<double>();
        if (!std::isfinite(d)) {
            return std::nullopt;
        }
        return Cell{d};
    }
    if (j.is_boolean()) {
        return Cell{std::string(j.get<bool>() ? "true" : "false")};
    }
    // null and nested values read as empty.
    return Cell{std::string()};
}

bool is_blank(const Cell& cell) {
    const auto* s = std::get_if<std::string>(&cell);
    return s && s->empty();
}

bool row_matches(const CustomerRow& row, const CustomerQuery& q) {
    if (!q.search.empty()) {
        const bool hit = std::any_of(row.cells.begin(), row.cells.end(),
            [&q](const auto& kv) {
                return LabelNormalizer::contains_ignore_case(cell_text(kv.second), q.search);
            });
        if (!hit) {
            return false;
        }
    }
    if (q.region != constants::CUSTOMER_FILTER_ALL &&
        row.text(constants::CUSTOMER_REGION_COLUMN) != q.region) {
        return false;
    }
    if (q.opportunity_score != constants::CUSTOMER_FILTER_ALL &&
        row.text(constants::CUSTOMER_SCORE_COLUMN) != q.opportunity_score) {
        return false;
    }
    return true;
}

/// Three-way compare of two rows on `column`.
int compare_on(const CustomerRow& a, const CustomerRow& b, const std::string& column) {
    const Cell* ca = a.get(column);
    const Cell* cb = b.get(column);
    const double* na = ca ? std::get_if<double>(ca) : nullptr;
    const double* nb = cb ? std::get_if<double>(cb) : nullptr;

    if (na && nb) {
        return *na < *nb ? -1 : (*na > *nb ? 1 : 0);
    }
    const std::string ta = ca ? cell_text(*ca) : std::string();
    const std::string tb = cb ? cell_text(*cb) : std::string();
    return ta.compare(tb) < 0 ? -1 : (ta == tb ? 0 : 1);
}

}  // anonymous namespace

// ─── Cells ────────────────────────────────────────────────────────────────────

std::string cell_text(const Cell& cell) {
    if (const auto* s = std::get_if<std::string>(&cell)) {
        return *s;
    }
    return fmt::format("{}", std::get<double>(cell));
}

const Cell* CustomerRow::get(const std::string& header) const noexcept {
    const auto it = cells.find(header);
    return it == cells.end() ? nullptr : &it->second;
}

std::string CustomerRow::text(const std::string& header) const {
    const Cell* c = get(header);
    return c ? cell_text(*c) : std::string();
}

// ─── CustomerTable ────────────────────────────────────────────────────────────

CustomerTable::CustomerTable(std::vector<std::string> headers, std::vector<CustomerRow> rows)
    : headers_(std::move(headers))
    , rows_(std::move(rows))
{}

std::optional<CustomerTable>
CustomerTable::parse_json_string(std::string_view json_text) noexcept {
    try {
        const json root = json::parse(json_text.begin(), json_text.end(),
                                      /*cb=*/nullptr, /*allow_exceptions=*/false);
        if (root.is_discarded() || !root.is_object()) {
            return std::nullopt;
        }
        const auto h_it = root.find("headers");
        const auto r_it = root.find("rows");
        if (h_it == root.end() || !h_it->is_array() ||
            r_it == root.end() || !r_it->is_array()) {
            return std::nullopt;
        }

        std::vector<std::string> headers;
        for (const auto& h : *h_it) {
            if (h.is_string()) {
                headers.push_back(h.get<std::string>());
            }
        }

        std::vector<CustomerRow> rows;
        for (const auto& r : *r_it) {
            if (!r.is_object()) {
                continue;
            }
            CustomerRow row;
            bool any_value = false;
            for (const auto& [key, value] : r.items()) {
                auto cell = to_cell(value);
                if (!cell) {
                    continue;
                }
                any_value = any_value || !is_blank(*cell);
                row.cells.emplace(key, std::move(*cell));
            }
            if (any_value) {
                rows.push_back(std::move(row));
            }
        }

        return CustomerTable(std::move(headers), std::move(rows));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::optional<CustomerTable> CustomerTable::load_json(const std::string& filepath) noexcept {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    const std::string contents{std::istreambuf_iterator<char>(file),
                               std::istreambuf_iterator<char>()};
    return parse_json_string(contents);
}

FilterOptions CustomerTable::filter_options() const {
    std::set<std::string> regions;
    std::set<std::string> scores;

    const auto usable = [](const std::string& s) {
        return !s.empty() && s != constants::CUSTOMER_MISSING_SENTINEL;
    };

    for (const auto& row : rows_) {
        auto region = row.text(constants::CUSTOMER_REGION_COLUMN);
        if (usable(region)) regions.insert(std::move(region));

        auto score = row.text(constants::CUSTOMER_SCORE_COLUMN);
        if (usable(score)) scores.insert(std::move(score));
    }

    return FilterOptions{
        .regions            = {regions.begin(), regions.end()},
        .opportunity_scores = {scores.begin(), scores.end()},
    };
}

std::vector<CustomerRow> CustomerTable::query(const CustomerQuery& q) const {
    std::vector<CustomerRow> out;
    std::copy_if(rows_.begin(), rows_.end(), std::back_inserter(out),
        [&q](const CustomerRow& row) { return row_matches(row, q); });

    if (q.sort_column) {
        const std::string& column = *q.sort_column;
        const bool descending = q.direction == SortDirection::Descending;
        std::stable_sort(out.begin(), out.end(),
            [&column, descending](const CustomerRow& a, const CustomerRow& b) {
                const int c = compare_on(a, b, column);
                return descending ? c > 0 : c < 0;
            });
    }
    return out;
}

}  // namespace mktlens::customers
