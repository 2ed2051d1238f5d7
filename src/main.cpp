/// @file src/main.cpp
/// @brief MarketLens CLI entry point.
///
/// Usage:
///   mktlens --series <dataset.json> [options]    Chart-ready series
///   mktlens --regions <dataset.json> [--search]  Resolved geography tree
///   mktlens --heatmap <dataset.json> [options]   Geography × segment matrix
///   mktlens --customers <table.json> [options]   Cross-customer table query
///   mktlens --help                               Print usage

#include "mktlens/customer_table.hpp"
#include "mktlens/data_loader.hpp"
#include "mktlens/engine.hpp"
#include "mktlens/heatmap.hpp"
#include "mktlens/matrix_filter.hpp"
#include "mktlens/selection.hpp"

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  mktlens --series <dataset.json> [options]\n"
        "      --volume                  read the volume partition\n"
        "      --mode segment|geography|matrix\n"
        "      --type <segment type>     default \"By Type\"\n"
        "      --geo <label>             restrict geographies (repeatable)\n"
        "      --segment <label>         restrict segments (repeatable)\n"
        "      --pick <label>            advanced segment pick under --type (repeatable)\n"
        "      --level <N>               rollup level\n"
        "      --years <A:B>             inclusive year range\n"
        "      --auto                    apply dashboard defaults (level, region type)\n"
        "      --verbose                 pipeline diagnostics on stderr\n"
        "  mktlens --regions <dataset.json> [--search <term>]\n"
        "  mktlens --heatmap <dataset.json> [--volume] [--type <t>] [--year <N>]\n"
        "  mktlens --customers <table.json> [--search <s>] [--region <r>]\n"
        "          [--score <s>] [--sort <column>] [--desc]\n"
        "  mktlens --help\n"
    );
}

std::optional<int> parse_int(std::string_view s) {
    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

/// Parse "A:B" into a YearRange.
std::optional<mktlens::YearRange> parse_years(std::string_view s) {
    const auto colon = s.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    const auto a = parse_int(s.substr(0, colon));
    const auto b = parse_int(s.substr(colon + 1));
    if (!a || !b) {
        return std::nullopt;
    }
    return mktlens::YearRange{.start = *a, .end = *b};
}

/// Parsed flags shared by the dataset-reading modes.
struct Options {
    std::string               path;
    mktlens::FilterCriteria   criteria;
    std::optional<int>        year;
    std::string               search;
    std::string               region = "all";
    std::string               score  = "all";
    std::optional<std::string> sort;
    std::vector<std::string>  picks;
    bool                      descending = false;
    bool                      auto_rules = false;
    bool                      verbose    = false;
};

/// Parse argv[3..]. Returns `nullopt` (after printing why) on a bad flag.
std::optional<Options> parse_options(int argc, char* argv[]) {
    Options opt;
    opt.path = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string_view flag(argv[i]);
        const auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", flag);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (flag == "--volume") {
            opt.criteria.data_type = mktlens::DataType::Volume;
        } else if (flag == "--auto") {
            opt.auto_rules = true;
        } else if (flag == "--verbose") {
            opt.verbose = true;
        } else if (flag == "--desc") {
            opt.descending = true;
        } else {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            if (flag == "--mode") {
                auto mode = mktlens::parse_view_mode(*value);
                if (!mode) {
                    fmt::print(stderr, "Error: unknown view mode '{}'\n", *value);
                    return std::nullopt;
                }
                opt.criteria.view_mode = *mode;
            } else if (flag == "--type") {
                opt.criteria.segment_type = *value;
            } else if (flag == "--geo") {
                opt.criteria.geographies.insert(*value);
            } else if (flag == "--segment") {
                opt.criteria.segments.insert(*value);
            } else if (flag == "--pick") {
                opt.picks.push_back(*value);
            } else if (flag == "--level" || flag == "--year") {
                auto n = parse_int(*value);
                if (!n) {
                    fmt::print(stderr, "Error: {} expects an integer, got '{}'\n", flag, *value);
                    return std::nullopt;
                }
                if (flag == "--level") {
                    opt.criteria.aggregation_level = *n;
                } else {
                    opt.year = *n;
                }
            } else if (flag == "--years") {
                auto range = parse_years(*value);
                if (!range) {
                    fmt::print(stderr, "Error: --years expects A:B, got '{}'\n", *value);
                    return std::nullopt;
                }
                opt.criteria.year_range = *range;
            } else if (flag == "--search") {
                opt.search = *value;
            } else if (flag == "--region") {
                opt.region = *value;
            } else if (flag == "--score") {
                opt.score = *value;
            } else if (flag == "--sort") {
                opt.sort = *value;
            } else {
                fmt::print(stderr, "Unknown option: {}\n", flag);
                return std::nullopt;
            }
        }
    }

    // Advanced picks are recorded under the final segment type.
    for (const auto& name : opt.picks) {
        opt.criteria.advanced_segments.push_back(
            mktlens::SegmentSelection{.type = opt.criteria.segment_type, .name = name});
    }
    return opt;
}

/// Load the dataset named by `opt.path`, reporting failures on stderr.
std::optional<mktlens::core::Dataset> load_dataset(const Options& opt) {
    mktlens::core::LoadStats stats;
    auto dataset = mktlens::core::DatasetLoader::load_json(opt.path, &stats);
    if (!dataset) {
        fmt::print(stderr, "Error: cannot load dataset '{}'\n", opt.path);
        return std::nullopt;
    }
    if (opt.verbose) {
        fmt::print(stderr, "[mktlens] loaded {} value / {} volume records ({} skipped) from '{}'\n",
                   stats.value_records, stats.volume_records, stats.skipped_records, opt.path);
    }
    return dataset;
}

int run_series(const Options& opt) {
    auto dataset = load_dataset(opt);
    if (!dataset) {
        return 1;
    }

    mktlens::core::Engine engine(mktlens::core::EngineConfig{.verbose = opt.verbose});
    const auto criteria = opt.auto_rules ? engine.derive_effective(opt.criteria) : opt.criteria;
    const auto result   = engine.compute(*dataset, criteria);

    const std::string unit = criteria.data_type == mktlens::DataType::Value
        ? fmt::format("{} {}", dataset->metadata.currency, dataset->metadata.value_unit)
        : dataset->metadata.volume_unit;
    fmt::print("{} series, {} years ({})\n",
               result.series_names.size(), result.points.size(), unit);
    fmt::print("{}\n", result.to_string());
    return 0;
}

void print_node(const mktlens::geography::GeographyNode& node, int depth) {
    fmt::print("{:{}}{}{}\n", "", depth * 2, node.name,
               node.exists_in_data ? "" : "  (group)");
    for (const auto& child : node.children) {
        print_node(child, depth + 1);
    }
}

int run_regions(const Options& opt) {
    auto dataset = load_dataset(opt);
    if (!dataset) {
        return 1;
    }

    mktlens::core::Engine engine;
    const auto resolved = mktlens::geography::GeographyHierarchyResolver::search(
        engine.resolve_geographies(*dataset), opt.search);

    for (const auto& region : resolved.tree) {
        print_node(region, 0);
    }
    if (!resolved.unmatched.empty()) {
        fmt::print("Other:\n");
        for (const auto& label : resolved.unmatched) {
            fmt::print("  {}\n", label);
        }
    }
    fmt::print("{} selectable geographies\n",
               mktlens::selection::select_all(resolved).size());
    return 0;
}

int run_heatmap(const Options& opt) {
    auto dataset = load_dataset(opt);
    if (!dataset) {
        return 1;
    }

    const auto filtered = mktlens::MatrixFilter::apply(
        dataset->partition(opt.criteria.data_type), opt.criteria);
    const auto map = mktlens::heatmap::Heatmap::build(filtered, opt.year);
    fmt::print("{}\n", map.to_string());
    return 0;
}

int run_customers(const Options& opt) {
    auto table = mktlens::customers::CustomerTable::load_json(opt.path);
    if (!table) {
        fmt::print(stderr, "Error: cannot load customer table '{}'\n", opt.path);
        return 1;
    }

    const mktlens::customers::CustomerQuery query{
        .search            = opt.search,
        .region            = opt.region,
        .opportunity_score = opt.score,
        .sort_column       = opt.sort,
        .direction         = opt.descending ? mktlens::customers::SortDirection::Descending
                                            : mktlens::customers::SortDirection::Ascending,
    };
    const auto rows = table->query(query);

    for (const auto& row : rows) {
        std::string line;
        for (const auto& header : table->headers()) {
            if (!line.empty()) {
                line += " | ";
            }
            line += row.text(header);
        }
        fmt::print("{}\n", line);
    }
    fmt::print("{} of {} rows\n", rows.size(), table->rows().size());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--series" && mode != "--regions" &&
        mode != "--heatmap" && mode != "--customers") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a file path\n", mode);
        print_usage();
        return 1;
    }

    const auto opt = parse_options(argc, argv);
    if (!opt) {
        print_usage();
        return 1;
    }

    if (mode == "--series")  return run_series(*opt);
    if (mode == "--regions") return run_regions(*opt);
    if (mode == "--heatmap") return run_heatmap(*opt);
    return run_customers(*opt);
}
