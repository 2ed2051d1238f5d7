/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DatasetLoader::parse_json_string and
 *        CustomerTable::parse_json_string
 *
 * Build:
 *   cmake -DMKTLENS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception escapes for any byte sequence.
 *   2. If a dataset is returned:
 *      a. every record passes validate_record (finite value, non-empty
 *         geography and segment)
 *      b. each partition holds no more records than the input has bytes
 *      c. the dataset identity is non-zero
 *   3. If a customer table is returned, every row has at least one
 *      non-empty cell.
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view. The loaders must handle:
 *     • Binary garbage and truncated JSON
 *     • Deeply nested arrays / objects
 *     • Wrong member types ("year": [], "value": "10")
 *     • Huge and fractional years, NaN-producing exponents ("1e999")
 *     • UTF-8 and escaped strings in labels
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>

#include "mktlens/customer_table.hpp"
#include "mktlens/data_loader.hpp"

using namespace mktlens;
using namespace mktlens::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    LoadStats stats;
    const auto dataset = DatasetLoader::parse_json_string(input, &stats);

    if (dataset.has_value()) {
        for (const auto* records : {&dataset->value_records, &dataset->volume_records}) {
            // Invariant 2b
            assert(records->size() <= size);
            for (const auto& r : *records) {
                // Invariant 2a
                assert(DatasetLoader::validate_record(r));
                assert(std::isfinite(r.value));
            }
        }
        // Invariant 2c
        assert(dataset->identity != 0);
        assert(stats.value_records == dataset->value_records.size());
        assert(stats.volume_records == dataset->volume_records.size());
    }

    const auto table = customers::CustomerTable::parse_json_string(input);
    if (table.has_value()) {
        for (const auto& row : table->rows()) {
            // Invariant 3
            bool any = false;
            for (const auto& kv : row.cells) {
                const auto* s = std::get_if<std::string>(&kv.second);
                any = any || !s || !s->empty();
            }
            assert(any);
        }
        (void)table->filter_options();
    }

    return 0;
}
