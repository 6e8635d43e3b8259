/**
 * @file  fuzz_environment_loader.cpp
 * @brief libFuzzer target for EnvironmentLoader::parse_csv_string
 *
 * Build:
 *   cmake -DDIVSIM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_environment_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_environment_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If a table is returned:
 *      a. it has at least one row
 *      b. times are finite and strictly ascending
 *      c. values are finite
 *      d. at() stays within [min value, max value] for any finite query
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "divsim/data_loader.hpp"

using namespace divsim;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto table = EnvironmentLoader::parse_csv_string(input);
    if (!table) {
        return 0;
    }

    assert(table->size() >= 1);

    const auto times  = table->times();
    const auto values = table->values();
    for (std::size_t i = 0; i < table->size(); ++i) {
        assert(std::isfinite(times[i]));
        assert(std::isfinite(values[i]));
        if (i > 0) {
            assert(times[i] > times[i - 1]);
        }
    }

    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    for (const double q : {table->start_time() - 1.0, table->start_time(),
                           0.5 * (table->start_time() + table->end_time()),
                           table->end_time(), table->end_time() + 1.0}) {
        if (!std::isfinite(q)) continue;
        const double v = table->at(q);
        assert(v >= *lo - 1e-9 * std::abs(*lo) && v <= *hi + 1e-9 * std::abs(*hi));
        (void)v;
    }
    (void)lo;
    (void)hi;

    return 0;
}
