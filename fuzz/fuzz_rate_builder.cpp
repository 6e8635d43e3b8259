/**
 * @file  fuzz_rate_builder.cpp
 * @brief libFuzzer target for RateBuilder step vectors and the sampler
 *
 * Build:
 *   cmake -DDIVSIM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_rate_builder
 *
 * Run for 60 seconds:
 *   ./fuzz_rate_builder -max_total_time=60
 *
 * Input layout:
 *   byte 0        number of levels n (mod 16, at least 1)
 *   next 8 bytes  tMax (raw double)
 *   then n raw doubles for the levels, n raw doubles for the shift times,
 *   and one raw double used as the unit exponential draw.
 *
 * Safety invariants verified on every input:
 *   1. build() either returns a Rate or throws DivsimError, nothing else.
 *   2. A built rate evaluates finite and >= 0 on [0, tMax].
 *   3. The sampler either returns a wait inside the horizon, no event,
 *      or throws DivsimError.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "divsim/error.hpp"
#include "divsim/rate.hpp"
#include "divsim/waiting_time.hpp"

using namespace divsim;

namespace {

bool read_double(const uint8_t*& data, size_t& size, double& out) {
    if (size < sizeof(double)) return false;
    std::memcpy(&out, data, sizeof(double));
    data += sizeof(double);
    size -= sizeof(double);
    return true;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) return 0;
    const std::size_t n = 1 + (data[0] % 16);
    ++data;
    --size;

    double t_max = 0.0;
    if (!read_double(data, size, t_max)) return 0;

    std::vector<double> levels(n);
    std::vector<double> shifts(n);
    for (double& v : levels) if (!read_double(data, size, v)) return 0;
    for (double& s : shifts) if (!read_double(data, size, s)) return 0;

    double draw = 1.0;
    (void)read_double(data, size, draw);

    try {
        const Rate rate = RateBuilder::build(StepRate{levels}, t_max, nullptr, shifts);

        for (int k = 0; k <= 16; ++k) {
            const double t = t_max * static_cast<double>(k) / 16.0;
            const double v = rate(t);
            assert(std::isfinite(v) && v >= 0.0);
            (void)v;
        }

        if (std::isfinite(draw) && draw >= 0.0) {
            WaitingTimeSampler sampler;
            const auto wait = sampler.wait_for_draw(EventClock{rate, std::nullopt},
                                                    0.0, 0.0, t_max, draw);
            if (wait) {
                assert(*wait >= 0.0 && *wait < t_max);
            }
        }
    } catch (const DivsimError&) {
        // Rejected input.
    }

    return 0;
}
