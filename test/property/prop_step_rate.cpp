/**
 * @file  prop_step_rate.cpp
 * @brief Property: step-vector rates pick the level of the greatest shift ≤ t,
 *        and descending shift times describe the same function.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_step_rate
 *
 * Construction:
 *   n levels in [0, 1), shift times s_0 = 0 < s_1 < ... < s_{n−1} < tMax
 *   built from positive integer gaps. The same function expressed as
 *   time before present is the sequence tMax − s_i in descending order.
 */

#include <rapidcheck.h>
#include <cmath>
#include <vector>

#include "divsim/rate.hpp"

using namespace divsim;

namespace {

struct StepCase {
    double              t_max;
    std::vector<double> levels;
    std::vector<double> shifts;
};

StepCase make_case(const std::vector<unsigned>& gaps, const std::vector<unsigned>& raw_levels) {
    StepCase c;
    double t = 0.0;
    for (std::size_t i = 0; i < gaps.size(); ++i) {
        c.shifts.push_back(t);
        c.levels.push_back(static_cast<double>(raw_levels[i] % 1000) / 1000.0);
        t += 1.0 + static_cast<double>(gaps[i] % 50);
    }
    c.t_max = t;
    return c;
}

} // namespace

int main() {
    // ── Property 1: value is the level of the greatest shift ≤ t ─────────────
    rc::check(
        "step_rate: r(t) equals the level of the last shift at or before t",
        [](const std::vector<unsigned>& gaps, unsigned raw_query) {
            RC_PRE(!gaps.empty());
            const StepCase c = make_case(gaps, gaps);
            const Rate r = RateBuilder::build(StepRate{c.levels}, c.t_max, nullptr, c.shifts);

            const double t = c.t_max * static_cast<double>(raw_query % 10001) / 10000.0;
            std::size_t expected = 0;
            for (std::size_t i = 0; i < c.shifts.size(); ++i) {
                if (c.shifts[i] <= t) expected = i;
            }
            RC_ASSERT(r(t) == c.levels[expected]);
        }
    );

    // ── Property 2: descending input is reflected to the same function ───────
    rc::check(
        "step_rate: descending shifts give the same function after reflection",
        [](const std::vector<unsigned>& gaps, const std::vector<unsigned>& raw_levels) {
            RC_PRE(gaps.size() >= 2);
            RC_PRE(raw_levels.size() >= gaps.size());
            const StepCase c = make_case(gaps, raw_levels);

            std::vector<double> before_present;
            for (const double s : c.shifts) {
                before_present.push_back(c.t_max - s);
            }

            const Rate ascending  = RateBuilder::build(StepRate{c.levels}, c.t_max, nullptr, c.shifts);
            const Rate descending = RateBuilder::build(StepRate{c.levels}, c.t_max, nullptr, before_present);

            for (int k = 0; k <= 200; ++k) {
                const double t = c.t_max * static_cast<double>(k) / 200.0;
                RC_ASSERT(ascending(t) == descending(t));
            }
        }
    );

    // ── Property 3: values are always non-negative and finite ────────────────
    rc::check(
        "step_rate: every evaluation is finite and >= 0",
        [](const std::vector<unsigned>& gaps, double query) {
            RC_PRE(!gaps.empty());
            RC_PRE(std::isfinite(query));
            const StepCase c = make_case(gaps, gaps);
            const Rate r = RateBuilder::build(StepRate{c.levels}, c.t_max, nullptr, c.shifts);
            const double v = r(query);
            RC_ASSERT(std::isfinite(v));
            RC_ASSERT(v >= 0.0);
        }
    );

    return 0;
}
