#pragma once

/// @file include/divsim/engine.hpp
/// @brief Birth-Death Engine — public API.
///
/// # Module: Birth-Death Engine
///
/// ## Responsibility
/// Simulate a clade forward in time from `n0` founders under general
/// speciation and extinction clocks, and keep retrying until the final
/// lineage counts satisfy the acceptance intervals or the attempt cap is
/// reached.
///
/// ## Usage
/// ```cpp
/// SimulationConfig cfg;
/// cfg.t_max = 40.0;
/// cfg.speciation.spec = TimeRate{[](double t) { return 0.03 + 0.005 * t; }};
/// cfg.extinction.spec = ConstantRate{0.08};
/// cfg.n_final = CountRange{2, CountRange::unbounded()};
///
/// BirthDeathEngine engine(cfg);
/// std::mt19937_64 rng(42);
/// auto outcome = engine.run(rng);
/// if (const auto* rec = std::get_if<SimulationRecord>(&outcome)) { ... }
/// ```
///
/// ## One Attempt
/// Each living lineage holds a pending speciation and extinction time.
/// The earliest pending event before t_max fires:
///   - speciation: a daughter is appended and the parent's speciation
///     clock is redrawn from the event time;
///   - extinction: the lineage dies and leaves the living set.
/// Pending times of lineages that did not fire stay valid: the clocks are
/// independent and each draw is already conditioned on survival so far.
///
/// ## Guarantees
/// - Every construction error is thrown from the constructor
/// - `run` never loops more than `max_attempts` times
/// - `run` is const; concurrent runs need separate generators

#include "divsim/constants.hpp"
#include "divsim/environment.hpp"
#include "divsim/rate.hpp"
#include "divsim/record.hpp"
#include "divsim/waiting_time.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <variant>
#include <vector>

namespace divsim {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Inclusive interval of acceptable lineage counts.
struct CountRange {
    std::size_t min = 0;
    std::size_t max = std::numeric_limits<std::size_t>::max();

    [[nodiscard]] static constexpr std::size_t unbounded() noexcept {
        return std::numeric_limits<std::size_t>::max();
    }

    [[nodiscard]] constexpr bool contains(std::size_t n) const noexcept {
        return n >= min && n <= max;
    }
};

/// One rate together with everything needed to normalize it.
struct RateInput {
    RateSpec                                spec = ConstantRate{0.0};
    std::shared_ptr<const EnvironmentTable> environment;  ///< for EnvRate
    std::vector<double>                     shifts;       ///< for StepRate
    std::optional<RateSpec>                 shape;        ///< Weibull shape
};

/// Configuration for the birth-death engine.
struct SimulationConfig {
    /// Number of founding lineages.
    std::size_t n0 = 1;

    /// Simulation length, origin to present.
    double t_max = 1.0;

    /// Speciation rate (Weibull scale when a shape is set).
    RateInput speciation{};

    /// Extinction rate (Weibull scale when a shape is set).
    RateInput extinction{};

    /// Accepted total lineage count.
    CountRange n_final{};

    /// Accepted extant lineage count at t_max.
    CountRange n_extant{};

    /// If true, extant lineages get the extinction time their clock draws
    /// after t_max; otherwise their death time is censored.
    bool report_true_extinction = false;

    /// Attempt cap for the acceptance loop.
    std::size_t max_attempts = constants::MAX_ATTEMPTS;

    /// Effort limits of the numeric event solver.
    SolverBudget solver{};

    /// If true, emit per-attempt diagnostics to stderr.
    bool verbose = false;
};

// ─── Outcome ──────────────────────────────────────────────────────────────────

/// No attempt satisfied the acceptance intervals within the cap.
struct RetryCapExceeded {
    std::size_t attempts;
};

using SimulationOutcome = std::variant<SimulationRecord, RetryCapExceeded>;

// ─── bounded_retry ────────────────────────────────────────────────────────────

/// Call `attempt` until it yields a value `accept` approves, at most
/// `max_attempts` times. `attempt` returns `std::optional<T>`; an empty
/// optional is an attempt abandoned early.
template <typename T, typename Attempt, typename Accept>
[[nodiscard]] std::variant<T, RetryCapExceeded>
bounded_retry(std::size_t max_attempts, Attempt&& attempt, Accept&& accept) {
    for (std::size_t i = 0; i < max_attempts; ++i) {
        std::optional<T> candidate = attempt(i);
        if (candidate && accept(*candidate)) {
            return std::move(*candidate);
        }
    }
    return RetryCapExceeded{max_attempts};
}

// ─── BirthDeathEngine ─────────────────────────────────────────────────────────

class BirthDeathEngine {
public:
    /// Normalize all rates and shapes and validate the configuration.
    ///
    /// # Throws
    /// `DivsimError` for any construction error (bad rate specification,
    /// degenerate shape, n0 = 0, non-positive t_max, empty interval,
    /// zero attempt cap).
    explicit BirthDeathEngine(SimulationConfig config);

    /// Simulate until the acceptance intervals are met or the cap is hit.
    ///
    /// # Throws
    /// `DivsimError` with InvalidRate, DegenerateShape or NonConvergence if
    /// a rate misbehaves while being sampled; the run is abandoned.
    [[nodiscard]] SimulationOutcome run(std::mt19937_64& rng) const;

    /// A single unconstrained attempt. Returns `nullopt` only when the
    /// total count exceeds `n_final.max` and the attempt is cut short.
    [[nodiscard]] std::optional<SimulationRecord>
    run_once(std::mt19937_64& rng) const;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }
    [[nodiscard]] const EventClock& speciation_clock() const noexcept { return speciation_; }
    [[nodiscard]] const EventClock& extinction_clock() const noexcept { return extinction_; }

private:
    /// Pending events of one living lineage.
    struct LiveLineage {
        LineageId id;
        double    next_speciation;  ///< absolute time, +∞ if none before t_max
        double    next_extinction;  ///< absolute time, +∞ if none before t_max
    };

    [[nodiscard]] static SimulationConfig validated(SimulationConfig config);

    [[nodiscard]] static EventClock
    make_clock(const RateInput& input, double t_max);

    static void validate_shape(const Rate& shape, double t_max);

    /// Absolute time of the next event of `clock` after `now`, or +∞.
    [[nodiscard]] double next_event(const EventClock& clock, double now,
                                    double birth, double end,
                                    std::mt19937_64& rng) const;

    /// Death times of survivors under true-extinction reporting.
    void resolve_survivors(SimulationRecord& record,
                           const std::vector<LiveLineage>& living,
                           std::mt19937_64& rng) const;

    SimulationConfig   config_;
    EventClock         speciation_;
    EventClock         extinction_;
    WaitingTimeSampler sampler_;
};

} // namespace divsim
