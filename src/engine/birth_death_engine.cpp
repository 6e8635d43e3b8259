/// @file src/engine/birth_death_engine.cpp
/// @brief Birth-Death Engine — event loop and bounded acceptance retry.

#include "divsim/engine.hpp"
#include "divsim/error.hpp"

#include <fmt/core.h>

#include <cmath>
#include <limits>
#include <utility>

namespace divsim {

namespace {

constexpr double NEVER = std::numeric_limits<double>::infinity();

} // namespace

// ─── BirthDeathEngine constructor ─────────────────────────────────────────────

BirthDeathEngine::BirthDeathEngine(SimulationConfig config)
    : config_(validated(std::move(config)))
    , speciation_(make_clock(config_.speciation, config_.t_max))
    , extinction_(make_clock(config_.extinction, config_.t_max))
    , sampler_(config_.solver)
{}

// ─── BirthDeathEngine::validated ──────────────────────────────────────────────

SimulationConfig BirthDeathEngine::validated(SimulationConfig config) {
    if (config.n0 == 0) {
        throw DivsimError(ErrorCode::InvalidArgument, "n0 must be at least 1");
    }
    if (!std::isfinite(config.t_max) || config.t_max <= 0.0) {
        throw DivsimError(ErrorCode::InvalidArgument,
                          fmt::format("tMax must be finite and positive, got {}",
                                      config.t_max));
    }
    if (config.n_final.min > config.n_final.max) {
        throw DivsimError(ErrorCode::InvalidArgument,
                          fmt::format("nFinal interval [{}, {}] is empty",
                                      config.n_final.min, config.n_final.max));
    }
    if (config.n_extant.min > config.n_extant.max) {
        throw DivsimError(ErrorCode::InvalidArgument,
                          fmt::format("nExtant interval [{}, {}] is empty",
                                      config.n_extant.min, config.n_extant.max));
    }
    if (config.max_attempts == 0) {
        throw DivsimError(ErrorCode::InvalidArgument, "max_attempts must be at least 1");
    }
    return config;
}

// ─── BirthDeathEngine::make_clock ─────────────────────────────────────────────

EventClock BirthDeathEngine::make_clock(const RateInput& input, double t_max) {
    Rate rate = RateBuilder::build(input.spec, t_max, input.environment, input.shifts);
    if (!input.shape) {
        return EventClock{std::move(rate), std::nullopt};
    }

    // With a shape the rate is a Weibull scale and must be strictly positive.
    if (const auto scale = rate.constant_value(); scale && *scale <= 0.0) {
        throw DivsimError(ErrorCode::InvalidRate,
                          fmt::format("Weibull scale must be > 0, got {}", *scale));
    }

    Rate shape = RateBuilder::build(*input.shape, t_max);
    validate_shape(shape, t_max);
    return EventClock{std::move(rate), std::move(shape)};
}

// ─── BirthDeathEngine::validate_shape ─────────────────────────────────────────

void BirthDeathEngine::validate_shape(const Rate& shape, double t_max) {
    auto check = [](double k, double t) {
        if (!std::isfinite(k)) {
            throw DivsimError(ErrorCode::InvalidRate,
                              fmt::format("shape evaluated to {} at t = {}", k, t));
        }
        if (k < constants::MIN_WEIBULL_SHAPE) {
            throw DivsimError(ErrorCode::DegenerateShape,
                              fmt::format("shape {} at t = {} is below {}",
                                          k, t, constants::MIN_WEIBULL_SHAPE));
        }
    };

    if (const auto k = shape.constant_value()) {
        check(*k, 0.0);
        return;
    }

    constexpr std::size_t N = constants::SHAPE_PROBE_POINTS;
    for (std::size_t i = 0; i < N; ++i) {
        const double t = t_max * static_cast<double>(i) / static_cast<double>(N - 1);
        check(shape(t), t);
    }
}

// ─── BirthDeathEngine::next_event ─────────────────────────────────────────────

double BirthDeathEngine::next_event(const EventClock& clock, double now,
                                    double birth, double end,
                                    std::mt19937_64& rng) const {
    const auto wait = sampler_.sample(clock, now, now - birth, end, rng);
    if (!wait) {
        return NEVER;
    }
    const double t = now + *wait;
    return t < end ? t : NEVER;
}

// ─── BirthDeathEngine::run_once ───────────────────────────────────────────────

std::optional<SimulationRecord>
BirthDeathEngine::run_once(std::mt19937_64& rng) const {
    const double t_max = config_.t_max;

    if (config_.n0 > config_.n_final.max) {
        return std::nullopt;
    }

    SimulationRecord record;
    record.t_max = t_max;
    record.lineages.reserve(config_.n0);

    std::vector<LiveLineage> living;
    living.reserve(config_.n0);

    for (std::size_t i = 0; i < config_.n0; ++i) {
        record.lineages.push_back(Lineage{
            .birth  = 0.0,
            .death  = std::nullopt,
            .parent = std::nullopt,
            .extant = false,
        });
        const double spec = next_event(speciation_, 0.0, 0.0, t_max, rng);
        const double ext  = next_event(extinction_, 0.0, 0.0, t_max, rng);
        living.push_back(LiveLineage{i, spec, ext});
    }

    while (!living.empty()) {
        // ── Earliest pending event across the living set ─────────────────────
        std::size_t firing = living.size();
        double      now = NEVER;
        bool        is_speciation = false;
        for (std::size_t k = 0; k < living.size(); ++k) {
            if (living[k].next_speciation < now) {
                now = living[k].next_speciation;
                firing = k;
                is_speciation = true;
            }
            if (living[k].next_extinction < now) {
                now = living[k].next_extinction;
                firing = k;
                is_speciation = false;
            }
        }

        if (firing == living.size()) {
            break;  // nothing else happens before t_max
        }

        const LineageId id = living[firing].id;

        if (is_speciation) {
            const LineageId child = record.lineages.size();
            record.lineages.push_back(Lineage{
                .birth  = now,
                .death  = std::nullopt,
                .parent = id,
                .extant = false,
            });
            if (record.lineages.size() > config_.n_final.max) {
                return std::nullopt;
            }

            living[firing].next_speciation =
                next_event(speciation_, now, record.lineages[id].birth, t_max, rng);

            const double spec = next_event(speciation_, now, now, t_max, rng);
            const double ext  = next_event(extinction_, now, now, t_max, rng);
            living.push_back(LiveLineage{child, spec, ext});
        } else {
            record.lineages[id].death = now;
            living[firing] = living.back();
            living.pop_back();
        }
    }

    for (const LiveLineage& l : living) {
        record.lineages[l.id].extant = true;
    }
    if (config_.report_true_extinction) {
        resolve_survivors(record, living, rng);
    }

    return record;
}

// ─── BirthDeathEngine::resolve_survivors ──────────────────────────────────────

void BirthDeathEngine::resolve_survivors(SimulationRecord& record,
                                         const std::vector<LiveLineage>& living,
                                         std::mt19937_64& rng) const {
    const double t_max = config_.t_max;
    const double end = t_max * (1.0 + constants::TRUE_EXTINCTION_HORIZON_FACTOR);

    for (const LiveLineage& l : living) {
        Lineage& lineage = record.lineages[l.id];
        lineage.death = next_event(extinction_, t_max, lineage.birth, end, rng);
    }
}

// ─── BirthDeathEngine::run ────────────────────────────────────────────────────

SimulationOutcome BirthDeathEngine::run(std::mt19937_64& rng) const {
    const bool verbose = config_.verbose;

    auto outcome = bounded_retry<SimulationRecord>(
        config_.max_attempts,
        [&](std::size_t attempt) {
            auto record = run_once(rng);
            if (!record && verbose) {
                fmt::print(stderr,
                           "[divsim] attempt {}: abandoned, more than {} lineages\n",
                           attempt + 1, config_.n_final.max);
            }
            return record;
        },
        [&](const SimulationRecord& record) {
            const std::size_t total  = record.total_count();
            const std::size_t extant = record.extant_count();
            const bool ok = config_.n_final.contains(total)
                         && config_.n_extant.contains(extant);
            if (verbose) {
                fmt::print(stderr, "[divsim] attempt: total={} extant={} -> {}\n",
                           total, extant, ok ? "accepted" : "rejected");
            }
            return ok;
        });

    if (verbose) {
        if (const auto* cap = std::get_if<RetryCapExceeded>(&outcome)) {
            fmt::print(stderr,
                       "[divsim] no run satisfied the constraints in {} attempts\n",
                       cap->attempts);
        }
    }

    return outcome;
}

} // namespace divsim
