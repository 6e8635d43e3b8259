#pragma once

/// @file include/divsim/record.hpp
/// @brief Simulation Record — every lineage a run ever produced.
///
/// # Module: Simulation Record
///
/// ## Responsibility
/// Hold, per lineage, its birth time, death time, parent and extant flag.
/// This is the contract shared with the tree-conversion code in both
/// directions.
///
/// ## Time Convention
/// Times are clade-relative: 0 is the origin, `t_max` the present.
/// `to_time_before_present()` re-expresses them with the origin at `t_max`
/// and the present at 0, the convention of published phylogenies.
///
/// ## Invariants (checked by `is_consistent`)
/// - birth ∈ [0, t_max]
/// - death, when recorded, ≥ birth
/// - extinct lineages have a death ≤ t_max; extant ones none before t_max
/// - a parent precedes its child and was born no later than it

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace divsim {

/// Index of a lineage in `SimulationRecord::lineages`.
using LineageId = std::size_t;

/// One species lineage.
struct Lineage {
    double                   birth;   ///< Speciation (or founding) time
    std::optional<double>    death;   ///< Extinction time; empty = censored, +inf = never
    std::optional<LineageId> parent;  ///< Empty for founders
    bool                     extant;  ///< Alive at t_max
};

/// Output of one accepted simulation run.
struct SimulationRecord {
    double               t_max = 0.0;
    std::vector<Lineage> lineages;

    /// Total number of lineages, living or dead.
    [[nodiscard]] std::size_t total_count() const noexcept { return lineages.size(); }

    /// Number of lineages alive at t_max.
    [[nodiscard]] std::size_t extant_count() const noexcept;

    /// True if every invariant listed in the file header holds.
    [[nodiscard]] bool is_consistent() const noexcept;

    /// Copy with every time t replaced by t_max − t. An infinite death
    /// becomes censored.
    [[nodiscard]] SimulationRecord to_time_before_present() const;

    /// CSV with header `lineage,parent,birth,death,extant`. Ids are 1-based,
    /// missing parents, censored and infinite deaths are written as `NA`.
    [[nodiscard]] std::string to_csv() const;
};

} // namespace divsim
