/// @file src/record/record.cpp
/// @brief SimulationRecord queries, time reversal and CSV output.

#include "divsim/record.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace divsim {

// ─── SimulationRecord::extant_count ───────────────────────────────────────────

std::size_t SimulationRecord::extant_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(lineages.begin(), lineages.end(),
                      [](const Lineage& l) { return l.extant; }));
}

// ─── SimulationRecord::is_consistent ──────────────────────────────────────────

bool SimulationRecord::is_consistent() const noexcept {
    for (std::size_t i = 0; i < lineages.size(); ++i) {
        const Lineage& l = lineages[i];

        if (!std::isfinite(l.birth) || l.birth < 0.0 || l.birth > t_max) {
            return false;
        }

        if (l.death) {
            if (std::isnan(*l.death) || *l.death < l.birth) return false;
            if (!l.extant && *l.death > t_max) return false;
            if (l.extant && *l.death < t_max) return false;
        } else if (!l.extant) {
            return false;  // an extinct lineage must know when it died
        }

        if (l.parent) {
            if (*l.parent >= i) return false;
            const Lineage& p = lineages[*l.parent];
            if (p.birth > l.birth) return false;
            if (p.death && *p.death < l.birth) return false;
        }
    }
    return true;
}

// ─── SimulationRecord::to_time_before_present ─────────────────────────────────

SimulationRecord SimulationRecord::to_time_before_present() const {
    SimulationRecord out;
    out.t_max = t_max;
    out.lineages.reserve(lineages.size());
    for (const Lineage& l : lineages) {
        Lineage r = l;
        r.birth = t_max - l.birth;
        // A survivor that never dies within the followed horizon is censored.
        if (l.death && std::isfinite(*l.death)) {
            r.death = t_max - *l.death;
        } else {
            r.death = std::nullopt;
        }
        out.lineages.push_back(r);
    }
    return out;
}

// ─── SimulationRecord::to_csv ─────────────────────────────────────────────────

std::string SimulationRecord::to_csv() const {
    std::string out = "lineage,parent,birth,death,extant\n";
    auto it = std::back_inserter(out);
    for (std::size_t i = 0; i < lineages.size(); ++i) {
        const Lineage& l = lineages[i];
        const std::string parent = l.parent ? std::to_string(*l.parent + 1) : "NA";
        const std::string death  = l.death && std::isfinite(*l.death)
                                 ? fmt::format("{}", *l.death) : "NA";
        fmt::format_to(it, "{},{},{},{},{}\n",
                       i + 1, parent, l.birth, death, l.extant ? "TRUE" : "FALSE");
    }
    return out;
}

} // namespace divsim
