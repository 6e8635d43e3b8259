/**
 * @file  prop_record_invariants.cpp
 * @brief Property: every engine run yields a consistent record whose
 *        phylogeny converts back to the same record.
 *
 * Run with 1,000 random inputs:
 *   RC_PARAMS="max_success=1000" ./prop_record_invariants
 *
 * Invariants checked per run:
 *   1. birth ∈ [0, tMax]; death ≥ birth; extinct ⇒ death ≤ tMax
 *   2. parents precede and outlive the birth of their daughters
 *   3. founders are exactly the first n0 lineages
 *   4. make_phylo ∘ phylo_to_record is the identity on the record
 */

#include <rapidcheck.h>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "divsim/engine.hpp"
#include "divsim/phylo.hpp"

using namespace divsim;

int main() {
    rc::check(
        "record_invariants: engine output is consistent and round-trips through a phylogeny",
        [](unsigned raw_n0, unsigned raw_lambda, unsigned raw_mu, std::uint64_t seed) {
            SimulationConfig cfg;
            cfg.n0    = 1 + raw_n0 % 4;
            cfg.t_max = 5.0;
            cfg.speciation.spec = ConstantRate{static_cast<double>(raw_lambda % 60) / 100.0};
            cfg.extinction.spec = ConstantRate{static_cast<double>(raw_mu % 60) / 100.0};
            cfg.n_final = CountRange{0, 3000};

            BirthDeathEngine engine(cfg);
            std::mt19937_64 rng(seed);
            const auto rec = engine.run_once(rng);
            RC_PRE(rec.has_value());

            RC_ASSERT(rec->is_consistent());
            for (std::size_t i = 0; i < rec->total_count(); ++i) {
                RC_ASSERT(rec->lineages[i].parent.has_value() == (i >= cfg.n0));
            }

            const auto tree = phylo::make_phylo(*rec);
            RC_ASSERT(tree.has_value());

            std::vector<std::optional<LineageId>> parents;
            std::vector<bool> extant;
            for (const Lineage& l : rec->lineages) {
                parents.push_back(l.parent);
                extant.push_back(l.extant);
            }
            const auto back = phylo::phylo_to_record(*tree, parents, extant);
            RC_ASSERT(back.has_value());
            RC_ASSERT(back->total_count() == rec->total_count());
            for (std::size_t i = 0; i < rec->total_count(); ++i) {
                RC_ASSERT(back->lineages[i].birth == rec->lineages[i].birth);
                RC_ASSERT(back->lineages[i].death == rec->lineages[i].death);
            }
        }
    );

    rc::check(
        "record_invariants: time before present maps [0, tMax] onto itself reversed",
        [](unsigned raw_lambda, std::uint64_t seed) {
            SimulationConfig cfg;
            cfg.t_max = 3.0;
            cfg.speciation.spec = ConstantRate{static_cast<double>(raw_lambda % 80) / 100.0};
            cfg.extinction.spec = ConstantRate{0.2};
            cfg.n_final = CountRange{0, 3000};

            BirthDeathEngine engine(cfg);
            std::mt19937_64 rng(seed);
            const auto rec = engine.run_once(rng);
            RC_PRE(rec.has_value());

            const auto rev = rec->to_time_before_present();
            for (std::size_t i = 0; i < rec->total_count(); ++i) {
                RC_ASSERT(rev.lineages[i].birth == cfg.t_max - rec->lineages[i].birth);
                RC_ASSERT(rev.lineages[i].birth >= 0.0);
                RC_ASSERT(rev.lineages[i].birth <= cfg.t_max);
            }
        }
    );

    return 0;
}
