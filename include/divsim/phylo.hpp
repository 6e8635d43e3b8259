#pragma once
/**
 * @file  phylo.hpp
 * @brief Record ⇄ phylogeny conversion and Newick output.
 *
 * Module:  src/phylo/
 *
 * Responsibility
 * --------------
 * Turn a SimulationRecord into a dated rooted forest and back.
 *
 *   make_phylo       record → forest
 *   phylo_to_record  forest + parent vector + extant flags → record
 *   to_newick        forest → one Newick string per founder
 *
 * Forest layout
 * -------------
 *   • One root per founder, at the founder's birth time. A root has a single
 *     child; the edge to it is the founder's root edge.
 *   • One internal node per speciation event, at the daughter's birth time.
 *     Its two children continue the parent lineage and start the daughter.
 *   • One tip per lineage, at its death time, or at t_max if extant.
 *
 * The tree alone does not say which branch of a split continues the
 * parent; that is why the inverse takes the parent vector. A lineage's
 * birth is then the time of the MRCA of its tip and its parent's tip.
 *
 * Limitations
 * -----------
 *   • Extant tips sit at t_max, so a true extinction time after the present
 *     is not representable; `phylo_to_record` censors extant deaths.
 */

#include "divsim/record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace divsim::phylo {

/// Node of the dated forest.
struct PhyloNode {
    std::optional<std::size_t> parent;    ///< empty for roots
    std::vector<std::size_t>   children;
    double                     time;      ///< clade-relative time of the node
    std::optional<LineageId>   lineage;   ///< set on tips only
};

/// Dated rooted forest built from a simulation record.
struct Phylogeny {
    double                   t_max = 0.0;
    std::vector<PhyloNode>   nodes;
    std::vector<std::size_t> roots;  ///< one per founder, in founder order
    std::vector<std::size_t> tips;   ///< tips[i] is the tip of lineage i

    /// Length of the edge above `node` (0 for roots).
    [[nodiscard]] double branch_length(std::size_t node) const noexcept;

    [[nodiscard]] std::size_t num_tips() const noexcept { return tips.size(); }

    /// Index of the root whose component contains `node`.
    [[nodiscard]] std::size_t root_of(std::size_t node) const noexcept;

    /// Most recent common ancestor of two nodes, `nullopt` if they lie in
    /// different components.
    [[nodiscard]] std::optional<std::size_t>
    mrca(std::size_t a, std::size_t b) const;

    /// One Newick string per root, separated by newlines. Tips are labelled
    /// `t<lineage + 1>`; the outermost length is the root edge.
    [[nodiscard]] std::string to_newick() const;
};

/// Build the forest of a record.
///
/// # Returns
/// `nullopt` if the record is not consistent (see SimulationRecord).
[[nodiscard]] std::optional<Phylogeny> make_phylo(const SimulationRecord& record);

/// Rebuild a record from a forest plus parentage and status.
///
/// # Returns
/// `nullopt` if the vector sizes differ from the number of tips, a parent
/// index is out of range, or a lineage and its parent lie in different
/// components.
[[nodiscard]] std::optional<SimulationRecord>
phylo_to_record(const Phylogeny& tree,
                const std::vector<std::optional<LineageId>>& parents,
                const std::vector<bool>& extant);

} // namespace divsim::phylo
