/**
 * @file  phylo.cpp
 * @brief Record ⇄ forest conversion and iterative Newick serialization.
 *
 * See phylo.hpp for the forest layout.
 */

#include "divsim/phylo.hpp"

#include <fmt/format.h>

#include <iterator>
#include <stack>
#include <utility>

namespace divsim::phylo {

namespace {

std::size_t add_node(Phylogeny& tree, std::optional<std::size_t> parent,
                     double time, std::optional<LineageId> lineage) {
    const std::size_t idx = tree.nodes.size();
    tree.nodes.push_back(PhyloNode{
        .parent   = parent,
        .children = {},
        .time     = time,
        .lineage  = lineage,
    });
    if (parent) {
        tree.nodes[*parent].children.push_back(idx);
    }
    return idx;
}

} // namespace

// ── Phylogeny queries ─────────────────────────────────────────────────────────

double Phylogeny::branch_length(std::size_t node) const noexcept {
    const PhyloNode& n = nodes[node];
    if (!n.parent) {
        return 0.0;
    }
    return n.time - nodes[*n.parent].time;
}

std::size_t Phylogeny::root_of(std::size_t node) const noexcept {
    while (nodes[node].parent) {
        node = *nodes[node].parent;
    }
    return node;
}

std::optional<std::size_t> Phylogeny::mrca(std::size_t a, std::size_t b) const {
    std::vector<char> on_path(nodes.size(), 0);
    for (std::optional<std::size_t> n = a; n; n = nodes[*n].parent) {
        on_path[*n] = 1;
    }
    for (std::optional<std::size_t> n = b; n; n = nodes[*n].parent) {
        if (on_path[*n]) {
            return *n;
        }
    }
    return std::nullopt;
}

// ── make_phylo ────────────────────────────────────────────────────────────────

std::optional<Phylogeny> make_phylo(const SimulationRecord& record) {
    if (!record.is_consistent()) {
        return std::nullopt;
    }

    const std::size_t n = record.lineages.size();

    // Records are in event order, so each daughter list is birth-sorted.
    std::vector<std::vector<LineageId>> daughters(n);
    for (LineageId i = 0; i < n; ++i) {
        if (const auto p = record.lineages[i].parent) {
            daughters[*p].push_back(i);
        }
    }

    Phylogeny tree;
    tree.t_max = record.t_max;
    tree.tips.assign(n, 0);
    tree.nodes.reserve(3 * n);

    // (lineage, node its path hangs from)
    std::stack<std::pair<LineageId, std::size_t>> pending;
    for (LineageId i = 0; i < n; ++i) {
        if (!record.lineages[i].parent) {
            const std::size_t root = add_node(tree, std::nullopt, record.lineages[i].birth,
                                              std::nullopt);
            tree.roots.push_back(root);
            pending.emplace(i, root);
        }
    }

    while (!pending.empty()) {
        const auto [lineage, attach] = pending.top();
        pending.pop();

        // Walk down the lineage, splitting off one node per daughter.
        std::size_t current = attach;
        for (const LineageId d : daughters[lineage]) {
            const std::size_t split = add_node(tree, current, record.lineages[d].birth,
                                               std::nullopt);
            pending.emplace(d, split);
            current = split;
        }

        const Lineage& l = record.lineages[lineage];
        const double tip_time = l.extant ? record.t_max : *l.death;
        tree.tips[lineage] = add_node(tree, current, tip_time, lineage);
    }

    return tree;
}

// ── phylo_to_record ───────────────────────────────────────────────────────────

std::optional<SimulationRecord>
phylo_to_record(const Phylogeny& tree,
                const std::vector<std::optional<LineageId>>& parents,
                const std::vector<bool>& extant) {
    const std::size_t n = tree.tips.size();
    if (parents.size() != n || extant.size() != n) {
        return std::nullopt;
    }

    SimulationRecord record;
    record.t_max = tree.t_max;
    record.lineages.reserve(n);

    for (LineageId i = 0; i < n; ++i) {
        const std::size_t tip = tree.tips[i];

        double birth = 0.0;
        if (const auto p = parents[i]) {
            if (*p >= n) {
                return std::nullopt;
            }
            const auto split = tree.mrca(tip, tree.tips[*p]);
            if (!split) {
                return std::nullopt;
            }
            birth = tree.nodes[*split].time;
        } else {
            birth = tree.nodes[tree.root_of(tip)].time;
        }

        record.lineages.push_back(Lineage{
            .birth  = birth,
            .death  = extant[i] ? std::nullopt : std::optional<double>(tree.nodes[tip].time),
            .parent = parents[i],
            .extant = extant[i],
        });
    }

    return record;
}

// ── Phylogeny::to_newick ──────────────────────────────────────────────────────

std::string Phylogeny::to_newick() const {
    std::string result;
    result.reserve(nodes.size() * 24);

    // state: 0 = start, 1 = emitting children, 2 = emit label and length
    struct StackEntry {
        std::size_t node;
        std::size_t child_idx;
        int         state;
    };

    for (std::size_t r = 0; r < roots.size(); ++r) {
        if (r > 0) {
            result += '\n';
        }

        const PhyloNode& root = nodes[roots[r]];
        if (root.children.empty()) {
            result += ';';
            continue;
        }

        std::stack<StackEntry> stack;
        stack.push({root.children.front(), 0, 0});

        while (!stack.empty()) {
            auto& entry = stack.top();
            const PhyloNode& n = nodes[entry.node];

            if (entry.state == 0) {
                if (!n.children.empty()) {
                    result += '(';
                    entry.state = 1;
                } else {
                    entry.state = 2;
                }
            } else if (entry.state == 1) {
                if (entry.child_idx < n.children.size()) {
                    if (entry.child_idx > 0) {
                        result += ',';
                    }
                    const std::size_t child = n.children[entry.child_idx];
                    ++entry.child_idx;
                    stack.push({child, 0, 0});
                } else {
                    result += ')';
                    entry.state = 2;
                }
            } else {
                if (n.lineage) {
                    fmt::format_to(std::back_inserter(result), "t{}", *n.lineage + 1);
                }
                fmt::format_to(std::back_inserter(result), ":{}", branch_length(entry.node));
                stack.pop();
            }
        }

        result += ';';
    }

    return result;
}

} // namespace divsim::phylo
