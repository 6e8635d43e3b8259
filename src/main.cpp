/// @file src/main.cpp
/// @brief divsim CLI entry point.
///
/// Usage:
///   divsim --simulate [options]   Run the birth-death engine, print the record
///   divsim --help                 Print usage

#include "divsim/cli_args.hpp"
#include "divsim/engine.hpp"
#include "divsim/error.hpp"
#include "divsim/phylo.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <variant>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  divsim --simulate [options]   Simulate a clade and print its record\n"
        "  divsim --help                 Show this help\n"
        "\n"
        "Options:\n"
        "  --n0 <n>                  Founding lineages (default 1)\n"
        "  --tmax <t>                Simulation length (required)\n"
        "  --lambda <r[,r...]>       Speciation rate, or step levels\n"
        "  --mu <r[,r...]>           Extinction rate, or step levels\n"
        "  --lshifts <t,t,...>       Speciation shift times\n"
        "  --mshifts <t,t,...>       Extinction shift times\n"
        "  --lshape <k>              Weibull shape for speciation\n"
        "  --mshape <k>              Weibull shape for extinction\n"
        "  --lenv <csv>              Environment table for speciation (not with --lambda)\n"
        "  --menv <csv>              Environment table for extinction (not with --mu)\n"
        "  --lenv-coef <a,b>         Speciation = a*exp(b*env)\n"
        "  --menv-coef <a,b>         Extinction = a*exp(b*env)\n"
        "  --nfinal <min,max>        Accepted total count (max may be inf)\n"
        "  --nextant <min,max>       Accepted extant count\n"
        "  --true-ext                Report true extinction times of survivors\n"
        "  --max-attempts <n>        Attempt cap (default 100000)\n"
        "  --seed <n>                Random seed (default: random device)\n"
        "  --newick                  Also print the phylogeny in Newick form\n"
        "  --verbose                 Per-attempt diagnostics on stderr\n"
        "\n"
        "Times in the output run from tmax (origin) to 0 (present).\n"
    );
}

/// Run the engine and print the outcome.
/// Returns 0 on success, 1 on error, 2 if the retry cap was reached.
int run_simulation(divsim::SimulationConfig config, std::uint64_t seed, bool newick) {
    try {
        divsim::BirthDeathEngine engine(std::move(config));
        std::mt19937_64 rng(seed);

        auto outcome = engine.run(rng);
        if (const auto* cap = std::get_if<divsim::RetryCapExceeded>(&outcome)) {
            fmt::print(stderr,
                       "Error: constraints not satisfied after {} attempts\n",
                       cap->attempts);
            return 2;
        }

        const auto& record = std::get<divsim::SimulationRecord>(outcome);
        fmt::print(stderr, "Simulated {} lineages, {} extant (seed {})\n",
                   record.total_count(), record.extant_count(), seed);
        fmt::print("{}", record.to_time_before_present().to_csv());

        if (newick) {
            if (auto tree = divsim::phylo::make_phylo(record)) {
                fmt::print("{}\n", tree->to_newick());
            }
        }
        return 0;
    } catch (const divsim::DivsimError& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return 1;
    }
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--simulate") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    using namespace divsim::cli;

    divsim::SimulationConfig config;
    RateArgs lambda;
    RateArgs mu;
    std::optional<std::uint64_t> seed;
    bool newick = false;
    bool have_tmax = false;

    for (int i = 2; i < argc; ++i) {
        const std::string flag(argv[i]);

        if (flag == "--true-ext") { config.report_true_extinction = true; continue; }
        if (flag == "--newick")   { newick = true; continue; }
        if (flag == "--verbose")  { config.verbose = true; continue; }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return 1;
        }
        const std::string value(argv[++i]);

        const auto list = parse_list(value);
        bool ok = true;

        if (flag == "--n0") {
            const auto n = parse_count<std::size_t>(value);
            ok = n.has_value();
            if (n) config.n0 = *n;
        } else if (flag == "--tmax" && list && list->size() == 1) {
            config.t_max = (*list)[0];
            have_tmax = true;
        } else if (flag == "--lambda" && list) {
            lambda.values = *list;
            lambda.values_given = true;
        } else if (flag == "--mu" && list) {
            mu.values = *list;
            mu.values_given = true;
        } else if (flag == "--lshifts" && list) {
            lambda.shifts = *list;
        } else if (flag == "--mshifts" && list) {
            mu.shifts = *list;
        } else if (flag == "--lshape" && list && list->size() == 1) {
            lambda.shape = (*list)[0];
        } else if (flag == "--mshape" && list && list->size() == 1) {
            mu.shape = (*list)[0];
        } else if (flag == "--lenv") {
            lambda.env_path = value;
        } else if (flag == "--menv") {
            mu.env_path = value;
        } else if (flag == "--lenv-coef" && list) {
            lambda.env_coef = *list;
        } else if (flag == "--menv-coef" && list) {
            mu.env_coef = *list;
        } else if (flag == "--nfinal") {
            const auto range = parse_range(value);
            ok = range.has_value();
            if (range) config.n_final = *range;
        } else if (flag == "--nextant") {
            const auto range = parse_range(value);
            ok = range.has_value();
            if (range) config.n_extant = *range;
        } else if (flag == "--max-attempts") {
            const auto n = parse_count<std::size_t>(value);
            ok = n.has_value() && *n >= 1;
            if (ok) config.max_attempts = *n;
        } else if (flag == "--seed") {
            const auto n = parse_count<std::uint64_t>(value);
            ok = n.has_value();
            if (n) seed = *n;
        } else {
            ok = false;
        }

        if (!ok) {
            fmt::print(stderr, "Error: bad value '{}' for {}\n", value, flag);
            return 1;
        }
    }

    if (!have_tmax) {
        fmt::print(stderr, "Error: --tmax is required\n");
        return 1;
    }

    try {
        config.speciation = to_rate_input(lambda, "lambda");
        config.extinction = to_rate_input(mu, "mu");
    } catch (const divsim::DivsimError& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return 1;
    }

    const std::uint64_t chosen_seed = seed ? *seed : std::random_device{}();
    return run_simulation(std::move(config), chosen_seed, newick);
}
