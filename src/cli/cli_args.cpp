/// @file src/cli/cli_args.cpp
/// @brief Flag value parsers and RateArgs → RateInput translation.

#include "divsim/cli_args.hpp"
#include "divsim/data_loader.hpp"
#include "divsim/error.hpp"

#include <fmt/core.h>

#include <cmath>
#include <memory>
#include <sstream>
#include <utility>

namespace divsim::cli {

// ─── parse_list ───────────────────────────────────────────────────────────────

std::optional<std::vector<double>> parse_list(const std::string& text) {
    std::vector<double> out;
    std::istringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        try {
            std::size_t pos = 0;
            const double v = std::stod(token, &pos);
            if (pos != token.size() || std::isnan(v)) {
                return std::nullopt;
            }
            out.push_back(v);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

// ─── parse_range ──────────────────────────────────────────────────────────────

std::optional<CountRange> parse_range(const std::string& text) {
    const auto values = parse_list(text);
    if (!values || values->size() != 2) {
        return std::nullopt;
    }
    const auto lo = to_count<std::size_t>((*values)[0]);
    if (!lo) {
        return std::nullopt;
    }

    CountRange range;
    range.min = *lo;
    const double upper = (*values)[1];
    if (std::isinf(upper) && upper > 0.0) {
        range.max = CountRange::unbounded();
    } else {
        const auto hi = to_count<std::size_t>(upper);
        if (!hi) {
            return std::nullopt;
        }
        range.max = *hi;
    }
    return range;
}

// ─── to_rate_input ────────────────────────────────────────────────────────────

RateInput to_rate_input(const RateArgs& args, const std::string& name) {
    const std::string env_flag = name == "lambda" ? "lenv" : "menv";

    RateInput input;
    input.shifts = args.shifts;
    if (args.shape) {
        input.shape = ConstantRate{*args.shape};
    }

    if (args.env_path.empty()) {
        if (args.values.size() == 1 && args.shifts.empty()) {
            input.spec = ConstantRate{args.values.front()};
        } else {
            input.spec = StepRate{args.values};
        }
        return input;
    }

    if (args.values_given) {
        throw DivsimError(ErrorCode::InvalidArgument,
                          fmt::format("--{} and --{} are mutually exclusive", name, env_flag));
    }
    if (args.env_coef.size() != 2) {
        throw DivsimError(ErrorCode::InvalidArgument,
                          fmt::format("--{} needs --{}-coef a,b", env_flag, env_flag));
    }

    auto table = EnvironmentLoader::load_csv(args.env_path);
    if (!table) {
        throw DivsimError(ErrorCode::InvalidArgument,
                          fmt::format("cannot load environment table '{}'", args.env_path));
    }

    const double a = args.env_coef[0];
    const double b = args.env_coef[1];
    input.environment = std::make_shared<const EnvironmentTable>(std::move(*table));
    input.spec = EnvRate{[a, b](double, double env) { return a * std::exp(b * env); }};
    return input;
}

} // namespace divsim::cli
