#pragma once

/// @file include/divsim/quadrature.hpp
/// @brief Gauss–Legendre quadrature with adaptive bisection.
///
/// # Module: Quadrature
///
/// ## Responsibility
/// Integrate hazard functions over short intervals. The sampler never has a
/// closed-form cumulative hazard for general rates, so every non-trivial
/// waiting time goes through here.
///
/// ## Method
/// Nodes x_i and weights w_i of the n-point rule on [−1, 1] come from the
/// Golub–Welsch algorithm: they are the eigenvalues of the symmetric Jacobi
/// matrix with off-diagonal β_k = k / √(4k² − 1), and w_i = 2·v_{0,i}²
/// where v_i is the matching normalized eigenvector.
///
/// Adaptive integration compares the rule on [a, b] against the sum on the
/// two halves and bisects until they agree to the requested tolerance or
/// the depth cap is reached. Cells stopped by the cap keep their finer
/// estimate, and the disagreement they leave behind is summed as the
/// unresolved error. `adaptive_estimate` reports that error so callers can
/// tell a converged integral from one the cap cut short (a strong endpoint
/// singularity, for instance).
///
/// ## Guarantees
/// - Reversed bounds (b < a) give the negated integral
/// - `standard()` is built once, thread-safely

#include "divsim/constants.hpp"

#include <Eigen/Dense>

#include <functional>

namespace divsim {

/// Integrand type used throughout the solver.
using Integrand = std::function<double(double)>;

/// Tolerances for adaptive integration.
struct QuadratureTolerance {
    double abs_tol   = constants::QUADRATURE_ABS_TOL;
    double rel_tol   = constants::QUADRATURE_REL_TOL;
    int    max_depth = constants::QUADRATURE_MAX_DEPTH;
    double cap_tol   = constants::QUADRATURE_CAP_TOL;
};

/// Adaptive estimate together with its convergence verdict.
struct QuadratureEstimate {
    double value      = 0.0;
    double unresolved = 0.0;   ///< Σ |split − whole| over cells stopped at max_depth
    bool   converged  = true;  ///< unresolved ≤ cap_tol · max(1, |value|)
};

class GaussLegendre {
public:
    /// Build an `order`-point rule. `order` is clamped to [1, 64].
    explicit GaussLegendre(int order = constants::QUADRATURE_ORDER);

    /// Shared default rule of order QUADRATURE_ORDER.
    [[nodiscard]] static const GaussLegendre& standard();

    /// Fixed-rule estimate of ∫_a^b f.
    [[nodiscard]] double integrate(const Integrand& f, double a, double b) const;

    /// Adaptive estimate of ∫_a^b f.
    [[nodiscard]] double adaptive(const Integrand& f, double a, double b,
                                  const QuadratureTolerance& tol = {}) const;

    /// Adaptive estimate of ∫_a^b f with the error left at the depth cap.
    [[nodiscard]] QuadratureEstimate
    adaptive_estimate(const Integrand& f, double a, double b,
                      const QuadratureTolerance& tol = {}) const;

    [[nodiscard]] int order() const noexcept { return static_cast<int>(nodes_.size()); }
    [[nodiscard]] const Eigen::VectorXd& nodes() const noexcept { return nodes_; }
    [[nodiscard]] const Eigen::VectorXd& weights() const noexcept { return weights_; }

private:
    [[nodiscard]] double refine(const Integrand& f, double a, double b,
                                double whole, const QuadratureTolerance& tol,
                                int depth, double& unresolved) const;

    Eigen::VectorXd nodes_;
    Eigen::VectorXd weights_;
};

} // namespace divsim
