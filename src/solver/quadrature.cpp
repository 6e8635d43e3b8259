/// @file src/solver/quadrature.cpp
/// @brief Golub–Welsch Gauss–Legendre rule and adaptive integration.

#include "divsim/quadrature.hpp"

#include <algorithm>
#include <cmath>

namespace divsim {

// ─── GaussLegendre constructor ────────────────────────────────────────────────

GaussLegendre::GaussLegendre(int order) {
    const int n = std::clamp(order, 1, 64);

    // Symmetric tridiagonal Jacobi matrix of the Legendre recurrence.
    Eigen::MatrixXd jacobi = Eigen::MatrixXd::Zero(n, n);
    for (int k = 1; k < n; ++k) {
        const double kd = static_cast<double>(k);
        const double beta = kd / std::sqrt(4.0 * kd * kd - 1.0);
        jacobi(k - 1, k) = beta;
        jacobi(k, k - 1) = beta;
    }

    const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(jacobi);
    nodes_ = solver.eigenvalues();
    weights_ = (2.0 * solver.eigenvectors().row(0).transpose().array().square()).matrix();
}

// ─── GaussLegendre::standard ──────────────────────────────────────────────────

const GaussLegendre& GaussLegendre::standard() {
    static const GaussLegendre rule(constants::QUADRATURE_ORDER);
    return rule;
}

// ─── GaussLegendre::integrate ─────────────────────────────────────────────────

double GaussLegendre::integrate(const Integrand& f, double a, double b) const {
    const double half = 0.5 * (b - a);
    const double mid  = 0.5 * (a + b);

    Eigen::VectorXd values(nodes_.size());
    for (Eigen::Index i = 0; i < nodes_.size(); ++i) {
        values(i) = f(mid + half * nodes_(i));
    }
    return half * weights_.dot(values);
}

// ─── GaussLegendre::adaptive ──────────────────────────────────────────────────

double GaussLegendre::adaptive(const Integrand& f, double a, double b,
                               const QuadratureTolerance& tol) const {
    return adaptive_estimate(f, a, b, tol).value;
}

QuadratureEstimate
GaussLegendre::adaptive_estimate(const Integrand& f, double a, double b,
                                 const QuadratureTolerance& tol) const {
    QuadratureEstimate est;
    if (a == b) {
        return est;
    }
    est.value = refine(f, a, b, integrate(f, a, b), tol, 0, est.unresolved);
    est.converged = est.unresolved <= tol.cap_tol * std::max(1.0, std::abs(est.value));
    return est;
}

double GaussLegendre::refine(const Integrand& f, double a, double b,
                             double whole, const QuadratureTolerance& tol,
                             int depth, double& unresolved) const {
    const double mid   = 0.5 * (a + b);
    const double left  = integrate(f, a, mid);
    const double right = integrate(f, mid, b);
    const double split = left + right;

    if (!std::isfinite(split)) {
        return split;
    }

    const double err_target = std::max(tol.abs_tol, tol.rel_tol * std::abs(split));
    const double err = std::abs(split - whole);
    if (err <= err_target) {
        return split;
    }
    if (depth >= tol.max_depth) {
        unresolved += err;
        return split;
    }

    // Halve the absolute budget so the total error stays within target.
    QuadratureTolerance sub = tol;
    sub.abs_tol = 0.5 * tol.abs_tol;
    return refine(f, a, mid, left, sub, depth + 1, unresolved)
         + refine(f, mid, b, right, sub, depth + 1, unresolved);
}

} // namespace divsim
