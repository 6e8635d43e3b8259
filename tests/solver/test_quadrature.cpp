#include <gtest/gtest.h>
#include "divsim/quadrature.hpp"
#include "divsim/constants.hpp"

#include <cmath>
#include <numbers>

using namespace divsim;
using namespace divsim::constants;

// ─── Rule construction ────────────────────────────────────────────────────────

TEST(GaussLegendre_Rule, WeightsSumToTwo) {
    for (int n : {1, 2, 5, 10, 20}) {
        GaussLegendre rule(n);
        EXPECT_EQ(rule.order(), n);
        EXPECT_NEAR(rule.weights().sum(), 2.0, 1e-13) << "order " << n;
    }
}

TEST(GaussLegendre_Rule, NodesSymmetricInsideUnitInterval) {
    GaussLegendre rule(8);
    const auto& x = rule.nodes();
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        EXPECT_GT(x(i), -1.0);
        EXPECT_LT(x(i), 1.0);
        EXPECT_NEAR(x(i), -x(x.size() - 1 - i), 1e-13);
    }
}

TEST(GaussLegendre_Rule, TwoPointNodesAreInverseRootThree) {
    GaussLegendre rule(2);
    EXPECT_NEAR(std::abs(rule.nodes()(0)), 1.0 / std::sqrt(3.0), 1e-14);
    EXPECT_NEAR(rule.weights()(0), 1.0, 1e-14);
}

TEST(GaussLegendre_Rule, OrderClampedToValidRange) {
    EXPECT_EQ(GaussLegendre(0).order(), 1);
    EXPECT_EQ(GaussLegendre(500).order(), 64);
}

TEST(GaussLegendre_Rule, StandardRuleHasDefaultOrder) {
    EXPECT_EQ(GaussLegendre::standard().order(), QUADRATURE_ORDER);
    EXPECT_EQ(&GaussLegendre::standard(), &GaussLegendre::standard());
}

// ─── integrate ────────────────────────────────────────────────────────────────

TEST(GaussLegendre_Integrate, ExactForPolynomialOfDegree2nMinus1) {
    GaussLegendre rule(5);
    // ∫_0^2 x^9 dx = 2^10 / 10
    const double result = rule.integrate([](double x) { return std::pow(x, 9); }, 0.0, 2.0);
    EXPECT_NEAR(result, 102.4, 1e-10);
}

TEST(GaussLegendre_Integrate, ReversedBoundsNegate) {
    const auto& rule = GaussLegendre::standard();
    auto f = [](double x) { return x * x; };
    EXPECT_NEAR(rule.integrate(f, 3.0, 1.0), -rule.integrate(f, 1.0, 3.0), 1e-13);
}

// ─── adaptive ─────────────────────────────────────────────────────────────────

TEST(GaussLegendre_Adaptive, ExponentialMatchesClosedForm) {
    const double result = GaussLegendre::standard().adaptive(
        [](double x) { return std::exp(-x); }, 0.0, 20.0);
    EXPECT_NEAR(result, 1.0 - std::exp(-20.0), 1e-11);
}

TEST(GaussLegendre_Adaptive, OscillatingIntegrand) {
    const double result = GaussLegendre::standard().adaptive(
        [](double x) { return std::sin(x); }, 0.0, 10.0 * std::numbers::pi);
    EXPECT_NEAR(result, 0.0, 1e-10);
}

TEST(GaussLegendre_Adaptive, EndpointSingularityStaysFinite) {
    // ∫_0^1 x^(-1/2) dx = 2
    const double result = GaussLegendre::standard().adaptive(
        [](double x) { return 1.0 / std::sqrt(x); }, 0.0, 1.0);
    EXPECT_TRUE(std::isfinite(result));
    EXPECT_NEAR(result, 2.0, 1e-4);
}

TEST(GaussLegendre_Adaptive, EmptyIntervalIsZero) {
    EXPECT_DOUBLE_EQ(GaussLegendre::standard().adaptive(
        [](double) { return 1.0; }, 4.0, 4.0), 0.0);
}

// ─── adaptive_estimate ────────────────────────────────────────────────────────

TEST(GaussLegendre_Estimate, SmoothIntegrandConverges) {
    const auto est = GaussLegendre::standard().adaptive_estimate(
        [](double x) { return std::exp(-x); }, 0.0, 20.0);
    EXPECT_TRUE(est.converged);
    EXPECT_DOUBLE_EQ(est.unresolved, 0.0);
    EXPECT_NEAR(est.value, 1.0 - std::exp(-20.0), 1e-11);
}

TEST(GaussLegendre_Estimate, JumpLeavesNegligibleError) {
    const auto est = GaussLegendre::standard().adaptive_estimate(
        [](double x) { return x < 0.3 ? 1.0 : 2.0; }, 0.0, 1.0);
    EXPECT_TRUE(est.converged);
    EXPECT_NEAR(est.value, 1.7, 1e-9);
}

TEST(GaussLegendre_Estimate, StrongSingularityHitsDepthCap) {
    // ∫_0^1 x^(-0.95) dx = 20, almost all of it in the leftmost cell.
    const auto est = GaussLegendre::standard().adaptive_estimate(
        [](double x) { return std::pow(x, -0.95); }, 0.0, 1.0);
    EXPECT_FALSE(est.converged);
    EXPECT_GT(est.unresolved, 1e-3);
}
