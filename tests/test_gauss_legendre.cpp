#include "gtest/gtest.h"

#include <cmath>

#include "../include/polynomials/Polynomials.hpp"
#include "../include/quadrature/GaussLegendre.hpp"
#include "../include/quadrature/QuadratureRules.hpp"

namespace quadrature {
namespace {

TEST(GaussLegendreTest, OnePointRule) {
  const NodeSet<> rule = gauss_legendre_nodes(1);
  ASSERT_EQ(rule.size(), 1);
  EXPECT_EQ(rule.nodes[0], 0.0);
  EXPECT_NEAR(rule.weights[0], 2.0, 1e-15);
}

TEST(GaussLegendreTest, TwoAndThreePointRules) {
  const NodeSet<> two = gauss_legendre_nodes(2);
  EXPECT_NEAR(two.nodes[0], -1.0 / std::sqrt(3.0), 1e-15);
  EXPECT_NEAR(two.nodes[1], 1.0 / std::sqrt(3.0), 1e-15);
  EXPECT_NEAR(two.weights[0], 1.0, 1e-15);
  EXPECT_NEAR(two.weights[1], 1.0, 1e-15);

  const NodeSet<> three = gauss_legendre_nodes(3);
  EXPECT_NEAR(three.nodes[0], -std::sqrt(0.6), 1e-15);
  EXPECT_EQ(three.nodes[1], 0.0);
  EXPECT_NEAR(three.nodes[2], std::sqrt(0.6), 1e-15);
  EXPECT_NEAR(three.weights[0], 5.0 / 9.0, 1e-15);
  EXPECT_NEAR(three.weights[1], 8.0 / 9.0, 1e-15);
  EXPECT_NEAR(three.weights[2], 5.0 / 9.0, 1e-15);
}

TEST(GaussLegendreTest, NodesAreSymmetricAndWeightsPositive) {
  for (unsigned int n : {4u, 7u, 16u, 33u, 64u}) {
    const NodeSet<> rule = gauss_legendre_nodes(n);
    ASSERT_EQ(rule.size(), static_cast<Eigen::Index>(n));
    EXPECT_NEAR(rule.weights.sum(), 2.0, 1e-13) << "n = " << n;
    for (unsigned int i = 0; i < n; ++i) {
      EXPECT_EQ(rule.nodes[i], -rule.nodes[n - 1 - i]);
      EXPECT_GT(rule.weights[i], 0.0);
      EXPECT_LT(std::abs(rule.nodes[i]), 1.0);
      EXPECT_LT(std::abs(boost::math::legendre_p(static_cast<int>(n), rule.nodes[i])), 1e-12);
    }
  }
}

TEST(GaussLegendreTest, JacobiMatrixCoefficients) {
  const JacobiMatrix J = legendre_jacobi_matrix(5);
  ASSERT_EQ(J.diagonal.size(), 5);
  ASSERT_EQ(J.subdiagonal.size(), 4);
  EXPECT_EQ(J.diagonal.cwiseAbs().maxCoeff(), 0.0);
  EXPECT_NEAR(J.subdiagonal[0], std::sqrt(1.0 / 3.0), 1e-15);
  EXPECT_NEAR(J.subdiagonal[3], std::sqrt(16.0 / 63.0), 1e-15);

  const JacobiMatrix single = legendre_jacobi_matrix(1);
  EXPECT_EQ(single.diagonal.size(), 1);
  EXPECT_EQ(single.subdiagonal.size(), 0);
}

TEST(GaussLegendreTest, HighOrderRule) {
  const unsigned int n = 500;
  const NodeSet<> rule = gauss_legendre_nodes(n);
  ASSERT_EQ(rule.size(), static_cast<Eigen::Index>(n));
  EXPECT_NEAR(rule.weights.sum(), 2.0, 1e-12);
  EXPECT_EQ(rule.nodes[0], -rule.nodes[n - 1]);
  for (Eigen::Index i = 1; i < rule.size(); ++i) {
    EXPECT_LT(rule.nodes[i - 1], rule.nodes[i]);
  }
  const double integral = rule.weights.dot(rule.nodes.unaryExpr([](double x) { return std::cos(x); }));
  EXPECT_NEAR(integral, 2.0 * std::sin(1.0), 1e-12);
}

TEST(GaussLegendreTest, ExactUpToDegreeTwoNMinusOne) {
  const Interval<double> interval(-1.0, 2.0);
  const polynomials::Polynomial<5> quintic{1.0, -1.0, 0.5, 2.0, -0.25, 1.0};
  const double exact = polynomials::integral(quintic, -1.0, 2.0);

  EXPECT_NEAR(gauss_legendre<double>(quintic.as_function(), interval, 3).value, exact, 1e-12);
  EXPECT_NEAR(gauss_legendre<double>(quintic.as_function(), interval, 4).value, exact, 1e-12);
  // Two points integrate cubics only
  EXPECT_GT(std::abs(gauss_legendre<double>(quintic.as_function(), interval, 2).value - exact), 1e-3);
}

TEST(GaussLegendreTest, MappedRuleScalesWeights) {
  const Interval<double> interval(2.0, 6.0);
  const NodeSet<> rule = gauss_legendre_nodes(interval, 6);
  EXPECT_NEAR(rule.weights.sum(), 4.0, 1e-13);
  EXPECT_NEAR(rule.nodes.mean(), 4.0, 1e-13);
}

TEST(GaussLegendreTest, MappedRuleInSinglePrecision) {
  const Interval<float> interval(2.0f, 6.0f);
  const NodeSet<float> rule = gauss_legendre_nodes(interval, 6);
  EXPECT_NEAR(rule.weights.sum(), 4.0f, 1e-5f);
  EXPECT_NEAR(rule.nodes.mean(), 4.0f, 1e-5f);

  const NodeSet<float> composite = composite_gauss_legendre_nodes(interval, 3, 2);
  ASSERT_EQ(composite.size(), 6);
  EXPECT_NEAR(composite.weights.sum(), 4.0f, 1e-5f);
}

TEST(GaussLegendreTest, CompositeRuleCoversInterval) {
  const Interval<double> interval(0.0, 3.0);
  const NodeSet<> rule = composite_gauss_legendre_nodes(interval, 4, 3);
  ASSERT_EQ(rule.size(), 12);
  EXPECT_NEAR(rule.weights.sum(), 3.0, 1e-14);
  for (Eigen::Index i = 1; i < rule.size(); ++i) {
    EXPECT_LT(rule.nodes[i - 1], rule.nodes[i]);
  }
  EXPECT_THROW(composite_gauss_legendre_nodes(interval, 4, 0), InvalidPartitionCountError);
}

TEST(GaussLegendreTest, SmoothIntegrandConvergesRapidly) {
  const Interval<double> interval(0.0, 1.0);
  const auto f = [](double x) { return std::exp(x); };
  EXPECT_NEAR(gauss_legendre<double>(f, interval, 8).value, std::exp(1.0) - 1.0, 1e-14);
}

TEST(GaussLegendreTest, ZeroNodesAreRejected) {
  EXPECT_THROW(gauss_legendre_nodes(0), InvalidPartitionCountError);
}

} // namespace
} // namespace quadrature
