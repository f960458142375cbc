#include "gtest/gtest.h"

#include <cmath>
#include <type_traits>
#include <vector>

#include "../include/quadrature/QuadratureRules.hpp"

namespace quadrature {
namespace {

using traits::QuadratureMethod;

const Interval<double> kUnit(0.0, 1.0);

double Square(double x) { return x * x; }

TEST(RuleTest, ConstantIsExactForEveryMethod) {
  const Interval<double> interval(-2.0, 3.0);
  for (auto method : traits::all_quadrature_methods) {
    for (unsigned int n : {2u, 4u, 10u}) {
      const auto result = evaluate<double>(method, [](double) { return 3.0; }, interval, n);
      EXPECT_NEAR(result.value, 15.0, 1e-12) << traits::to_string(method) << " n = " << n;
    }
  }
}

TEST(RuleTest, SquareOnUnitIntervalWithTenPartitions) {
  EXPECT_NEAR(left_riemann<double>(Square, kUnit, 10).value, 0.285, 1e-12);
  EXPECT_NEAR(right_riemann<double>(Square, kUnit, 10).value, 0.385, 1e-12);
  EXPECT_NEAR(midpoint_riemann<double>(Square, kUnit, 10).value, 0.3325, 1e-12);

  const auto trapezoid = trapezoidal<double>(Square, kUnit, 10);
  EXPECT_NEAR(trapezoid.value, 0.335, 1e-12);
  EXPECT_NEAR(trapezoid.value - 1.0 / 3.0, 1.0 / 600.0, 1e-12);

  EXPECT_LT(std::abs(simpson<double>(Square, kUnit, 10).value - 1.0 / 3.0), 1e-6);
  EXPECT_LT(std::abs(gauss_legendre<double>(Square, kUnit, 10).value - 1.0 / 3.0), 1e-14);
}

TEST(RuleTest, LinearIsExactForTrapezoidAndMidpoint) {
  const Interval<double> interval(1.0, 4.0);
  const auto line = [](double x) { return 2.0 * x - 1.0; };
  // int_1^4 (2x - 1) dx = 15 - 3 = 12
  for (unsigned int n : {1u, 3u, 7u}) {
    EXPECT_NEAR(trapezoidal<double>(line, interval, n).value, 12.0, 1e-12);
    EXPECT_NEAR(midpoint_riemann<double>(line, interval, n).value, 12.0, 1e-12);
  }
}

TEST(RuleTest, SimpsonIsExactForCubics) {
  const Interval<double> interval(-1.0, 2.0);
  const auto cubic = [](double x) { return x * x * x - 2.0 * x * x + 0.5; };
  // [x^4/4 - 2x^3/3 + x/2] from -1 to 2
  const double exact = (4.0 - 16.0 / 3.0 + 1.0) - (0.25 + 2.0 / 3.0 - 0.5);
  for (unsigned int n : {2u, 4u, 8u}) {
    EXPECT_NEAR(simpson<double>(cubic, interval, n).value, exact, 1e-12);
  }
}

TEST(RuleTest, RiemannSumsBracketIncreasingFunction) {
  const double exact = std::exp(1.0) - 1.0;
  const auto f = [](double x) { return std::exp(x); };
  EXPECT_LT(left_riemann<double>(f, kUnit, 50).value, exact);
  EXPECT_GT(right_riemann<double>(f, kUnit, 50).value, exact);
}

TEST(RuleTest, EvaluationCountMatchesNodeCount) {
  EXPECT_EQ(evaluate<double>(QuadratureMethod::LeftRiemann, Square, kUnit, 10).evaluations, 10u);
  EXPECT_EQ(evaluate<double>(QuadratureMethod::MidpointRiemann, Square, kUnit, 10).evaluations, 10u);
  EXPECT_EQ(evaluate<double>(QuadratureMethod::Trapezoidal, Square, kUnit, 10).evaluations, 11u);
  EXPECT_EQ(evaluate<double>(QuadratureMethod::Simpson, Square, kUnit, 10).evaluations, 11u);
  EXPECT_EQ(evaluate<double>(QuadratureMethod::GaussLegendre, Square, kUnit, 5).evaluations, 5u);

  const auto result = evaluate<double>(QuadratureMethod::Simpson, Square, kUnit, 6);
  EXPECT_EQ(result.method, QuadratureMethod::Simpson);
  EXPECT_EQ(result.partitions, 6u);
}

TEST(RuleTest, WeightsSumToIntervalLength) {
  const Interval<double> interval(-0.5, 2.5);
  for (auto method : traits::all_quadrature_methods) {
    const NodeSet<double> rule = nodes(method, interval, 8);
    EXPECT_NEAR(rule.weights.sum(), 3.0, 1e-13) << traits::to_string(method);
    for (Eigen::Index i = 0; i < rule.size(); ++i) {
      EXPECT_TRUE(interval.contains(rule.nodes[i]));
      if (i > 0) {
        EXPECT_LT(rule.nodes[i - 1], rule.nodes[i]);
      }
    }
  }
}

TEST(RuleTest, SimpsonWeightPattern) {
  const NodeSet<double> rule = nodes(QuadratureMethod::Simpson, kUnit, 4);
  const double h = 0.25;
  const std::vector<double> expected = {1.0, 4.0, 2.0, 4.0, 1.0};
  ASSERT_EQ(rule.size(), 5);
  for (Eigen::Index i = 0; i < rule.size(); ++i) {
    EXPECT_NEAR(rule.weights[i], expected[i] * h / 3.0, 1e-15);
  }
}

TEST(RuleTest, SampleExposesNodesAndValues) {
  const auto samples = sample<double>(QuadratureMethod::RightRiemann, Square, kUnit, 4);
  ASSERT_EQ(samples.values.size(), 4);
  EXPECT_DOUBLE_EQ(samples.nodes[0], 0.25);
  EXPECT_DOUBLE_EQ(samples.nodes[3], 1.0);
  EXPECT_DOUBLE_EQ(samples.values[1], 0.25);
  EXPECT_EQ(samples.weighted_sum(), evaluate<double>(QuadratureMethod::RightRiemann, Square, kUnit, 4).value);
}

TEST(RuleTest, RepeatedEvaluationIsBitIdentical) {
  const auto f = [](double x) { return std::sin(3.0 * x) + x; };
  for (auto method : traits::all_quadrature_methods) {
    const double first = evaluate<double>(method, f, kUnit, 64).value;
    const double second = evaluate<double>(method, f, kUnit, 64).value;
    EXPECT_EQ(first, second) << traits::to_string(method);
  }
}

TEST(RuleTest, ReversedBoundsAreRejected) {
  EXPECT_THROW(evaluate<double>(QuadratureMethod::Trapezoidal, Square, 5.0, 2.0, 10), InvalidDomainError);
  EXPECT_THROW(evaluate<double>(QuadratureMethod::Trapezoidal, Square, 1.0, 1.0, 10), InvalidDomainError);
  EXPECT_THROW(Interval<double>(0.0, std::nan("")), InvalidDomainError);
  EXPECT_THROW(Interval<double>(-INFINITY, 0.0), InvalidDomainError);
}

TEST(RuleTest, OverflowingLengthIsRejected) {
  EXPECT_THROW(Interval<double>(-1e308, 1e308), InvalidDomainError);
  EXPECT_THROW(evaluate<double>(QuadratureMethod::MidpointRiemann, Square, -1e308, 1e308, 4), InvalidDomainError);

  const Interval<double> wide(1e308, 1.5e308);
  EXPECT_TRUE(std::isfinite(wide.length()));
  EXPECT_TRUE(std::isfinite(wide.midpoint()));
  EXPECT_DOUBLE_EQ(wide.midpoint(), 1.25e308);
}

TEST(RuleTest, OverflowingSumIsReported) {
  const Interval<double> interval(0.0, 10.0);
  const auto huge = [](double) { return 1e308; };
  // Every sample is finite; 4 h/3 * 1e308 is not.
  EXPECT_THROW(evaluate<double>(QuadratureMethod::Simpson, huge, interval, 2), NumericDomainError);
  EXPECT_THROW(trapezoidal<double>(huge, interval, 4), NumericDomainError);
  EXPECT_NO_THROW(evaluate<double>(QuadratureMethod::Simpson, [](double) { return 1e300; }, interval, 2));
}

TEST(RuleTest, InvalidPartitionCountsAreRejected) {
  for (auto method : traits::all_quadrature_methods) {
    EXPECT_THROW(evaluate<double>(method, Square, kUnit, 0), InvalidPartitionCountError);
    EXPECT_THROW(evaluate<double>(method, Square, 0.0, 1.0, -3), InvalidPartitionCountError);
  }
  EXPECT_THROW(simpson<double>(Square, kUnit, 5), InvalidPartitionCountError);
  EXPECT_NO_THROW(simpson<double>(Square, kUnit, 6));
}

TEST(RuleTest, InvalidPartitionCountIsAQuadratureError) {
  EXPECT_THROW(simpson<double>(Square, kUnit, 3), QuadratureError);
  EXPECT_THROW(simpson<double>(Square, kUnit, 3), std::runtime_error);
}

TEST(RuleTest, SingularIntegrandIsReported) {
  const auto reciprocal = [](double x) { return 1.0 / x; };
  try {
    left_riemann<double>(reciprocal, kUnit, 10);
    FAIL() << "expected NumericDomainError";
  } catch (const NumericDomainError& e) {
    EXPECT_EQ(e.abscissa(), 0.0);
  }
  EXPECT_THROW(trapezoidal<double>(reciprocal, kUnit, 10), NumericDomainError);
  // Midpoint and Gauss nodes avoid the endpoint
  EXPECT_NO_THROW(midpoint_riemann<double>(reciprocal, kUnit, 10));
  EXPECT_NO_THROW(gauss_legendre<double>(reciprocal, kUnit, 10));
}

TEST(RuleTest, DomainErrorFromIntegrandIsReported) {
  const auto checked_log = [](double x) {
    if (x <= 0.0) {
      throw std::domain_error("log of non-positive value");
    }
    return std::log(x);
  };
  EXPECT_THROW(left_riemann<double>(checked_log, kUnit, 4), NumericDomainError);
  EXPECT_THROW(evaluate<double>(QuadratureMethod::Trapezoidal, [](double x) { return std::sqrt(x - 0.5); }, kUnit, 4),
               NumericDomainError);
}

TEST(RuleTest, EmptyIntegrandIsRejected) {
  EXPECT_THROW(evaluate<double>(QuadratureMethod::Trapezoidal, Integrand<double>{}, kUnit, 4), std::invalid_argument);
}

TEST(RuleTest, SinglePrecisionRulesStayInSinglePrecision) {
  const Interval<float> unit(0.0f, 1.0f);
  for (auto method : traits::all_quadrature_methods) {
    const auto rule = nodes(method, unit, 8);
    static_assert(std::is_same_v<std::remove_cvref_t<decltype(rule.nodes[0])>, float>);
    EXPECT_NEAR(rule.weights.sum(), 1.0f, 1e-6f) << traits::to_string(method);
  }
  const auto square = [](float x) { return x * x; };
  EXPECT_NEAR(simpson<float>(square, unit, 10).value, 1.0f / 3.0f, 1e-6f);
  EXPECT_NEAR(gauss_legendre<float>(square, unit, 2).value, 1.0f / 3.0f, 1e-6f);
  EXPECT_NEAR(trapezoidal<float>(square, unit, 10).value, 0.335f, 1e-6f);
}

TEST(RuleTest, MethodNames) {
  EXPECT_EQ(traits::to_string(QuadratureMethod::LeftRiemann), "Riemann Left");
  EXPECT_EQ(traits::to_string(QuadratureMethod::GaussLegendre), "Gaussian Quadrature");
  for (auto method : traits::all_quadrature_methods) {
    EXPECT_EQ(traits::method_from_string(traits::to_string(method)), method);
  }
  EXPECT_THROW(traits::method_from_string("Romberg"), std::invalid_argument);
}

} // namespace
} // namespace quadrature
