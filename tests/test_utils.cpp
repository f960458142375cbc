#include "gtest/gtest.h"

#include <cmath>

#include "../include/utils/Utils.hpp"

namespace Utils {
namespace {

using Vector = traits::DataType::StoringVector;

TEST(LinearFitTest, RecoversExactLine) {
  Vector x(4), y(4);
  x << 0.0, 1.0, 2.0, 3.0;
  y << 1.0, 3.0, 5.0, 7.0;
  const auto fit = linear_least_squares<double>(x, y);
  EXPECT_NEAR(fit.slope, 2.0, 1e-12);
  EXPECT_NEAR(fit.intercept, 1.0, 1e-12);
  EXPECT_NEAR(fit.residual_norm, 0.0, 1e-12);
}

TEST(LinearFitTest, LogLogSlopeIsConvergenceOrder) {
  Vector log_h(3), log_e(3);
  for (int i = 0; i < 3; ++i) {
    const double h = std::pow(0.5, i + 1);
    log_h[i] = std::log(h);
    log_e[i] = std::log(0.3 * h * h * h * h);
  }
  const auto fit = linear_least_squares<double>(log_h, log_e);
  EXPECT_NEAR(fit.slope, 4.0, 1e-10);
  EXPECT_NEAR(std::exp(fit.intercept), 0.3, 1e-10);
}

TEST(LinearFitTest, NoisyDataMinimisesResidual) {
  Vector x(3), y(3);
  x << 0.0, 1.0, 2.0;
  y << 0.0, 2.0, 1.0;
  const auto fit = linear_least_squares<double>(x, y);
  EXPECT_NEAR(fit.slope, 0.5, 1e-12);
  EXPECT_NEAR(fit.intercept, 0.5, 1e-12);
  EXPECT_GT(fit.residual_norm, 0.0);
}

TEST(LinearFitTest, InvalidInputIsRejected) {
  Vector two(2), three(3), single(1), same(3);
  two << 0.0, 1.0;
  three << 0.0, 1.0, 2.0;
  single << 1.0;
  same << 2.0, 2.0, 2.0;
  EXPECT_THROW(linear_least_squares<double>(two, three), std::invalid_argument);
  EXPECT_THROW(linear_least_squares<double>(single, single), std::invalid_argument);
  EXPECT_THROW(linear_least_squares<double>(same, three), std::invalid_argument);
}

TEST(GeometricSequenceTest, OverflowIsRejected) {
  EXPECT_EQ(geometric_sequence(1, 3, 10), (std::vector<unsigned int>{1, 10, 100}));
  EXPECT_THROW(geometric_sequence(1u << 30, 3), std::invalid_argument);
  EXPECT_THROW(geometric_sequence(5, 0), std::invalid_argument);
}

} // namespace
} // namespace Utils
