/*!
 * @file Utils.hpp
 * @brief Utility functions for the convergence analysis.
 *
 * This header provides a small collection of numerical helpers built on Eigen:
 * - `linear_least_squares`: straight-line fit y = intercept + slope x, used to estimate
 *   convergence orders from log-log error data.
 * - `geometric_sequence`: the refinement sequence n0, n0 f, n0 f^2, ... of a convergence study.
 *
 * Dependencies:
 * - Eigen for matrix and vector operations.
 * - QUADLAB_traits.hpp for type definitions.
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include "../traits/QUADLAB_traits.hpp"

namespace Utils
{

/**
 * @brief Result of a straight-line least-squares fit.
 */
template<typename T = traits::DataType::PolynomialField>
struct LinearFit {
    T slope;
    T intercept;
    T residual_norm; ///< Euclidean norm of the fit residual.
};

/**
 * @brief Fits y = intercept + slope x in the least-squares sense.
 *
 * The overdetermined system [1 x] [intercept slope]^T = y is solved with a column-pivoting
 * Householder QR of the design matrix.
 *
 * @param x Abscissae (at least two distinct values).
 * @param y Ordinates, same size as x.
 * @return Slope, intercept and residual norm.
 * @throws std::invalid_argument if the sizes differ, fewer than two points are given,
 *         or all abscissae coincide.
 */
template<typename T = traits::DataType::PolynomialField>
LinearFit<T> linear_least_squares(
    const traits::DataType::StoringVector& x,
    const traits::DataType::StoringVector& y)
{
    // --- Input Validations ---
    if (x.size() != y.size()) {
        throw std::invalid_argument("linear_least_squares: x has " + std::to_string(x.size())
                                    + " entries but y has " + std::to_string(y.size()) + ".");
    }
    if (x.size() < 2) {
        throw std::invalid_argument("linear_least_squares: at least two points are required.");
    }
    if (x.maxCoeff() - x.minCoeff() <= std::numeric_limits<T>::epsilon() * std::abs(x.maxCoeff())) {
        throw std::invalid_argument("linear_least_squares: abscissae must not all coincide.");
    }

    traits::DataType::StoringMatrix design(x.size(), 2);
    design.col(0).setOnes();
    design.col(1) = x;

    const traits::DataType::StoringVector coefficients = design.colPivHouseholderQr().solve(y);
    const T residual = (design * coefficients - y).norm();

    return {static_cast<T>(coefficients(1)), static_cast<T>(coefficients(0)), residual};
}

/**
 * @brief Builds n0, n0 * factor, n0 * factor^2, ... with `levels` entries.
 *
 * @throws std::invalid_argument if n0 == 0, factor < 2, levels == 0, or the sequence overflows.
 */
inline std::vector<unsigned int> geometric_sequence(unsigned int n0, unsigned int levels, unsigned int factor = 2)
{
    if (n0 == 0) {
        throw std::invalid_argument("geometric_sequence: the first count must be positive.");
    }
    if (factor < 2) {
        throw std::invalid_argument("geometric_sequence: the refinement factor must be at least 2.");
    }
    if (levels == 0) {
        throw std::invalid_argument("geometric_sequence: at least one level is required.");
    }

    std::vector<unsigned int> sequence;
    sequence.reserve(levels);
    unsigned long long n = n0;
    for (unsigned int level = 0; level < levels; ++level) {
        if (n > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            throw std::invalid_argument("geometric_sequence: partition count overflow at level "
                                        + std::to_string(level) + ".");
        }
        sequence.push_back(static_cast<unsigned int>(n));
        n *= factor;
    }
    return sequence;
}

} // namespace Utils

#endif // UTILS_HPP
