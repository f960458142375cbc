/**
 * @file QuadratureErrors.hpp
 * @brief Exception types raised by the quadrature rules and the convergence analysis.
 *
 * All errors derive from quadrature::QuadratureError, itself a std::runtime_error, so that
 * callers can either catch the whole family or react to a specific condition:
 *   - InvalidDomainError: the integration bounds do not form a valid interval (a >= b).
 *   - InvalidPartitionCountError: the partition count is not admissible for the rule.
 *   - NumericDomainError: the integrand is undefined (non-finite) at a required sample point.
 *   - InsufficientSamplesError: too few usable error samples to estimate a convergence order.
 */
#ifndef QUADRATURE_ERRORS_HPP
#define QUADRATURE_ERRORS_HPP

#include <limits>
#include <stdexcept>
#include <string>

namespace quadrature {

/**
 * @brief Base class for all quadrature-related exceptions.
 */
class QuadratureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Exception for integration bounds with a >= b, or non-finite bounds.
 */
class InvalidDomainError : public QuadratureError {
public:
    using QuadratureError::QuadratureError;
};

/**
 * @brief Exception for n < 1, odd n with Simpson, or a malformed sequence of counts.
 */
class InvalidPartitionCountError : public QuadratureError {
public:
    using QuadratureError::QuadratureError;
};

/**
 * @brief Exception for an integrand that is not finite at a sample point.
 */
class NumericDomainError : public QuadratureError {
public:
    NumericDomainError(const std::string& what, double abscissa)
        : QuadratureError(what), abscissa_(abscissa) {}

    explicit NumericDomainError(const std::string& what)
        : QuadratureError(what) {}

    /// Sample point at which the integrand failed (NaN when not tied to a point).
    double abscissa() const noexcept { return abscissa_; }

private:
    double abscissa_ = std::numeric_limits<double>::quiet_NaN();
};

/**
 * @brief Exception for an order estimate requested from fewer than two valid samples.
 */
class InsufficientSamplesError : public QuadratureError {
public:
    using QuadratureError::QuadratureError;
};

} // namespace quadrature
#endif // QUADRATURE_ERRORS_HPP
