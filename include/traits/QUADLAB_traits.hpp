/*!
 * @file QUADLAB_traits.hpp
 * @brief Defines core type traits, enumerations, and data structures for the QUADLAB library.
 *
 * This header provides essential type definitions and enumerations used throughout QUADLAB,
 * including vector and matrix types based on Eigen, the scalar field used by every rule,
 * and the closed sets of quadrature and reference methods.
 */

#ifndef QUADLAB_TRAITS_HPP
#define QUADLAB_TRAITS_HPP

#include <Eigen/Dense>
#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace traits
/*!
 * @namespace traits
 * @brief Contains all type traits, type aliases, and enumerations used across the QUADLAB library.
 */
{

/*!
 * @struct DataType
 * @brief Central container of type aliases for commonly used matrix/vector structures in QUADLAB.
 *
 * These types are based on Eigen and are designed for dynamic sizing, since node counts
 * are only known at run time.
 */
struct DataType
{
public:
    using PolynomialField = double;  ///< Scalar field used for all rules and polynomial operations (default: double).

    using StoringMatrix = Eigen::Matrix<PolynomialField, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>; ///< Dynamic-size matrix type.

    using StoringVector = Eigen::Matrix<PolynomialField, Eigen::Dynamic, 1>; ///< Dynamic-size column vector type.

    using StoringArray  = Eigen::Array<PolynomialField, Eigen::Dynamic, 1>; ///< Dynamic-size array for element-wise operations.
};

/*!
 * @enum EvalMethod
 * @brief Enumeration of available methods for evaluating polynomials.
 */
enum class EvalMethod
{
    Horner, ///< Use Horner's method: efficient nested multiplication.
    Direct  ///< Use direct evaluation (less efficient, straightforward).
};

/*!
 * @enum QuadratureMethod
 * @brief The closed set of quadrature rules exposed to callers.
 */
enum class QuadratureMethod
{
    LeftRiemann,     ///< Left endpoint rectangle rule, O(h).
    RightRiemann,    ///< Right endpoint rectangle rule, O(h).
    MidpointRiemann, ///< Midpoint rectangle rule, O(h^2).
    Trapezoidal,     ///< Composite trapezoidal rule, O(h^2).
    Simpson,         ///< Composite Simpson rule, O(h^4), even n only.
    GaussLegendre    ///< n-point Gauss-Legendre rule, exact up to degree 2n-1.
};

/*!
 * @enum ReferenceMethod
 * @brief Backends able to produce a high-accuracy reference value.
 */
enum class ReferenceMethod
{
    GaussLegendre, ///< Composite high-order Gauss-Legendre.
    TanhSinh,      ///< Tanh-Sinh quadrature (Boost.Math).
    QAGS           ///< Adaptive Gauss-Kronrod with extrapolation (GSL / QUADPACK).
};

/// All quadrature methods, in declaration order.
inline constexpr std::array<QuadratureMethod, 6> all_quadrature_methods{
    QuadratureMethod::LeftRiemann,
    QuadratureMethod::RightRiemann,
    QuadratureMethod::MidpointRiemann,
    QuadratureMethod::Trapezoidal,
    QuadratureMethod::Simpson,
    QuadratureMethod::GaussLegendre};

/*!
 * @brief Human-readable name of a quadrature method.
 */
constexpr std::string_view to_string(QuadratureMethod method) noexcept
{
    switch (method) {
        case QuadratureMethod::LeftRiemann:     return "Riemann Left";
        case QuadratureMethod::RightRiemann:    return "Riemann Right";
        case QuadratureMethod::MidpointRiemann: return "Riemann Mid";
        case QuadratureMethod::Trapezoidal:     return "Trapezoidal";
        case QuadratureMethod::Simpson:         return "Simpson";
        case QuadratureMethod::GaussLegendre:   return "Gaussian Quadrature";
    }
    return "Unknown";
}

constexpr std::string_view to_string(ReferenceMethod method) noexcept
{
    switch (method) {
        case ReferenceMethod::GaussLegendre: return "GaussLegendre";
        case ReferenceMethod::TanhSinh:      return "TanhSinh";
        case ReferenceMethod::QAGS:          return "QAGS";
    }
    return "Unknown";
}

/*!
 * @brief Parses a method name as produced by to_string().
 * @throws std::invalid_argument If the name does not denote a method.
 */
inline QuadratureMethod method_from_string(std::string_view name)
{
    for (auto method : all_quadrature_methods) {
        if (to_string(method) == name) {
            return method;
        }
    }
    throw std::invalid_argument("Unknown quadrature method: " + std::string(name));
}

/*!
 * @brief Classical convergence order of a composite rule, in powers of h.
 *
 * Gauss-Legendre has no fixed algebraic order in h (its error decays with the node count
 * according to the smoothness of the integrand), so 0 is returned for it.
 */
constexpr unsigned int nominal_order(QuadratureMethod method) noexcept
{
    switch (method) {
        case QuadratureMethod::LeftRiemann:
        case QuadratureMethod::RightRiemann:    return 1;
        case QuadratureMethod::MidpointRiemann:
        case QuadratureMethod::Trapezoidal:     return 2;
        case QuadratureMethod::Simpson:         return 4;
        case QuadratureMethod::GaussLegendre:   return 0;
    }
    return 0;
}

} // namespace traits

#endif // QUADLAB_TRAITS_HPP
