/**
 * @file QuadratureRules.hpp
 * @brief The classical quadrature rules: Riemann sums, trapezoidal, Simpson and Gauss-Legendre.
 *
 * Every rule is written as a weighted sum  sum_i w_i f(x_i)  over a node set built for the
 * triple (method, interval, n). The node set is produced by quadrature::nodes(), the integrand
 * is sampled by quadrature::sample() and the weighted sum is accumulated left to right.
 *
 * Rules (h = (b - a) / n):
 * - LeftRiemann / RightRiemann / MidpointRiemann: n nodes, all weights h.
 * - Trapezoidal: n + 1 nodes, weights h/2, h, ..., h, h/2.
 * - Simpson: n + 1 nodes (n even), weights h/3 [1, 4, 2, 4, ..., 2, 4, 1].
 * - GaussLegendre: n nodes, the roots of P_n mapped onto [a, b].
 *
 * Simpson's rule rejects an odd n with InvalidPartitionCountError; n is never adjusted.
 *
 * Usage Example:
 * @code
 * quadrature::Interval<double> unit(0.0, 1.0);
 * auto result = quadrature::evaluate(traits::QuadratureMethod::Simpson,
 *                                    [](double x) { return x * x; }, unit, 10);
 * std::cout << result.value << std::endl; // 0.333333...
 * @endcode
 */
#ifndef QUADRATURE_RULES_HPP
#define QUADRATURE_RULES_HPP

#include <cmath>
#include <functional>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include "GaussLegendre.hpp"
#include "Interval.hpp"
#include "QuadratureErrors.hpp"
#include "QuadratureResult.hpp"
#include "../traits/QUADLAB_traits.hpp"

namespace quadrature {

template<typename R>
using Integrand = std::function<R(R)>;

/**
 * @brief Checks that n is an admissible partition count for the given rule.
 * @throws InvalidPartitionCountError if n < 1, or n is odd for Simpson.
 */
inline void validate_partitions(QuadratureType method, long long n)
{
    if (n < 1) {
        throw InvalidPartitionCountError(std::string(traits::to_string(method))
            + " requires a partition count n >= 1 (got " + std::to_string(n) + ").");
    }
    if (method == QuadratureType::Simpson && n % 2 != 0) {
        throw InvalidPartitionCountError("Simpson's rule requires an even number of subintervals (got "
            + std::to_string(n) + ").");
    }
    if (n > static_cast<long long>(std::numeric_limits<int>::max())) {
        throw InvalidPartitionCountError("Partition count " + std::to_string(n) + " is too large.");
    }
}

/**
 * @brief Builds the nodes and weights of a rule on an interval.
 *
 * @param method Rule to build.
 * @param interval Integration interval.
 * @param n Number of subintervals (number of nodes for Gauss-Legendre).
 * @return Nodes in ascending order with their weights.
 * @throws InvalidPartitionCountError if n is not admissible for the rule.
 */
template<typename R = traits::DataType::PolynomialField>
NodeSet<R> nodes(QuadratureType method, const Interval<R>& interval, unsigned int n)
{
    validate_partitions(method, n);

    if (method == QuadratureType::GaussLegendre) {
        return gauss_legendre_nodes(interval, n);
    }

    const R h = interval.step(n);
    const Eigen::Index size = static_cast<Eigen::Index>(n);
    // Subinterval endpoints x_0 = a, ..., x_n = b
    using Vector = typename NodeSet<R>::Vector;
    const Vector grid = Vector::LinSpaced(size + 1, interval.lower(), interval.upper());

    NodeSet<R> rule;
    switch (method) {
        case QuadratureType::LeftRiemann:
            rule.nodes = grid.head(size);
            rule.weights = Vector::Constant(size, h);
            break;
        case QuadratureType::RightRiemann:
            rule.nodes = grid.tail(size);
            rule.weights = Vector::Constant(size, h);
            break;
        case QuadratureType::MidpointRiemann:
            rule.nodes = R(0.5) * (grid.head(size) + grid.tail(size));
            rule.weights = Vector::Constant(size, h);
            break;
        case QuadratureType::Trapezoidal:
            rule.nodes = grid;
            rule.weights = Vector::Constant(size + 1, h);
            rule.weights[0] = R(0.5) * h;
            rule.weights[size] = R(0.5) * h;
            break;
        case QuadratureType::Simpson:
            rule.nodes = grid;
            rule.weights.resize(size + 1);
            for (Eigen::Index i = 0; i <= size; ++i) {
                const R coefficient = (i == 0 || i == size) ? R(1) : (i % 2 == 1 ? R(4) : R(2));
                rule.weights[i] = coefficient * h / R(3);
            }
            break;
        default:
            throw std::invalid_argument("Unsupported QuadratureType specified.");
    }
    return rule;
}

/**
 * @brief Evaluates the integrand at one abscissa, surfacing undefined values.
 *
 * @throws NumericDomainError if f(x) is not finite, or f reports a domain/range error.
 */
template<typename R>
R sample_integrand(const std::type_identity_t<Integrand<R>>& integrand, R x)
{
    R y;
    try {
        y = integrand(x);
    } catch (const std::domain_error& e) {
        throw NumericDomainError(std::string("Integrand is undefined: ") + e.what(), static_cast<double>(x));
    } catch (const std::range_error& e) {
        throw NumericDomainError(std::string("Integrand is out of range: ") + e.what(), static_cast<double>(x));
    }
    if (!std::isfinite(y)) {
        std::ostringstream os;
        os << "Integrand is not finite at x = " << x << " (value " << y << ").";
        throw NumericDomainError(os.str(), static_cast<double>(x));
    }
    return y;
}

/**
 * @brief Samples the integrand at the nodes of a rule.
 *
 * @return Nodes, weights and integrand values (one evaluation per node).
 * @throws std::invalid_argument if the integrand is empty.
 * @throws InvalidPartitionCountError if n is not admissible for the rule.
 * @throws NumericDomainError if the integrand is not finite at some node.
 */
template<typename R = traits::DataType::PolynomialField>
QuadratureSamples<R> sample(
    QuadratureType method,
    const std::type_identity_t<Integrand<R>>& integrand,
    const Interval<R>& interval,
    unsigned int n)
{
    if (!integrand) {
        throw std::invalid_argument("Quadrature requires a valid integrand.");
    }
    NodeSet<R> rule = nodes(method, interval, n);

    QuadratureSamples<R> samples{method, n, std::move(rule.nodes), std::move(rule.weights), {}};
    samples.values.resize(samples.nodes.size());
    for (Eigen::Index i = 0; i < samples.nodes.size(); ++i) {
        samples.values[i] = sample_integrand(integrand, samples.nodes[i]);
    }
    return samples;
}

/**
 * @brief Approximates the integral of f over [a, b] with the selected rule.
 *
 * The value depends only on (integrand, interval, method, n).
 *
 * @param method Rule to apply.
 * @param integrand Function to integrate.
 * @param interval Integration interval.
 * @param n Number of subintervals (number of nodes for Gauss-Legendre).
 * @return The approximate integral, with the method, n and evaluation count.
 * @throws InvalidPartitionCountError, std::invalid_argument
 * @throws NumericDomainError if a sample or the weighted sum is not finite.
 */
template<typename R = traits::DataType::PolynomialField>
QuadratureResult<R> evaluate(
    QuadratureType method,
    const std::type_identity_t<Integrand<R>>& integrand,
    const Interval<R>& interval,
    unsigned int n)
{
    const QuadratureResult<R> result = sample(method, integrand, interval, n).to_result();
    if (!std::isfinite(result.value)) {
        std::ostringstream os;
        os << traits::to_string(method) << "(n=" << n << ") on " << interval
           << " overflowed: the weighted sum is " << result.value << ".";
        throw NumericDomainError(os.str());
    }
    return result;
}

/**
 * @brief Convenience overload taking raw bounds and a signed partition count.
 * @throws InvalidDomainError if a >= b.
 */
template<typename R = traits::DataType::PolynomialField>
QuadratureResult<R> evaluate(
    QuadratureType method,
    const std::type_identity_t<Integrand<R>>& integrand,
    R lower_bound,
    R upper_bound,
    long long n)
{
    const Interval<R> interval(lower_bound, upper_bound);
    validate_partitions(method, n);
    return evaluate(method, integrand, interval, static_cast<unsigned int>(n));
}

/// @name One entry point per rule, all with the signature (integrand, interval, n)
/// @{
template<typename R = traits::DataType::PolynomialField>
QuadratureResult<R> left_riemann(const std::type_identity_t<Integrand<R>>& integrand, const Interval<R>& interval, unsigned int n)
{
    return evaluate(QuadratureType::LeftRiemann, integrand, interval, n);
}

template<typename R = traits::DataType::PolynomialField>
QuadratureResult<R> right_riemann(const std::type_identity_t<Integrand<R>>& integrand, const Interval<R>& interval, unsigned int n)
{
    return evaluate(QuadratureType::RightRiemann, integrand, interval, n);
}

template<typename R = traits::DataType::PolynomialField>
QuadratureResult<R> midpoint_riemann(const std::type_identity_t<Integrand<R>>& integrand, const Interval<R>& interval, unsigned int n)
{
    return evaluate(QuadratureType::MidpointRiemann, integrand, interval, n);
}

template<typename R = traits::DataType::PolynomialField>
QuadratureResult<R> trapezoidal(const std::type_identity_t<Integrand<R>>& integrand, const Interval<R>& interval, unsigned int n)
{
    return evaluate(QuadratureType::Trapezoidal, integrand, interval, n);
}

template<typename R = traits::DataType::PolynomialField>
QuadratureResult<R> simpson(const std::type_identity_t<Integrand<R>>& integrand, const Interval<R>& interval, unsigned int n)
{
    return evaluate(QuadratureType::Simpson, integrand, interval, n);
}

template<typename R = traits::DataType::PolynomialField>
QuadratureResult<R> gauss_legendre(const std::type_identity_t<Integrand<R>>& integrand, const Interval<R>& interval, unsigned int n)
{
    return evaluate(QuadratureType::GaussLegendre, integrand, interval, n);
}
/// @}

} // namespace quadrature
#endif // QUADRATURE_RULES_HPP
