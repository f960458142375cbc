/**
 * @file Comparison.hpp
 * @brief Side-by-side evaluation of two quadrature rules on identical inputs.
 *
 * compare() evaluates both rules with the same integrand, interval and partition count, so the
 * two results can be overlaid directly. When a reference value is supplied, the absolute error
 * of each rule is attached and the more accurate one can be queried.
 */
#ifndef QUADRATURE_COMPARISON_HPP
#define QUADRATURE_COMPARISON_HPP

#include <cmath>
#include <functional>
#include <optional>
#include <type_traits>
#include "Interval.hpp"
#include "QuadratureResult.hpp"
#include "QuadratureRules.hpp"
#include "ReferenceEvaluator.hpp"

namespace quadrature {

template<typename R = traits::DataType::PolynomialField>
struct MethodComparison {
    QuadratureResult<R> first;
    QuadratureResult<R> second;
    std::optional<R> first_error;   ///< |first.value - reference|, when a reference was given
    std::optional<R> second_error;  ///< |second.value - reference|, when a reference was given

    /// first.value - second.value
    R difference() const noexcept { return first.value - second.value; }

    /**
     * @brief Method with the smaller absolute error.
     * @return Nothing without a reference, or when both errors are equal.
     */
    std::optional<QuadratureType> more_accurate() const noexcept {
        if (!first_error || !second_error || *first_error == *second_error) {
            return std::nullopt;
        }
        return *first_error < *second_error ? first.method : second.method;
    }
};

/**
 * @brief Evaluates two rules on the same integrand, interval and partition count.
 *
 * Both partition counts are validated before either rule runs, so a comparison either
 * returns both results or fails without partial work.
 *
 * @throws InvalidPartitionCountError if n is not admissible for either rule.
 * @throws NumericDomainError if the integrand is undefined at a node of either rule.
 */
template<typename R = traits::DataType::PolynomialField>
MethodComparison<R> compare(
    QuadratureType method_a,
    QuadratureType method_b,
    const std::type_identity_t<std::function<R(R)>>& integrand,
    const Interval<R>& interval,
    unsigned int n)
{
    validate_partitions(method_a, n);
    validate_partitions(method_b, n);
    return {evaluate<R>(method_a, integrand, interval, n),
            evaluate<R>(method_b, integrand, interval, n),
            std::nullopt, std::nullopt};
}

/**
 * @brief As compare(), with the absolute error of each rule against a reference.
 */
template<typename R = traits::DataType::PolynomialField>
MethodComparison<R> compare(
    QuadratureType method_a,
    QuadratureType method_b,
    const std::type_identity_t<std::function<R(R)>>& integrand,
    const Interval<R>& interval,
    unsigned int n,
    const ReferenceValue<R>& reference)
{
    MethodComparison<R> comparison = compare<R>(method_a, method_b, integrand, interval, n);
    comparison.first_error = std::abs(comparison.first.value - reference.value);
    comparison.second_error = std::abs(comparison.second.value - reference.value);
    return comparison;
}

} // namespace quadrature
#endif // QUADRATURE_COMPARISON_HPP
