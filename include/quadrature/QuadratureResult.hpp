/**
 * @file QuadratureResult.hpp
 * @brief Value types produced by the quadrature rules.
 *
 * - QuadratureResult: the approximate integral together with the method and partition count
 *   that produced it, and the number of integrand evaluations spent.
 * - NodeSet: abscissae and weights of a rule on a given interval.
 * - QuadratureSamples: a NodeSet plus the integrand values at its nodes, i.e. everything a
 *   plotting layer needs to draw the rectangles, trapezoids or parabolas of a rule.
 */
#ifndef QUADRATURE_RESULT_HPP
#define QUADRATURE_RESULT_HPP

#include <cstddef>
#include <ostream>
#include "../traits/QUADLAB_traits.hpp"

namespace quadrature {

using QuadratureType = traits::QuadratureMethod;

template<typename R = traits::DataType::PolynomialField>
struct QuadratureResult {
    R value;                    ///< Approximate value of the definite integral.
    QuadratureType method;      ///< Rule used.
    unsigned int partitions;    ///< Number of subintervals (number of nodes for Gauss-Legendre).
    std::size_t evaluations;    ///< Number of integrand evaluations performed.
};

/**
 * @brief Nodes and weights of a quadrature rule, ordered by ascending abscissa.
 */
template<typename R = traits::DataType::PolynomialField>
struct NodeSet {
    using Vector = Eigen::Matrix<R, Eigen::Dynamic, 1>;

    Vector nodes;
    Vector weights;

    Eigen::Index size() const noexcept { return nodes.size(); }
};

/**
 * @brief Nodes, weights and integrand values of one evaluation.
 */
template<typename R = traits::DataType::PolynomialField>
struct QuadratureSamples {
    using Vector = typename NodeSet<R>::Vector;

    QuadratureType method;
    unsigned int partitions;
    Vector nodes;
    Vector weights;
    Vector values;

    /**
     * @brief Weighted sum of the sampled values.
     *
     * Accumulated strictly left to right in node order, so two evaluations of the same rule
     * agree to the last bit. The sum may overflow even when every value is finite; the rules
     * check it before reporting a result.
     */
    R weighted_sum() const noexcept {
        R total = R(0);
        for (Eigen::Index i = 0; i < nodes.size(); ++i) {
            total += weights[i] * values[i];
        }
        return total;
    }

    QuadratureResult<R> to_result() const noexcept {
        return {weighted_sum(), method, partitions, static_cast<std::size_t>(values.size())};
    }
};

template<typename R>
std::ostream& operator<<(std::ostream& out, const QuadratureResult<R>& result)
{
    return out << traits::to_string(result.method) << "(n=" << result.partitions << ") = " << result.value;
}

} // namespace quadrature
#endif // QUADRATURE_RESULT_HPP
