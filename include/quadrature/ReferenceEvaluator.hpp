/**
 * @file ReferenceEvaluator.hpp
 * @brief Produces the ground-truth integral against which quadrature errors are measured.
 *
 * A reference value is either supplied by the caller as an exact closed form, or computed by a
 * high-accuracy backend selected through ReferenceOptions (composite Gauss-Legendre by default,
 * Boost tanh-sinh or GSL QAGS otherwise). The origin of the value is recorded in the returned
 * ReferenceValue: an exact value always takes precedence when one is supplied.
 *
 * Usage Example:
 * @code
 * quadrature::Interval<double> unit(0.0, 1.0);
 * auto square = [](double x) { return x * x; };
 * auto exact = quadrature::reference<double>(square, unit, 1.0 / 3.0);   // source == Exact
 * auto numeric = quadrature::reference<double>(square, unit);            // source == Numerical
 * @endcode
 */
#ifndef REFERENCE_EVALUATOR_HPP
#define REFERENCE_EVALUATOR_HPP

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <type_traits>
#include "Interval.hpp"
#include "QuadratureErrors.hpp"
#include "QuadratureRuleHolder.hpp"
#include "../polynomials/Polynomials.hpp"
#include "../traits/QUADLAB_traits.hpp"

namespace quadrature {

/**
 * @enum ReferenceSource
 * @brief Origin of a reference value.
 */
enum class ReferenceSource
{
    Exact,     ///< Closed form supplied by the caller.
    Numerical  ///< Computed by a high-accuracy backend.
};

template<typename R = traits::DataType::PolynomialField>
struct ReferenceValue {
    R value;
    ReferenceSource source;
    std::optional<ReferenceType> method;   ///< Backend used, for numerical values.
    std::optional<R> error_estimate;       ///< Backend error estimate, when available.

    bool is_exact() const noexcept { return source == ReferenceSource::Exact; }
};

/**
 * @brief Configuration of the numerical reference backend.
 */
template<typename R = traits::DataType::PolynomialField>
struct ReferenceOptions {
    ReferenceType method = ReferenceType::GaussLegendre;
    unsigned int gauss_order = 20;          ///< Nodes per panel (GaussLegendre).
    unsigned int gauss_panels = 64;         ///< Number of panels (GaussLegendre).
    R relative_tolerance = R(1e-12);        ///< Target relative error (TanhSinh, QAGS).
    R absolute_tolerance = R(1e-12);        ///< Target absolute error (QAGS).
    std::size_t workspace_limit = 1000;     ///< Maximum number of subintervals (QAGS).
};

/**
 * @brief Computes reference values with a configured backend.
 *
 * The evaluator holds no mutable state: one instance may serve concurrent callers.
 */
template<typename R = traits::DataType::PolynomialField>
class ReferenceEvaluator {
public:
    explicit ReferenceEvaluator(const ReferenceOptions<R>& options = ReferenceOptions<R>())
        : options_(options), integrator_(make_holder(options)) {}

    /**
     * @brief Returns the caller's exact value when present, a numerical estimate otherwise.
     *
     * @param integrand Function to integrate.
     * @param interval Integration interval.
     * @param exact_value Closed-form value of the integral, if known.
     * @throws NumericDomainError if the value (exact or numerical) is not finite.
     */
    ReferenceValue<R> operator()(
        const std::function<R(R)>& integrand,
        const Interval<R>& interval,
        std::optional<R> exact_value = std::nullopt) const
    {
        if (exact_value) {
            return exact(*exact_value);
        }
        return numerical(integrand, interval);
    }

    /**
     * @brief Wraps a closed-form value.
     * @throws NumericDomainError if the value is not finite.
     */
    static ReferenceValue<R> exact(R value)
    {
        if (!std::isfinite(value)) {
            throw NumericDomainError("Exact reference value must be finite.");
        }
        return {value, ReferenceSource::Exact, std::nullopt, std::nullopt};
    }

    /**
     * @brief Exact reference of a polynomial integrand, from its antiderivative.
     */
    template<unsigned int N>
    static ReferenceValue<R> exact(const polynomials::Polynomial<N, R>& polynomial, const Interval<R>& interval)
    {
        return exact(polynomials::integral(polynomial, interval.lower(), interval.upper()));
    }

    /**
     * @brief Estimates the integral with the configured backend.
     * @throws NumericDomainError if the integrand is undefined on the interval.
     * @throws QuadratureError if the backend fails.
     */
    ReferenceValue<R> numerical(const std::function<R(R)>& integrand, const Interval<R>& interval) const
    {
        if (!integrand) {
            throw std::invalid_argument("Reference evaluation requires a valid integrand.");
        }
        const IntegrationOutcome<R> outcome = integrator_.integrate(integrand, interval.lower(), interval.upper());

        if (outcome.error_estimate) {
            const R tolerance = std::max(options_.absolute_tolerance,
                                         options_.relative_tolerance * std::abs(outcome.value));
            if (*outcome.error_estimate > tolerance) {
                std::cerr << "Warning: " << traits::to_string(integrator_.method())
                          << " reference on " << interval << " has error estimate "
                          << *outcome.error_estimate << " above the requested tolerance " << tolerance << ".\n";
            }
        }
        return {outcome.value, ReferenceSource::Numerical, integrator_.method(), outcome.error_estimate};
    }

    const ReferenceOptions<R>& options() const noexcept { return options_; }

private:
    ReferenceOptions<R> options_;
    QuadratureRuleHolder<R> integrator_;

    static QuadratureRuleHolder<R> make_holder(const ReferenceOptions<R>& options)
    {
        switch (options.method) {
            case ReferenceType::GaussLegendre:
                return QuadratureRuleHolder<R>(options.method, options.gauss_order, options.gauss_panels);
            case ReferenceType::TanhSinh:
                return QuadratureRuleHolder<R>(options.method, options.relative_tolerance);
            case ReferenceType::QAGS:
                return QuadratureRuleHolder<R>(options.method, options.absolute_tolerance,
                                               options.relative_tolerance, options.workspace_limit);
        }
        throw std::invalid_argument("Unsupported ReferenceMethod specified.");
    }
};

/**
 * @brief Reference value of the integral of f over an interval.
 *
 * An exact value, when supplied, takes precedence over the numerical estimate and is tagged
 * ReferenceSource::Exact in the result.
 */
template<typename R = traits::DataType::PolynomialField>
ReferenceValue<R> reference(
    const std::type_identity_t<std::function<R(R)>>& integrand,
    const Interval<R>& interval,
    std::optional<R> exact_value = std::nullopt,
    const ReferenceOptions<R>& options = ReferenceOptions<R>())
{
    return ReferenceEvaluator<R>(options)(integrand, interval, exact_value);
}

template<typename R, unsigned int N>
ReferenceValue<R> exact_reference(const polynomials::Polynomial<N, R>& polynomial, const Interval<R>& interval)
{
    return ReferenceEvaluator<R>::exact(polynomial, interval);
}

template<typename R>
std::ostream& operator<<(std::ostream& out, const ReferenceValue<R>& reference)
{
    out << reference.value << (reference.is_exact() ? " (exact)" : " (numerical");
    if (!reference.is_exact() && reference.method) {
        out << ", " << traits::to_string(*reference.method);
        if (reference.error_estimate) {
            out << ", est. error " << *reference.error_estimate;
        }
        out << ")";
    } else if (!reference.is_exact()) {
        out << ")";
    }
    return out;
}

} // namespace quadrature
#endif // REFERENCE_EVALUATOR_HPP
