/**
 * @file QuadratureWrappers.hpp
 * @brief Provides wrapper classes exposing the reference integrators through IQuadratureRule.
 *
 * Dependencies:
 * - QuadratureRule.hpp: Concrete integrators (Gauss-Legendre, Boost, GSL).
 * - QuadratureRuleAbstract.hpp: Abstract interface for reference integrators.
 *
 */
#ifndef QUADRATURE_WRAPPERS_HPP
#define QUADRATURE_WRAPPERS_HPP

#include <memory>
#include "QuadratureRule.hpp"
#include "QuadratureRuleAbstract.hpp"

namespace quadrature {

/**
 * @class GaussLegendreQuadratureWrapper
 * @tparam R The floating-point type used for integration (e.g., double).
 * @brief Wrapper for the composite Gauss-Legendre integrator.
 */
template<typename R = traits::DataType::PolynomialField>
class GaussLegendreQuadratureWrapper final : public IQuadratureRule<R> {
    CompositeGaussLegendreQuadrature<R> rule_;
public:
    explicit GaussLegendreQuadratureWrapper(const CompositeGaussLegendreQuadrature<R>& rule)
        : rule_(rule) {}

    explicit GaussLegendreQuadratureWrapper(unsigned int order = 20, unsigned int panels = 64)
        : rule_(order, panels) {}

    IntegrationOutcome<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const override {
        return rule_.integrate(integrand, lower_bound, upper_bound);
    }

    traits::ReferenceMethod method() const noexcept override { return traits::ReferenceMethod::GaussLegendre; }

    std::unique_ptr<IQuadratureRule<R>> clone() const override {
        return std::make_unique<GaussLegendreQuadratureWrapper<R>>(rule_);
    }
};

/**
 * @class BoostQuadratureWrapper
 * @tparam R The floating-point type used for integration (e.g., double).
 * @brief Wrapper for the Boost Tanh-Sinh quadrature rule.
 *
 * - `integrate`: Performs numerical integration using the wrapped Boost rule.
 * - `clone`: Creates a deep copy of the wrapper and its underlying rule.
 */
template<typename R = traits::DataType::PolynomialField>
class BoostQuadratureWrapper final : public IQuadratureRule<R> {
    BoostTanhSinhQuadrature<R> rule_;
public:
    // Constructor taking the specific rule instance
    explicit BoostQuadratureWrapper(const BoostTanhSinhQuadrature<R>& rule)
        : rule_(rule) {}

    // Constructor taking parameters to create the rule internally
    explicit BoostQuadratureWrapper(R relative_error = std::sqrt(std::numeric_limits<R>::epsilon()))
        : rule_(relative_error) {}

    IntegrationOutcome<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const override {
        return rule_.integrate(integrand, lower_bound, upper_bound);
    }

    traits::ReferenceMethod method() const noexcept override { return traits::ReferenceMethod::TanhSinh; }

    std::unique_ptr<IQuadratureRule<R>> clone() const override {
        return std::make_unique<BoostQuadratureWrapper<R>>(rule_);
    }
};

/**
 * @class GSLQuadratureWrapper
 * @tparam R The floating-point type used for integration (e.g., double).
 * @brief Wrapper for the GSL QAGS adaptive quadrature rule.
 */
template<typename R = traits::DataType::PolynomialField>
class GSLQuadratureWrapper final : public IQuadratureRule<R> {
    GSLQuadrature<R> rule_;
public:
    explicit GSLQuadratureWrapper(const GSLQuadrature<R>& rule)
        : rule_(rule) {}

    explicit GSLQuadratureWrapper(
        R absolute_error = 1e-12,
        R relative_error = 1e-12,
        std::size_t workspace_limit = 1000)
        : rule_(absolute_error, relative_error, workspace_limit) {}

    IntegrationOutcome<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const override {
        return rule_.integrate(integrand, lower_bound, upper_bound);
    }

    traits::ReferenceMethod method() const noexcept override { return traits::ReferenceMethod::QAGS; }

    std::unique_ptr<IQuadratureRule<R>> clone() const override {
        return std::make_unique<GSLQuadratureWrapper<R>>(rule_);
    }
};

} // namespace quadrature
#endif // QUADRATURE_WRAPPERS_HPP
