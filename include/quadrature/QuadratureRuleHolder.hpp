/**
 * @file QuadratureRuleHolder.hpp
 * @brief Defines the QuadratureRuleHolder class, a type-erased holder for the reference integrators.
 *
 * This header provides the QuadratureRuleHolder template class, which acts as a runtime-polymorphic wrapper
 * for the reference integrator implementations (composite Gauss-Legendre, Boost Tanh-Sinh, GSL QAGS).
 * The holder enables selection of a backend at run time through traits::ReferenceMethod, supporting both
 * default and parameterized construction. Deep copy and move semantics are implemented.
 *
 */
#ifndef QUADRATURE_RULE_HOLDER_HPP
#define QUADRATURE_RULE_HOLDER_HPP

#include <memory>
#include <stdexcept>
#include <utility>
#include "QuadratureWrappers.hpp"
#include "../traits/QUADLAB_traits.hpp"

namespace quadrature {
using ReferenceType = traits::ReferenceMethod;

/**
 * @brief A holder class for the reference integrators.
 *
 * @tparam R The floating-point type used for integration (e.g., float, double).
 */
template<typename R>
class QuadratureRuleHolder {
private:
    std::unique_ptr<IQuadratureRule<R>> p_rule_;

public:
    /**
     * @brief Constructor selecting rule based on enum. Uses default parameters for rules.
     *
     * @param type The enum value specifying which integrator to use.
     * @throws std::invalid_argument If an unsupported type is specified.
     */
    explicit QuadratureRuleHolder(ReferenceType type) {
        switch (type) {
            case ReferenceType::GaussLegendre:
                p_rule_ = std::make_unique<GaussLegendreQuadratureWrapper<R>>();
                break;
            case ReferenceType::TanhSinh:
                p_rule_ = std::make_unique<BoostQuadratureWrapper<R>>();
                break;
            case ReferenceType::QAGS:
                p_rule_ = std::make_unique<GSLQuadratureWrapper<R>>();
                break;
            default:
                throw std::invalid_argument("Unsupported ReferenceMethod specified.");
        }
    }

    /**
     * @brief Constructor for composite Gauss-Legendre with a custom order and panel count.
     *
     * @throws std::invalid_argument If the type is not GaussLegendre.
     */
    QuadratureRuleHolder(ReferenceType type, unsigned int order, unsigned int panels) {
        if (type != ReferenceType::GaussLegendre)
            throw std::invalid_argument("Order/panel constructor only valid for GaussLegendre");
        p_rule_ = std::make_unique<GaussLegendreQuadratureWrapper<R>>(order, panels);
    }

    /**
     * @brief Constructor for Boost quadrature with a custom tolerance.
     *
     * @param type Must be ReferenceType::TanhSinh.
     * @param boost_tolerance Desired relative error tolerance for Boost quadrature.
     * @throws std::invalid_argument If the type is not TanhSinh.
     */
    QuadratureRuleHolder(ReferenceType type, R boost_tolerance) {
         if (type != ReferenceType::TanhSinh)
            throw std::invalid_argument("Tolerance parameter constructor only valid for TanhSinh");
         p_rule_ = std::make_unique<BoostQuadratureWrapper<R>>(boost_tolerance);
    }

    /**
     * @brief Constructor for GSL quadrature with custom absolute/relative tolerances and workspace size.
     *
     * @throws std::invalid_argument If the type is not QAGS.
     */
    QuadratureRuleHolder(ReferenceType type, R gsl_abs_tol, R gsl_rel_tol, std::size_t gsl_ws_size) {
         if (type != ReferenceType::QAGS)
             throw std::invalid_argument("GSL parameter constructor only valid for QAGS");
         p_rule_ = std::make_unique<GSLQuadratureWrapper<R>>(gsl_abs_tol, gsl_rel_tol, gsl_ws_size);
    }

    /**
     * @brief Copy constructor. Performs a deep copy using the clone interface.
     */
    QuadratureRuleHolder(const QuadratureRuleHolder& other)
        : p_rule_(other.p_rule_ ? other.p_rule_->clone() : nullptr) {}

    /**
     * @brief Copy assignment operator. Performs a deep copy using the clone interface.
     */
    QuadratureRuleHolder& operator=(const QuadratureRuleHolder& other) {
        if (this != &other) {
             // Clone before releasing the old pointer
             p_rule_ = other.p_rule_ ? other.p_rule_->clone() : nullptr;
        }
        return *this;
    }

    QuadratureRuleHolder(QuadratureRuleHolder&& other) noexcept = default;
    QuadratureRuleHolder& operator=(QuadratureRuleHolder&& other) noexcept = default;

    /**
     * @brief Default constructor. Leaves the internal rule uninitialized.
     */
    QuadratureRuleHolder() = default;

    /**
     * @brief Integrates the given function over the specified interval using the held rule.
     *
     * @throws std::runtime_error If no rule has been initialized.
     */
    IntegrationOutcome<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        if (!p_rule_) {
            throw std::runtime_error("QuadratureRuleHolder is not initialized with a rule.");
        }
        return p_rule_->integrate(integrand, lower_bound, upper_bound);
    }

    /**
     * @brief Backend held by this holder.
     * @throws std::runtime_error If no rule has been initialized.
     */
    ReferenceType method() const {
        if (!p_rule_) {
            throw std::runtime_error("QuadratureRuleHolder is not initialized with a rule.");
        }
        return p_rule_->method();
    }

    bool is_initialized() const {
        return p_rule_ != nullptr;
    }
};

} // namespace quadrature
#endif // QUADRATURE_RULE_HOLDER_HPP
