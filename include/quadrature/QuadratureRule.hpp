/**
 * @file QuadratureRule.hpp
 * @brief High-accuracy integrators used to produce reference values.
 *
 * This header defines three integrator adapters sharing the same integrate(f, a, b) call:
 * - quadrature::CompositeGaussLegendreQuadrature: fixed high-order Gauss-Legendre on equal panels.
 * - quadrature::BoostTanhSinhQuadrature: adapter for Boost.Math's tanh_sinh quadrature.
 * - quadrature::GSLQuadrature: adapter for GSL's QAGS adaptive Gauss-Kronrod routine, with
 *   per-call workspace management.
 *
 * Features:
 * - Type-generic (templated on floating-point type R).
 * - Finite bounds only; a >= b raises InvalidDomainError.
 * - Backend failures are reported as QuadratureError. An undefined integrand is reported as
 *   NumericDomainError by every backend, since each one samples through sample_integrand().
 * - The adaptive backends return their error estimate in IntegrationOutcome::error_estimate.
 *
 * Usage Example:
 * @code
 * #include "QuadratureRule.hpp"
 *
 * quadrature::BoostTanhSinhQuadrature<double> boost_quad;
 * double result = boost_quad.integrate([](double x) { return std::exp(-x*x); }, 0.0, 1.0).value;
 *
 * quadrature::GSLQuadrature<double> gsl_quad;
 * double gsl_result = gsl_quad.integrate([](double x) { return std::sin(x); }, 0.0, M_PI).value;
 * @endcode
 *
 */
#ifndef QUADRATURE_RULE_HPP
#define QUADRATURE_RULE_HPP

#include <cmath>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/math/policies/error_handling.hpp>
#include <boost/math/quadrature/tanh_sinh.hpp>
#include <boost/math/special_functions/fpclassify.hpp>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_integration.h>
#include "GaussLegendre.hpp"
#include "Interval.hpp"
#include "QuadratureErrors.hpp"
#include "QuadratureRules.hpp"
#include "../traits/QUADLAB_traits.hpp"

namespace quadrature {

/**
 * @brief Value returned by the reference integrators.
 */
template<typename R = traits::DataType::PolynomialField>
struct IntegrationOutcome {
    R value;
    std::optional<R> error_estimate; ///< Backend error estimate, when the backend provides one.
};

/**
 * @brief Throws NumericDomainError if an integrator produced a non-finite value.
 */
template<typename R>
R ensure_finite_result(R value, const char* backend)
{
    if (!(boost::math::isfinite)(value)) {
        throw NumericDomainError(std::string(backend) + " produced a non-finite integral.");
    }
    return value;
}

template<typename R = traits::DataType::PolynomialField>
class CompositeGaussLegendreQuadrature {
    unsigned int order_;
    unsigned int panels_;

public:
    /**
     * @brief Constructor for the composite Gauss-Legendre integrator.
     * @param order Number of Gauss nodes per panel.
     * @param panels Number of equal panels.
     */
    explicit CompositeGaussLegendreQuadrature(unsigned int order = 20, unsigned int panels = 64)
        : order_(order), panels_(panels)
    {
        if (order_ < 1 || panels_ < 1) {
            throw InvalidPartitionCountError("Composite Gauss-Legendre requires order >= 1 and panels >= 1.");
        }
    }

    IntegrationOutcome<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        const Interval<R> interval(lower_bound, upper_bound);
        const NodeSet<R> rule = composite_gauss_legendre_nodes(interval, order_, panels_);

        R total = R(0);
        for (Eigen::Index i = 0; i < rule.size(); ++i) {
            total += rule.weights[i] * sample_integrand(integrand, rule.nodes[i]);
        }
        return {ensure_finite_result(total, "Composite Gauss-Legendre"), std::nullopt};
    }

    unsigned int order() const noexcept { return order_; }
    unsigned int panels() const noexcept { return panels_; }
};

template<typename R = traits::DataType::PolynomialField>
class BoostTanhSinhQuadrature {
    R target_relative_error_;
    std::size_t max_refinements_;

public:
    /**
     * @brief Constructor for Boost tanh_sinh adapter.
     * @param relative_error Target relative error for the integration.
     * @param max_refinements Maximum number of interval halvings.
     */
    explicit BoostTanhSinhQuadrature(
        R relative_error = std::sqrt(std::numeric_limits<R>::epsilon()),
        std::size_t max_refinements = 15)
        : target_relative_error_(relative_error), max_refinements_(max_refinements) {}

    /**
     * @brief Integrates using Boost.Math's tanh_sinh quadrature.
     * @param integrand The function to integrate.
     * @param lower_bound Lower integration limit.
     * @param upper_bound Upper integration limit.
     * @return The approximate value of the definite integral and Boost's error estimate.
     */
    IntegrationOutcome<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        const Interval<R> interval(lower_bound, upper_bound);

        boost::math::quadrature::tanh_sinh<R> integrator(max_refinements_);

        R result = 0;
        R error_estimate = 0;
        R L1_norm = 0;

        const auto checked = [&integrand](R x) { return sample_integrand(integrand, x); };

        try {
            result = integrator.integrate(checked, interval.lower(), interval.upper(),
                                          target_relative_error_, &error_estimate, &L1_norm);
        } catch (const QuadratureError&) {
            throw;
        } catch (const boost::math::evaluation_error& e) {
            throw NumericDomainError(std::string("Boost quadrature failed: ") + e.what());
        } catch (const std::domain_error& e) {
            // Boost reports singular evaluations as domain errors
            throw NumericDomainError(std::string("Boost quadrature failed: ") + e.what());
        } catch (const std::exception& e) {
            throw QuadratureError(std::string("Boost quadrature failed: ") + e.what());
        }

        return {ensure_finite_result(result, "Boost tanh_sinh"), error_estimate};
    }

    R tolerance() const noexcept { return target_relative_error_; }
};


// --- C-style wrapper for GSL ---
template<typename R = traits::DataType::PolynomialField>
struct GSLIntegrationWrapper {
    const std::function<R(R)>* integrand;
    std::exception_ptr failure; ///< First exception raised by the integrand, rethrown after GSL returns.

    // Must be static to be convertible to a C function pointer
    static double gsl_func_adapter(double x, void* params) {
        auto* self = static_cast<GSLIntegrationWrapper*>(params);
        if (self->failure) {
            return 0.0;
        }
        // GSL cannot propagate C++ exceptions across the C boundary: record and rethrow later.
        try {
            return static_cast<double>(sample_integrand(*self->integrand, static_cast<R>(x)));
        } catch (const std::exception&) {
            self->failure = std::current_exception();
            return 0.0;
        }
    }
};

/**
 * @brief Switches the process-wide GSL error handler off, exactly once.
 *
 * GSL then reports failures through return codes only, which are converted to exceptions.
 * The handler is never restored, so concurrent integrations all see the same handler.
 */
inline void disable_gsl_error_handler()
{
    static std::once_flag disabled;
    std::call_once(disabled, [] { gsl_set_error_handler_off(); });
}

template<typename R = traits::DataType::PolynomialField>
class GSLQuadrature {
private:
    std::size_t workspace_size_;
    R target_absolute_error_;
    R target_relative_error_;

    // RAII wrapper for gsl_integration_workspace
    using GSLWorkspacePtr = std::unique_ptr<gsl_integration_workspace, decltype(&gsl_integration_workspace_free)>;

    GSLWorkspacePtr create_workspace() const {
        gsl_integration_workspace* ws = gsl_integration_workspace_alloc(workspace_size_);
        if (!ws) {
            throw QuadratureError("Failed to allocate GSL workspace");
        }
        return GSLWorkspacePtr(ws, gsl_integration_workspace_free);
    }

public:
    /**
     * @brief Constructor for GSL adaptive quadrature adapter.
     * @param absolute_error Target absolute error.
     * @param relative_error Target relative error.
     * @param workspace_limit Max number of subintervals for the workspace.
     */
    explicit GSLQuadrature(
        R absolute_error = 1e-12,
        R relative_error = 1e-12,
        std::size_t workspace_limit = 1000)
        :
        workspace_size_(workspace_limit),
        target_absolute_error_(absolute_error),
        target_relative_error_(relative_error)
    {
        if (workspace_size_ == 0) {
            throw std::invalid_argument("GSL workspace limit must be positive.");
        }
        disable_gsl_error_handler();
    }

    /**
     * @brief Integrates over a finite interval using GSL's QAGS routine.
     * @param integrand The function to integrate.
     * @param lower_bound Lower integration limit.
     * @param upper_bound Upper integration limit.
     * @return The approximate value of the definite integral and GSL's error estimate.
     */
    IntegrationOutcome<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        const Interval<R> interval(lower_bound, upper_bound);

        GSLIntegrationWrapper<R> wrapper{&integrand, nullptr};
        gsl_function F;
        F.function = &GSLIntegrationWrapper<R>::gsl_func_adapter;
        F.params = &wrapper;

        double result = 0.0;
        double error_estimate = 0.0;

        // Allocate workspace per call for thread safety
        GSLWorkspacePtr workspace = create_workspace();

        const int status = gsl_integration_qags(&F,
                                                static_cast<double>(interval.lower()),
                                                static_cast<double>(interval.upper()),
                                                static_cast<double>(target_absolute_error_),
                                                static_cast<double>(target_relative_error_),
                                                workspace_size_,
                                                workspace.get(),
                                                &result, &error_estimate);

        if (wrapper.failure) {
            std::rethrow_exception(wrapper.failure);
        }

        // --- GSL Error Handling ---
        if (status != GSL_SUCCESS) {
            throw QuadratureError(std::string("GSL integration failed: ") + gsl_strerror(status));
        }

        return {ensure_finite_result(static_cast<R>(result), "GSL QAGS"), static_cast<R>(error_estimate)};
    }

    R absolute_tolerance() const noexcept { return target_absolute_error_; }
    R relative_tolerance() const noexcept { return target_relative_error_; }
};

} // namespace quadrature
#endif // QUADRATURE_RULE_HPP
