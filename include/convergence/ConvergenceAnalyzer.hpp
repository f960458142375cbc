/**
 * @file ConvergenceAnalyzer.hpp
 * @brief Error series and empirical convergence order of a quadrature rule.
 *
 * For a rule and an ascending sequence of partition counts n_1 < n_2 < ... < n_k, the analyzer
 * evaluates the rule at each count and measures the absolute error against a reference value.
 * The empirical order p is the slope of the least-squares line through (log h, log error),
 * h = (b - a) / n, i.e. error ~ C h^p.
 *
 * Samples whose error lies below a configurable floor (default 1e-14) are kept in the series
 * but excluded from the fit: at that level the measured error is floating-point rounding, not
 * truncation error. With fewer than two usable samples the order is undefined.
 *
 * Usage Example:
 * @code
 * quadrature::Interval<double> unit(0.0, 1.0);
 * auto square = [](double x) { return x * x; };
 * auto exact = quadrature::reference<double>(square, unit, 1.0 / 3.0);
 * auto series = convergence::convergence<double>(traits::QuadratureMethod::Trapezoidal,
 *                                                square, unit, {10, 20, 40, 80}, exact);
 * std::cout << series.order() << std::endl; // ~2
 * @endcode
 */
#ifndef CONVERGENCE_ANALYZER_HPP
#define CONVERGENCE_ANALYZER_HPP

#include <cmath>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "../quadrature/Interval.hpp"
#include "../quadrature/QuadratureErrors.hpp"
#include "../quadrature/QuadratureRules.hpp"
#include "../quadrature/ReferenceEvaluator.hpp"
#include "../traits/QUADLAB_traits.hpp"
#include "../utils/Utils.hpp"

namespace convergence {

using QuadratureType = traits::QuadratureMethod;

/**
 * @brief Error of one rule at one partition count.
 */
template<typename R = traits::DataType::PolynomialField>
struct ErrorSample {
    unsigned int partitions;       ///< n
    R step;                        ///< h = (b - a) / n
    R approximation;               ///< Rule value at n
    R absolute_error;              ///< |approximation - reference|
    std::optional<R> relative_error; ///< absolute_error / |reference|, absent for a zero reference
    bool used_in_fit;              ///< False when the error is below the floor
};

/**
 * @brief Configuration of a convergence study.
 */
template<typename R = traits::DataType::PolynomialField>
struct ConvergenceOptions {
    R error_floor = R(1e-14);       ///< Errors below this value are excluded from the order fit.
    bool parallel = false;          ///< Evaluate the partition counts concurrently (OpenMP).
    bool warn_on_exclusion = true;  ///< Report excluded samples on std::cerr.
};

/**
 * @brief Ordered error samples of one rule, with the fitted convergence order.
 */
template<typename R = traits::DataType::PolynomialField>
class ConvergenceSeries {
public:
    ConvergenceSeries(QuadratureType method,
                      quadrature::ReferenceValue<R> reference,
                      std::vector<ErrorSample<R>> samples,
                      std::optional<Utils::LinearFit<R>> fit,
                      std::vector<R> local_orders)
        : method_(method)
        , reference_(std::move(reference))
        , samples_(std::move(samples))
        , fit_(std::move(fit))
        , local_orders_(std::move(local_orders)) {}

    QuadratureType method() const noexcept { return method_; }
    const quadrature::ReferenceValue<R>& reference() const noexcept { return reference_; }
    const std::vector<ErrorSample<R>>& samples() const noexcept { return samples_; }

    /// True when at least two samples passed the error floor.
    bool has_order() const noexcept { return fit_.has_value(); }

    /// Estimated order p, or nothing when undefined.
    std::optional<R> order_estimate() const noexcept {
        return fit_ ? std::optional<R>(fit_->slope) : std::nullopt;
    }

    /**
     * @brief Estimated convergence order p (error ~ C h^p).
     * @throws quadrature::InsufficientSamplesError if fewer than two samples passed the floor.
     */
    R order() const {
        if (!fit_) {
            throw quadrature::InsufficientSamplesError(
                "Convergence order of " + std::string(traits::to_string(method_)) + " is undefined: "
                + std::to_string(fitted_samples()) + " of " + std::to_string(samples_.size())
                + " samples lie above the error floor, at least 2 are required.");
        }
        return fit_->slope;
    }

    /// Error constant C of the fit error ~ C h^p.
    std::optional<R> constant() const noexcept {
        return fit_ ? std::optional<R>(std::exp(fit_->intercept)) : std::nullopt;
    }

    /// Orders between consecutive samples used in the fit.
    const std::vector<R>& local_orders() const noexcept { return local_orders_; }

    std::size_t fitted_samples() const noexcept {
        std::size_t count = 0;
        for (const auto& sample : samples_) {
            count += sample.used_in_fit ? 1 : 0;
        }
        return count;
    }

    /// Partition counts as an Eigen vector, for plotting.
    traits::DataType::StoringVector partitions() const {
        traits::DataType::StoringVector n(samples_.size());
        for (std::size_t i = 0; i < samples_.size(); ++i) {
            n[static_cast<Eigen::Index>(i)] = samples_[i].partitions;
        }
        return n;
    }

    /// Absolute errors as an Eigen vector, for plotting.
    traits::DataType::StoringVector absolute_errors() const {
        traits::DataType::StoringVector e(samples_.size());
        for (std::size_t i = 0; i < samples_.size(); ++i) {
            e[static_cast<Eigen::Index>(i)] = samples_[i].absolute_error;
        }
        return e;
    }

private:
    QuadratureType method_;
    quadrature::ReferenceValue<R> reference_;
    std::vector<ErrorSample<R>> samples_;
    std::optional<Utils::LinearFit<R>> fit_;
    std::vector<R> local_orders_;
};

/**
 * @brief Checks that a sequence of partition counts is non-empty, strictly increasing and
 *        admissible for the rule.
 * @throws quadrature::InvalidPartitionCountError otherwise.
 */
inline void validate_sequence(QuadratureType method, const std::vector<unsigned int>& n_sequence)
{
    if (n_sequence.empty()) {
        throw quadrature::InvalidPartitionCountError("Convergence analysis requires at least one partition count.");
    }
    for (std::size_t i = 0; i < n_sequence.size(); ++i) {
        quadrature::validate_partitions(method, n_sequence[i]);
        if (i > 0 && n_sequence[i] <= n_sequence[i - 1]) {
            throw quadrature::InvalidPartitionCountError(
                "Partition counts must be strictly increasing (" + std::to_string(n_sequence[i - 1])
                + " is followed by " + std::to_string(n_sequence[i]) + ").");
        }
    }
}

/**
 * @brief Runs convergence studies with a fixed configuration.
 */
template<typename R = traits::DataType::PolynomialField>
class ConvergenceAnalyzer {
public:
    explicit ConvergenceAnalyzer(const ConvergenceOptions<R>& options = ConvergenceOptions<R>())
        : options_(options)
    {
        if (!(options_.error_floor >= R(0)) || !std::isfinite(options_.error_floor)) {
            throw std::invalid_argument("Error floor must be a finite non-negative number.");
        }
    }

    /**
     * @brief Computes the error series of a rule and fits its convergence order.
     *
     * @param method Rule to study.
     * @param integrand Function to integrate.
     * @param interval Integration interval.
     * @param n_sequence Strictly increasing partition counts.
     * @param reference Ground truth for the same integrand and interval.
     * @return The series, ordered as n_sequence.
     * @throws quadrature::InvalidPartitionCountError for a malformed sequence.
     * @throws quadrature::NumericDomainError if the integrand is undefined at a node.
     */
    ConvergenceSeries<R> analyze(
        QuadratureType method,
        const std::function<R(R)>& integrand,
        const quadrature::Interval<R>& interval,
        const std::vector<unsigned int>& n_sequence,
        const quadrature::ReferenceValue<R>& reference) const
    {
        validate_sequence(method, n_sequence);
        if (!integrand) {
            throw std::invalid_argument("Convergence analysis requires a valid integrand.");
        }

        const std::size_t count = n_sequence.size();
        std::vector<R> approximations(count, R(0));
        std::vector<std::exception_ptr> failures(count);

        const long long last = static_cast<long long>(count);
        // Each count writes its own slot, so the result does not depend on the schedule.
        #pragma omp parallel for schedule(dynamic) if(options_.parallel)
        for (long long i = 0; i < last; ++i) {
            try {
                approximations[i] = quadrature::evaluate<R>(method, integrand, interval, n_sequence[i]).value;
            } catch (...) {
                failures[i] = std::current_exception();
            }
        }
        for (const auto& failure : failures) {
            if (failure) {
                std::rethrow_exception(failure);
            }
        }

        std::vector<ErrorSample<R>> samples;
        samples.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            const R error = std::abs(approximations[i] - reference.value);
            std::optional<R> relative;
            if (reference.value != R(0)) {
                relative = error / std::abs(reference.value);
            }
            const bool usable = std::isfinite(error) && error >= options_.error_floor && error > R(0);
            samples.push_back({n_sequence[i], interval.step(n_sequence[i]), approximations[i], error, relative, usable});
        }

        return build_series(method, reference, std::move(samples));
    }

    const ConvergenceOptions<R>& options() const noexcept { return options_; }

private:
    ConvergenceOptions<R> options_;

    ConvergenceSeries<R> build_series(
        QuadratureType method,
        const quadrature::ReferenceValue<R>& reference,
        std::vector<ErrorSample<R>> samples) const
    {
        std::vector<const ErrorSample<R>*> kept;
        for (const auto& sample : samples) {
            if (sample.used_in_fit) {
                kept.push_back(&sample);
            }
        }

        if (options_.warn_on_exclusion && kept.size() < samples.size()) {
            std::cerr << "Warning: " << samples.size() - kept.size() << " of " << samples.size()
                      << " " << traits::to_string(method) << " samples are below the error floor "
                      << options_.error_floor << " and were excluded from the order fit.\n";
        }

        std::optional<Utils::LinearFit<R>> fit;
        std::vector<R> local_orders;
        if (kept.size() >= 2) {
            traits::DataType::StoringVector log_h(kept.size());
            traits::DataType::StoringVector log_e(kept.size());
            for (std::size_t j = 0; j < kept.size(); ++j) {
                log_h[static_cast<Eigen::Index>(j)] = std::log(kept[j]->step);
                log_e[static_cast<Eigen::Index>(j)] = std::log(kept[j]->absolute_error);
            }
            fit = Utils::linear_least_squares<R>(log_h, log_e);

            local_orders.reserve(kept.size() - 1);
            for (std::size_t j = 0; j + 1 < kept.size(); ++j) {
                local_orders.push_back(std::log(kept[j]->absolute_error / kept[j + 1]->absolute_error)
                                       / std::log(kept[j]->step / kept[j + 1]->step));
            }
        }

        return ConvergenceSeries<R>(method, reference, std::move(samples), fit, std::move(local_orders));
    }
};

/**
 * @brief Error series of a rule over a sequence of partition counts, with its fitted order.
 *
 * @param error_floor Errors below this value are excluded from the fit (default 1e-14).
 */
template<typename R = traits::DataType::PolynomialField>
ConvergenceSeries<R> convergence(
    QuadratureType method,
    const std::type_identity_t<std::function<R(R)>>& integrand,
    const quadrature::Interval<R>& interval,
    const std::vector<unsigned int>& n_sequence,
    const quadrature::ReferenceValue<R>& reference,
    std::optional<R> error_floor = std::nullopt)
{
    ConvergenceOptions<R> options;
    if (error_floor) {
        options.error_floor = *error_floor;
    }
    return ConvergenceAnalyzer<R>(options).analyze(method, integrand, interval, n_sequence, reference);
}

/**
 * @brief Refinement sequence n0, n0 * factor, ..., with `levels` entries.
 */
inline std::vector<unsigned int> refinement_sequence(unsigned int n0, unsigned int levels, unsigned int factor = 2)
{
    return Utils::geometric_sequence(n0, levels, factor);
}

} // namespace convergence
#endif // CONVERGENCE_ANALYZER_HPP
