/**
 * @file Interval.hpp
 * @brief Defines the validated integration interval [a, b].
 *
 * An Interval is checked once on construction and never mutated afterwards, so every rule
 * receiving one can rely on a < b with finite bounds and a finite length b - a.
 */
#ifndef QUADRATURE_INTERVAL_HPP
#define QUADRATURE_INTERVAL_HPP

#include <cmath>
#include <concepts>
#include <limits>
#include <ostream>
#include <sstream>
#include "QuadratureErrors.hpp"
#include "../traits/QUADLAB_traits.hpp"

namespace quadrature {

/**
 * @brief Closed integration interval [lower, upper] with lower < upper.
 *
 * @tparam R Floating-point type of the bounds.
 */
template<typename R = traits::DataType::PolynomialField>
requires std::floating_point<R>
class Interval {
public:
    /**
     * @brief Constructs the interval.
     * @param lower Lower integration limit a.
     * @param upper Upper integration limit b.
     * @throws InvalidDomainError if a >= b, either bound is not finite, or b - a overflows.
     */
    Interval(R lower, R upper) : lower_(lower), upper_(upper) {
        if (!std::isfinite(lower) || !std::isfinite(upper)) {
            throw InvalidDomainError(describe("Integration bounds must be finite", lower, upper));
        }
        if (!(lower < upper)) {
            throw InvalidDomainError(describe("Lower bound must be smaller than upper bound", lower, upper));
        }
        if (!std::isfinite(upper - lower)) {
            throw InvalidDomainError(describe("Interval length must be finite", lower, upper));
        }
    }

    constexpr R lower() const noexcept { return lower_; }
    constexpr R upper() const noexcept { return upper_; }

    /// b - a
    constexpr R length() const noexcept { return upper_ - lower_; }

    /// (b - a) / 2, the Jacobian of the map from [-1, 1].
    constexpr R half_length() const noexcept { return R(0.5) * (upper_ - lower_); }

    /// a + (b - a) / 2, which stays finite whenever the length does.
    constexpr R midpoint() const noexcept { return lower_ + half_length(); }

    /// Width of one of n equal subintervals.
    constexpr R step(unsigned int n) const noexcept { return (upper_ - lower_) / static_cast<R>(n); }

    constexpr bool contains(R x) const noexcept {
        return x >= lower_ && x <= upper_;
    }

    /**
     * @brief Maps a point of the reference interval [-1, 1] onto [a, b].
     * @param xi Reference coordinate.
     * @return ((b-a)/2) xi + (a+b)/2
     */
    constexpr R map_from_reference(R xi) const noexcept {
        return half_length() * xi + midpoint();
    }

private:
    R lower_;
    R upper_;

    static std::string describe(const char* what, R lower, R upper) {
        std::ostringstream os;
        os << what << " (got [" << lower << ", " << upper << "]).";
        return os.str();
    }
};

template<typename R>
std::ostream& operator<<(std::ostream& out, const Interval<R>& interval)
{
    return out << "[" << interval.lower() << ", " << interval.upper() << "]";
}

} // namespace quadrature
#endif // QUADRATURE_INTERVAL_HPP
