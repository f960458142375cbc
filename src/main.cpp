#include <cmath>
#include <iomanip>
#include <iostream>
#include <vector>
#include "../include/convergence/ConvergenceAnalyzer.hpp"
#include "../include/polynomials/Polynomials.hpp"
#include "../include/quadrature/Comparison.hpp"
#include "../include/quadrature/QuadratureRules.hpp"
#include "../include/quadrature/ReferenceEvaluator.hpp"
#include "../include/traits/QUADLAB_traits.hpp"

using namespace quadrature;
using traits::QuadratureMethod;

int main() {
    using R = double;

    const polynomials::Polynomial<2, R> square({0.0, 0.0, 1.0});
    const Interval<R> unit(0.0, 1.0);
    const unsigned int n = 10;

    const auto exact = exact_reference(square, unit);
    const auto numeric = reference<R>(square.as_function(), unit);
    std::cout << "f(x) = " << square << " on " << unit << "\n";
    std::cout << "Reference: " << exact << ", " << numeric << "\n\n";

    std::cout << std::setprecision(10);
    for (auto method : traits::all_quadrature_methods) {
        const auto result = evaluate<R>(method, square.as_function(), unit, n);
        std::cout << std::setw(20) << traits::to_string(method) << "  n = " << n
                  << "  value = " << result.value
                  << "  error = " << std::abs(result.value - exact.value)
                  << "  evaluations = " << result.evaluations << "\n";
    }

    const auto series = convergence::convergence<R>(QuadratureMethod::Trapezoidal, square.as_function(), unit,
                                                    {10, 20, 40, 80}, exact);
    std::cout << "\nTrapezoidal convergence:\n";
    for (const auto& sample : series.samples()) {
        std::cout << "  n = " << std::setw(4) << sample.partitions
                  << "  h = " << sample.step
                  << "  error = " << sample.absolute_error << "\n";
    }
    std::cout << "  estimated order p = " << series.order() << "\n";

    const auto comparison = compare<R>(QuadratureMethod::Trapezoidal, QuadratureMethod::Simpson,
                                       square.as_function(), unit, n, exact);
    std::cout << "\n" << comparison.first << "  vs  " << comparison.second
              << "  (difference " << comparison.difference() << ")\n";
    if (const auto best = comparison.more_accurate()) {
        std::cout << "More accurate: " << traits::to_string(*best) << "\n";
    }
}
