/*
    bindings.cpp - Pybind11 bindings for the QUADLAB quadrature engine and convergence analysis.

    This module exposes the numerical core to Python, where a notebook or dashboard supplies the
    integrand, the interval, the method selection and the partition counts, and renders the
    returned values and error series.

    Main Features:
    --------------
    - Enumerations:
        * QuadratureMethod: LeftRiemann, RightRiemann, MidpointRiemann, Trapezoidal, Simpson, GaussLegendre.
        * ReferenceMethod: GaussLegendre, TanhSinh, QAGS.
        * ReferenceSource: Exact, Numerical.

    - Functions:
        * evaluate(method, f, a, b, n) -> QuadratureResult
        * sample(method, f, a, b, n) -> QuadratureSamples (nodes, weights, values for plotting)
        * reference(f, a, b, exact_value=None, method=GaussLegendre) -> ReferenceValue
        * convergence(method, f, a, b, n_sequence, reference, error_floor=None) -> ConvergenceSeries
        * compare(method_a, method_b, f, a, b, n, reference=None) -> MethodComparison

    - Errors:
        * InvalidDomainError, InvalidPartitionCountError (ValueError subclasses)
        * NumericDomainError (ArithmeticError subclass)
        * InsufficientSamplesError (RuntimeError subclass)

    Usage:
    ------
    Import the module in Python as `quadlab`.
    Example:
        import quadlab
        res = quadlab.evaluate(quadlab.QuadratureMethod.Simpson, lambda x: x**2, 0.0, 1.0, 10)
        ref = quadlab.reference(lambda x: x**2, 0.0, 1.0, exact_value=1/3)
        series = quadlab.convergence(quadlab.QuadratureMethod.Trapezoidal, lambda x: x**2,
                                     0.0, 1.0, [10, 20, 40, 80], ref)
        print(res.value, series.order())

    Notes:
    ------
    - Python callables are invoked with the GIL held; convergence studies run sequentially.
*/
#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../include/convergence/ConvergenceAnalyzer.hpp"
#include "../include/quadrature/Comparison.hpp"
#include "../include/quadrature/QuadratureRules.hpp"
#include "../include/quadrature/ReferenceEvaluator.hpp"
#include "../include/traits/QUADLAB_traits.hpp"

namespace py = pybind11;

// Short-hands
using Real      = traits::DataType::PolynomialField;
using Integrand = std::function<Real(Real)>;

PYBIND11_MODULE(quadlab, m) {
    m.doc() = "Classical quadrature rules and convergence analysis (pybind11)";

    // ----- Errors -----
    // Base class first: pybind11 tries translators in reverse registration order.
    py::register_exception<quadrature::QuadratureError>(m, "QuadratureError", PyExc_RuntimeError);
    py::register_exception<quadrature::InvalidDomainError>(m, "InvalidDomainError", PyExc_ValueError);
    py::register_exception<quadrature::InvalidPartitionCountError>(m, "InvalidPartitionCountError", PyExc_ValueError);
    py::register_exception<quadrature::NumericDomainError>(m, "NumericDomainError", PyExc_ArithmeticError);
    py::register_exception<quadrature::InsufficientSamplesError>(m, "InsufficientSamplesError", PyExc_RuntimeError);

    // ----- Enums -----
    py::enum_<traits::QuadratureMethod>(m, "QuadratureMethod")
    .value("LeftRiemann", traits::QuadratureMethod::LeftRiemann)
    .value("RightRiemann", traits::QuadratureMethod::RightRiemann)
    .value("MidpointRiemann", traits::QuadratureMethod::MidpointRiemann)
    .value("Trapezoidal", traits::QuadratureMethod::Trapezoidal)
    .value("Simpson", traits::QuadratureMethod::Simpson)
    .value("GaussLegendre", traits::QuadratureMethod::GaussLegendre)
    .export_values();

    py::enum_<traits::ReferenceMethod>(m, "ReferenceMethod")
    .value("GaussLegendre", traits::ReferenceMethod::GaussLegendre)
    .value("TanhSinh", traits::ReferenceMethod::TanhSinh)
    .value("QAGS", traits::ReferenceMethod::QAGS);

    py::enum_<quadrature::ReferenceSource>(m, "ReferenceSource")
    .value("Exact", quadrature::ReferenceSource::Exact)
    .value("Numerical", quadrature::ReferenceSource::Numerical)
    .export_values();

    m.def("method_name", [](traits::QuadratureMethod method) { return std::string(traits::to_string(method)); },
          py::arg("method"), "Display name of a quadrature method.");
    m.def("method_from_name", [](const std::string& name) { return traits::method_from_string(name); },
          py::arg("name"), "Quadrature method from its display name.");

    // ----- Value types -----
    py::class_<quadrature::QuadratureResult<Real>>(m, "QuadratureResult")
    .def_readonly("value", &quadrature::QuadratureResult<Real>::value)
    .def_readonly("method", &quadrature::QuadratureResult<Real>::method)
    .def_readonly("partitions", &quadrature::QuadratureResult<Real>::partitions)
    .def_readonly("evaluations", &quadrature::QuadratureResult<Real>::evaluations)
    .def("__repr__", [](const quadrature::QuadratureResult<Real>& r) {
        std::ostringstream os;
        os << "<QuadratureResult " << r << ">";
        return os.str();
    });

    py::class_<quadrature::QuadratureSamples<Real>>(m, "QuadratureSamples")
    .def_readonly("method", &quadrature::QuadratureSamples<Real>::method)
    .def_readonly("partitions", &quadrature::QuadratureSamples<Real>::partitions)
    .def_readonly("nodes", &quadrature::QuadratureSamples<Real>::nodes)
    .def_readonly("weights", &quadrature::QuadratureSamples<Real>::weights)
    .def_readonly("values", &quadrature::QuadratureSamples<Real>::values)
    .def("weighted_sum", &quadrature::QuadratureSamples<Real>::weighted_sum);

    py::class_<quadrature::ReferenceValue<Real>>(m, "ReferenceValue")
    .def_readonly("value", &quadrature::ReferenceValue<Real>::value)
    .def_readonly("source", &quadrature::ReferenceValue<Real>::source)
    .def_readonly("method", &quadrature::ReferenceValue<Real>::method)
    .def_readonly("error_estimate", &quadrature::ReferenceValue<Real>::error_estimate)
    .def("is_exact", &quadrature::ReferenceValue<Real>::is_exact);

    py::class_<convergence::ErrorSample<Real>>(m, "ErrorSample")
    .def_readonly("partitions", &convergence::ErrorSample<Real>::partitions)
    .def_readonly("step", &convergence::ErrorSample<Real>::step)
    .def_readonly("approximation", &convergence::ErrorSample<Real>::approximation)
    .def_readonly("absolute_error", &convergence::ErrorSample<Real>::absolute_error)
    .def_readonly("relative_error", &convergence::ErrorSample<Real>::relative_error)
    .def_readonly("used_in_fit", &convergence::ErrorSample<Real>::used_in_fit);

    py::class_<convergence::ConvergenceSeries<Real>>(m, "ConvergenceSeries")
    .def_property_readonly("method", &convergence::ConvergenceSeries<Real>::method)
    .def_property_readonly("reference", &convergence::ConvergenceSeries<Real>::reference)
    .def_property_readonly("samples", &convergence::ConvergenceSeries<Real>::samples)
    .def_property_readonly("local_orders", &convergence::ConvergenceSeries<Real>::local_orders)
    .def("has_order", &convergence::ConvergenceSeries<Real>::has_order)
    .def("order", &convergence::ConvergenceSeries<Real>::order,
         "Estimated order p; raises InsufficientSamplesError when undefined.")
    .def("order_estimate", &convergence::ConvergenceSeries<Real>::order_estimate)
    .def("constant", &convergence::ConvergenceSeries<Real>::constant)
    .def("partition_counts", &convergence::ConvergenceSeries<Real>::partitions)
    .def("absolute_errors", &convergence::ConvergenceSeries<Real>::absolute_errors);

    py::class_<quadrature::MethodComparison<Real>>(m, "MethodComparison")
    .def_readonly("first", &quadrature::MethodComparison<Real>::first)
    .def_readonly("second", &quadrature::MethodComparison<Real>::second)
    .def_readonly("first_error", &quadrature::MethodComparison<Real>::first_error)
    .def_readonly("second_error", &quadrature::MethodComparison<Real>::second_error)
    .def("difference", &quadrature::MethodComparison<Real>::difference)
    .def("more_accurate", &quadrature::MethodComparison<Real>::more_accurate);

    // ----- Operations -----
    m.def("evaluate",
          [](traits::QuadratureMethod method, const Integrand& f, Real a, Real b, long long n) {
              return quadrature::evaluate<Real>(method, f, a, b, n);
          },
          py::arg("method"), py::arg("f"), py::arg("a"), py::arg("b"), py::arg("n"),
          "Approximates the integral of f over [a, b] with the selected rule.");

    m.def("sample",
          [](traits::QuadratureMethod method, const Integrand& f, Real a, Real b, long long n) {
              quadrature::validate_partitions(method, n);
              return quadrature::sample<Real>(method, f, quadrature::Interval<Real>(a, b),
                                              static_cast<unsigned int>(n));
          },
          py::arg("method"), py::arg("f"), py::arg("a"), py::arg("b"), py::arg("n"),
          "Nodes, weights and integrand values of one evaluation.");

    m.def("reference",
          [](const Integrand& f, Real a, Real b, std::optional<Real> exact_value, traits::ReferenceMethod method) {
              quadrature::ReferenceOptions<Real> options;
              options.method = method;
              return quadrature::reference<Real>(f, quadrature::Interval<Real>(a, b), exact_value, options);
          },
          py::arg("f"), py::arg("a"), py::arg("b"),
          py::arg("exact_value") = std::nullopt,
          py::arg("method") = traits::ReferenceMethod::GaussLegendre,
          "Reference value of the integral; an exact value takes precedence when given.");

    m.def("convergence",
          [](traits::QuadratureMethod method, const Integrand& f, Real a, Real b,
             const std::vector<long long>& n_sequence, const quadrature::ReferenceValue<Real>& reference,
             std::optional<Real> error_floor) {
              std::vector<unsigned int> counts;
              counts.reserve(n_sequence.size());
              for (long long n : n_sequence) {
                  quadrature::validate_partitions(method, n);
                  counts.push_back(static_cast<unsigned int>(n));
              }
              return convergence::convergence<Real>(method, f, quadrature::Interval<Real>(a, b),
                                                    counts, reference, error_floor);
          },
          py::arg("method"), py::arg("f"), py::arg("a"), py::arg("b"),
          py::arg("n_sequence"), py::arg("reference"), py::arg("error_floor") = std::nullopt,
          "Error series over increasing partition counts with the fitted convergence order.");

    m.def("compare",
          [](traits::QuadratureMethod method_a, traits::QuadratureMethod method_b, const Integrand& f,
             Real a, Real b, long long n, std::optional<quadrature::ReferenceValue<Real>> reference) {
              quadrature::validate_partitions(method_a, n);
              quadrature::validate_partitions(method_b, n);
              const quadrature::Interval<Real> interval(a, b);
              if (reference) {
                  return quadrature::compare<Real>(method_a, method_b, f, interval,
                                                   static_cast<unsigned int>(n), *reference);
              }
              return quadrature::compare<Real>(method_a, method_b, f, interval, static_cast<unsigned int>(n));
          },
          py::arg("method_a"), py::arg("method_b"), py::arg("f"), py::arg("a"), py::arg("b"), py::arg("n"),
          py::arg("reference") = std::nullopt,
          "Evaluates two rules on identical inputs.");

    m.def("refinement_sequence", &convergence::refinement_sequence,
          py::arg("n0"), py::arg("levels"), py::arg("factor") = 2,
          "n0, n0*factor, n0*factor^2, ... with `levels` entries.");
}
