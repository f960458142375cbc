/*!
 * @file Polynomials.hpp
 * @brief Defines the polynomials::Polynomial template class and related polynomial operations.
 *
 * This header provides a generic, fixed-degree polynomial class template used as a test and
 * teaching integrand: its definite integral is known in closed form, so it provides exact
 * reference values for the quadrature rules. The implementation leverages Eigen for array
 * operations and supports both Horner's and direct evaluation methods.
 *
 * Dependencies:
 * - Eigen for array operations.
 * - C++20.
 *
 * @details
 * Main features:
 * - Template class `Polynomial<N, R>` for polynomials of degree N over field R.
 * - Evaluation via operator() with selectable method (Horner/direct).
 * - Conversion to std::function for use as an integrand.
 * - Addition, negation and scalar multiplication.
 * - Derivative `der<M>(p)`, antiderivative `antiderivative(p)` and exact `integral(p, a, b)`.
 * - Pretty-printing via operator<<.
 *
 * Usage example:
 * @code
 * using Poly = polynomials::Polynomial<3, double>;
 * Poly p({1.0, 2.0, 3.0, 4.0});
 * double val = p(2.0);                              // Evaluate at x=2
 * double area = polynomials::integral(p, 0.0, 1.0); // Exact integral over [0, 1]
 * std::cout << p << std::endl;
 * @endcode
 */
#ifndef HH_POLYNOMIALS_HH
#define HH_POLYNOMIALS_HH

#include <cmath>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include "../traits/QUADLAB_traits.hpp"

namespace polynomials {
/*!
* @class Polynomial
* @brief Template class for polynomials
* @tparam N Polynomial degree
* @tparam R Polynomial field
*/

template <unsigned int N, class R = traits::DataType::PolynomialField>
class Polynomial
{
public:

    Polynomial() : M_coeff(traits::DataType::StoringArray::Zero(N + 1)) {}

    //! Constructor taking coefficients a_0, ..., a_N
    Polynomial(const traits::DataType::StoringArray &c) : M_coeff{c}
    {
        check_size();
    }

    //! Constructor taking coefficients as a list, lowest degree first
    Polynomial(std::initializer_list<R> c) : M_coeff(static_cast<Eigen::Index>(c.size()))
    {
        Eigen::Index i = 0;
        for (const R &value : c)
            M_coeff[i++] = value;
        check_size();
    }

    //! Constructor with evaluation method
    Polynomial(const traits::DataType::StoringArray &c, traits::EvalMethod method) : M_coeff{c}, eval_method{method}
    {
        check_size();
    }

    //! I can initialize with another polynomial, but only if Degree<=
    template <unsigned int M>
    Polynomial(Polynomial<M, R> const &right) noexcept
    {
        static_assert(M <= N, "Cannot assign a polynomial of higher degree");
        M_coeff = traits::DataType::StoringArray::Zero(N + 1);
        M_coeff.head(M + 1) = right.get_coeff().head(M + 1);
    }

    Polynomial(Polynomial<N, R> const &) = default;
    Polynomial(Polynomial<N, R> &&) = default;
    Polynomial &operator=(Polynomial<N, R> const &) = default;
    Polynomial &operator=(Polynomial<N, R> &&) = default;

    //! Get coefficients
    auto get_coeff() const noexcept
    {
        return M_coeff;
    }

    //! Get coefficient as reference (a nicer alternative to setter).
    auto &get_coeff() noexcept
    {
        return M_coeff;
    }

    //! Evaluate polynomial with selected method
    //! @param x The evaluation point
    R operator()(R const &x) const noexcept
    {
        return evaluate(x, eval_method);
    }

    /*!
     * @brief Returns a std::function representing the polynomial evaluation.
     *
     * The returned function captures a *copy* of the polynomial, so it remains valid
     * even if the original Polynomial object is modified or destroyed.
     */
    std::function<R(R)> as_function() const {
        return [poly_copy = *this](R x) -> R { return poly_copy(x); };
    }

    //! Unary minus (returns a new polynomial with inverted sign)
    auto operator-() const noexcept
    {
        Polynomial<N, R> result = *this;
        result.get_coeff() = -result.get_coeff();
        return result;
    }

    //! The polynomial degree
    static constexpr unsigned int degree()
    {
        return N;
    }

private:
    //! Coefficients a_0---a_n
    traits::DataType::StoringArray M_coeff;

    //! Evaluation method
    traits::EvalMethod eval_method = traits::EvalMethod::Horner;

    void check_size() const
    {
        if (M_coeff.size() != static_cast<Eigen::Index>(N + 1))
            throw std::invalid_argument("Polynomial of degree " + std::to_string(N) + " needs "
                                        + std::to_string(N + 1) + " coefficients.");
    }

    /*!
    * @brief Evaluates the polynomial at a given point x using the specified method.
    * @param x The point at which to evaluate the polynomial.
    * @param method The evaluation method to use (Horner or Direct).
    * @return The evaluated polynomial value at x.
    */
    R evaluate(R const &x, traits::EvalMethod method) const noexcept
    {
        if (method == traits::EvalMethod::Horner)
        {
            R result = M_coeff[N];
            for (int i = static_cast<int>(N) - 1; i >= 0; --i)
                result = result * x + M_coeff[i];
            return result;
        }
        else // Direct evaluation
        {
            traits::DataType::StoringArray x_powers(N + 1);
            x_powers.setOnes();

            for (unsigned int i = 1; i <= N; ++i) {
                x_powers[i] = x_powers[i - 1] * x;
            }

            return (M_coeff * x_powers).sum();
        }
    }
};

/*!
 * Outputs the polynomial in a pretty-print way
 * @tparam N The degree
 * @tparam R The field
 * @param out The output stream
 * @param p The polynomial
 * @return The stream
 */
template <unsigned int N, typename R>
std::ostream &operator<<(std::ostream &out, Polynomial<N, R> const &p)
{
    const auto &coeffs = p.get_coeff();
    out << coeffs[0];

    for (unsigned int i = 1; i <= N; ++i)
    {
        if (coeffs[i] != 0)  // Avoid printing zero terms
        {
            out << (coeffs[i] > 0 ? " + " : " - ") << std::abs(coeffs[i]) << "x^" << i;
        }
    }

    return out;
}

/*!
 * Polynomial addition
 * @tparam LDegree The degree of the left polynomial
 * @tparam RDegree The degree of the right polynomial
 * @tparam R The scalar field
 */
template <unsigned int LDegree, unsigned int RDegree, typename R>
auto
operator+(Polynomial<LDegree, R> const &left,
          Polynomial<RDegree, R> const &right) noexcept
{
  constexpr unsigned int NMAX = (LDegree > RDegree) ? LDegree : RDegree;
  Polynomial<NMAX, R> res;
  res.get_coeff().head(LDegree + 1) += left.get_coeff();
  res.get_coeff().head(RDegree + 1) += right.get_coeff();
  return res;
}

/*!
* Multiplication of a polynomial with a scalar
*/
template <unsigned int RDegree, typename R>
auto operator*(R const &scalar, Polynomial<RDegree, R> const &right) noexcept
{
    Polynomial<RDegree, R> res;
    res.get_coeff() = scalar * right.get_coeff();
    return res;
}

template <unsigned int RDegree, typename R>
auto operator*( Polynomial<RDegree, R> const &left, R const &scalar) noexcept
{
    return scalar * left;
}

/*!
 * Derivative of a Polynomial
 * Usage: der<M>(p) (M>=0)
 *
 * @tparam M The derivative order
 * @tparam RDegree The degree of the polynomial
 * @tparam R The scalar field
 * @param p The polynomial
 * @return \f$\frac{d^{M}(p)}{dx^{M}}\f$
 */
template <unsigned M, unsigned RDegree, typename R>
auto
der(Polynomial<RDegree, R> const &p)
{
  if constexpr(M == 0u)
    return p;
  else if constexpr(RDegree < M)
    return Polynomial<0u, R>{R(0)};
  else
  {
    // Create a vector containing [1, 2, 3, ..., RDegree]
    traits::DataType::StoringArray multipliers = traits::DataType::StoringArray::LinSpaced(RDegree, 1, RDegree);

    // Perform element-wise multiplication with the polynomial coefficients (ignoring the constant term)
    traits::DataType::StoringArray C = multipliers * p.get_coeff().segment(1, RDegree);

    return der<M - 1>(Polynomial<RDegree - 1, R>(C));
  }
}

/*!
 * Antiderivative of a Polynomial vanishing at x = 0
 *
 * @return \f$\int_0^x p(t)\,dt\f$, a polynomial of degree RDegree + 1
 */
template <unsigned RDegree, typename R>
auto
antiderivative(Polynomial<RDegree, R> const &p)
{
    traits::DataType::StoringArray C = traits::DataType::StoringArray::Zero(RDegree + 2);
    const traits::DataType::StoringArray divisors = traits::DataType::StoringArray::LinSpaced(RDegree + 1, 1, RDegree + 1);
    C.tail(RDegree + 1) = p.get_coeff() / divisors;
    return Polynomial<RDegree + 1, R>(C);
}

/*!
 * Exact definite integral of a Polynomial over [a, b]
 */
template <unsigned RDegree, typename R>
R
integral(Polynomial<RDegree, R> const &p, R a, R b)
{
    const auto P = antiderivative(p);
    return P(b) - P(a);
}

} // namespace polynomials


#endif // HH_POLYNOMIALS_HH
