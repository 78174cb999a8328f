#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../instance_generator/instance.hpp"

namespace MVPolynomial {

// Represents a monomial term with variables and their degrees
// For example, x_0^2 * x_1 * x_3^3 would be represented as {0: 2, 1: 1, 3: 3}
class Monomial {
public:
    std::map<size_t, int64_t> variables; // variable_index -> degree

    Monomial() = default;
    explicit Monomial(const std::map<size_t, int64_t>& vars);

    // Comparison for ordering in maps
    bool operator==(const Monomial& other) const;
    bool operator<(const Monomial& other) const;

    // Get total degree
    int64_t total_degree() const;

    // Variables are printed 1-based: x1, x2, ...
    std::string to_string() const;
};

// A multivariate polynomial with real coefficients, stored as a sum of terms.
// Like terms are merged on insertion and zero terms dropped.
class MultivariatePolynomial {
private:
    std::map<Monomial, double> terms;
    size_t num_variables;

public:
    MultivariatePolynomial();
    explicit MultivariatePolynomial(size_t num_vars);

    // Builds sum_i c_i * prod_j x_j^K(i, j)
    static MultivariatePolynomial from_instance(const PolyGen::ExponentMatrix& matrix,
                                                const PolyGen::CoefficientVector& coefficients);

    // Coefficient access
    double get_coefficient(const Monomial& monomial) const;
    void add_term(const Monomial& monomial, double coeff);

    // Basic properties
    size_t get_num_variables() const { return num_variables; }
    int64_t total_degree() const;
    bool is_zero() const;
    size_t num_terms() const { return terms.size(); }

    // Naive cost: sum over terms of (total degree - 1)
    int64_t baseline_cost() const;

    // Terms in descending total degree, e.g. "3*x1^2*x2 - 5*x3"
    std::string to_string() const;

    const std::map<Monomial, double>& get_terms() const { return terms; }
};

namespace Utils {
    // Symbolic form of a generated instance
    std::string render(const PolyGen::Instance& instance);

    // Shortest decimal text for a coefficient ("3", "-2.5")
    std::string format_coefficient(double value);
}

} // namespace MVPolynomial
