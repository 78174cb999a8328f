#include "mv_polynomial.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace MVPolynomial {

// Monomial implementation
Monomial::Monomial(const std::map<size_t, int64_t>& vars) : variables(vars) {
    // Remove zero degrees
    auto it = variables.begin();
    while (it != variables.end()) {
        if (it->second < 0) {
            throw std::invalid_argument("Monomial degree must be non-negative");
        }
        if (it->second == 0) {
            it = variables.erase(it);
        } else {
            ++it;
        }
    }
}

bool Monomial::operator==(const Monomial& other) const {
    return variables == other.variables;
}

bool Monomial::operator<(const Monomial& other) const {
    return variables < other.variables;
}

int64_t Monomial::total_degree() const {
    int64_t total = 0;
    for (const auto& [var, degree] : variables) {
        total += degree;
    }
    return total;
}

std::string Monomial::to_string() const {
    if (variables.empty()) {
        return "1";
    }

    std::stringstream ss;
    bool first = true;
    for (const auto& [var, degree] : variables) {
        if (!first) ss << "*";
        ss << "x" << var + 1;
        if (degree > 1) {
            ss << "^" << degree;
        }
        first = false;
    }
    return ss.str();
}

// MultivariatePolynomial implementation
MultivariatePolynomial::MultivariatePolynomial() : num_variables(0) {}

MultivariatePolynomial::MultivariatePolynomial(size_t num_vars) : num_variables(num_vars) {}

MultivariatePolynomial MultivariatePolynomial::from_instance(
    const PolyGen::ExponentMatrix& matrix,
    const PolyGen::CoefficientVector& coefficients) {
    if (matrix.rows() != coefficients.size()) {
        throw std::invalid_argument("Exponent matrix and coefficient vector disagree on monomial count");
    }

    MultivariatePolynomial result(static_cast<size_t>(matrix.cols()));
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
        std::map<size_t, int64_t> vars;
        for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
            vars[static_cast<size_t>(j)] = matrix(i, j);
        }
        result.add_term(Monomial(vars), coefficients(i));
    }
    return result;
}

double MultivariatePolynomial::get_coefficient(const Monomial& monomial) const {
    auto it = terms.find(monomial);
    if (it != terms.end()) {
        return it->second;
    }
    return 0.0;
}

void MultivariatePolynomial::add_term(const Monomial& monomial, double coeff) {
    if (coeff == 0.0) return;

    auto it = terms.find(monomial);
    if (it != terms.end()) {
        it->second += coeff;
        if (it->second == 0.0) {
            terms.erase(it);
        }
    } else {
        terms[monomial] = coeff;
    }
}

int64_t MultivariatePolynomial::total_degree() const {
    int64_t max_degree = 0;
    for (const auto& [monomial, coeff] : terms) {
        max_degree = std::max(max_degree, monomial.total_degree());
    }
    return max_degree;
}

bool MultivariatePolynomial::is_zero() const {
    return terms.empty();
}

int64_t MultivariatePolynomial::baseline_cost() const {
    int64_t cost = 0;
    for (const auto& [monomial, coeff] : terms) {
        cost += monomial.total_degree() - 1;
    }
    return cost;
}

std::string MultivariatePolynomial::to_string() const {
    if (terms.empty()) {
        return "0";
    }

    std::vector<std::pair<Monomial, double>> ordered(terms.begin(), terms.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        return a.first.total_degree() > b.first.total_degree();
    });

    std::stringstream ss;
    bool first = true;

    for (const auto& [monomial, coeff] : ordered) {
        const bool negative = coeff < 0.0;
        if (first) {
            if (negative) ss << "-";
        } else {
            ss << (negative ? " - " : " + ");
        }

        // Show coefficient if it's not 1 or if monomial is constant
        const double magnitude = std::fabs(coeff);
        if (magnitude != 1.0 || monomial.variables.empty()) {
            ss << Utils::format_coefficient(magnitude);
            if (!monomial.variables.empty()) {
                ss << "*";
            }
        }

        if (!monomial.variables.empty()) {
            ss << monomial.to_string();
        }

        first = false;
    }

    return ss.str();
}

// Utility functions implementation
namespace Utils {

std::string render(const PolyGen::Instance& instance) {
    return MultivariatePolynomial::from_instance(instance.matrix, instance.coefficients).to_string();
}

std::string format_coefficient(double value) {
    std::stringstream ss;
    if (std::nearbyint(value) == value && std::fabs(value) < 1e15) {
        ss << static_cast<int64_t>(value);
    } else {
        ss.precision(6);
        ss << value;
    }
    return ss.str();
}

} // namespace Utils

} // namespace MVPolynomial
