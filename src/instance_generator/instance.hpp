#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <vector>

namespace PolyGen {

// Row i holds the per-variable exponents of monomial i
using ExponentMatrix = Eigen::Matrix<int64_t, Eigen::Dynamic, Eigen::Dynamic>;
using ExponentVector = Eigen::Matrix<int64_t, Eigen::Dynamic, 1>;
using CoefficientVector = Eigen::VectorXd;

// Total degree per monomial, E_1..E_m
using DegreeBudget = std::vector<int64_t>;

// Monomial count m and variable count n
struct Shape {
    size_t m;
    size_t n;

    bool operator==(const Shape& other) const {
        return m == other.m && n == other.n;
    }
    bool operator!=(const Shape& other) const { return !(*this == other); }
};

// A generated polynomial sum_i c_i * prod_j x_j^K(i,j) together with its
// verified naive evaluation cost
struct Instance {
    int64_t delta;
    size_t m;
    size_t n;
    ExponentMatrix matrix;
    CoefficientVector coefficients;
    int64_t baseline;

    // Sum of exponents per row
    ExponentVector row_degrees() const { return matrix.rowwise().sum(); }
};

} // namespace PolyGen
