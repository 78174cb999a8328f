#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <random>

#include "instance.hpp"

namespace PolyGen {

// Dirichlet concentration used when spreading a monomial's degree over variables.
// Values near 0 give winner-take-most rows, large values near-uniform rows.
struct ExponentParams {
    static constexpr double DEFAULT_CONCENTRATION = 2.0;

    double concentration;

    explicit ExponentParams(double concentration = DEFAULT_CONCENTRATION);
};

// Distributes a total degree E over n variables.
//
// Two separate steps:
//   1. draw: a symmetric Dirichlet point p on the simplex, scaled by E and
//      rounded to the nearest integer
//   2. repair: the rounding residual is removed one unit at a time from or
//      into the current largest entry, which never drives an entry negative
// Only the repair step carries the sum invariant.
class ExponentVectorSampler {
public:
    explicit ExponentVectorSampler(std::mt19937& rng, const ExponentParams& params = ExponentParams());

    // Returns n non-negative integers summing exactly to budget
    ExponentVector sample(int64_t budget, size_t num_vars);

    // Draw step: Dirichlet(concentration, ..., concentration) of length num_vars
    Eigen::VectorXd draw_proportions(size_t num_vars);

    // Repair step. Ties between equal entries go to the larger scaled value,
    // so the correction follows the random draw instead of variable order.
    static void repair_residual(ExponentVector& exponents,
                                const Eigen::VectorXd& scaled,
                                int64_t budget);

    const ExponentParams& get_params() const { return params_; }

private:
    std::mt19937& rng_;
    ExponentParams params_;
};

} // namespace PolyGen
