#include "exponent_vector_sampler.hpp"

#include <cmath>
#include <string>

#include "../common/error_handling.hpp"

namespace PolyGen {

using polyBench::ErrorHandling::BudgetError;
using polyBench::ErrorHandling::ConsistencyError;
using polyBench::ErrorHandling::InputError;

ExponentParams::ExponentParams(double concentration) : concentration(concentration) {
    if (!std::isfinite(concentration) || concentration <= 0.0) {
        throw InputError("Dirichlet concentration must be finite and positive, got " +
                         std::to_string(concentration));
    }
}

ExponentVectorSampler::ExponentVectorSampler(std::mt19937& rng, const ExponentParams& params)
    : rng_(rng), params_(params) {}

ExponentVector ExponentVectorSampler::sample(int64_t budget, size_t num_vars) {
    if (num_vars == 0) {
        throw BudgetError("Exponent vector needs at least one variable");
    }
    if (budget < 0) {
        throw BudgetError("Degree budget must be non-negative, got " + std::to_string(budget));
    }

    const auto size = static_cast<Eigen::Index>(num_vars);
    if (budget == 0) {
        return ExponentVector::Zero(size);
    }

    const Eigen::VectorXd scaled = draw_proportions(num_vars) * static_cast<double>(budget);

    ExponentVector exponents(size);
    for (Eigen::Index j = 0; j < size; ++j) {
        exponents(j) = std::llround(scaled(j));
    }

    repair_residual(exponents, scaled, budget);
    return exponents;
}

Eigen::VectorXd ExponentVectorSampler::draw_proportions(size_t num_vars) {
    const auto size = static_cast<Eigen::Index>(num_vars);
    std::gamma_distribution<double> gamma(params_.concentration, 1.0);

    Eigen::VectorXd proportions(size);
    for (Eigen::Index j = 0; j < size; ++j) {
        proportions(j) = gamma(rng_);
    }

    const double total = proportions.sum();
    if (!(total > 0.0) || !std::isfinite(total)) {
        // Every gamma draw underflowed (tiny concentration): the Dirichlet
        // limit is a single vertex of the simplex
        std::uniform_int_distribution<Eigen::Index> pick(0, size - 1);
        proportions.setZero();
        proportions(pick(rng_)) = 1.0;
        return proportions;
    }
    return proportions / total;
}

void ExponentVectorSampler::repair_residual(ExponentVector& exponents,
                                            const Eigen::VectorXd& scaled,
                                            int64_t budget) {
    int64_t residual = budget - exponents.sum();

    while (residual != 0) {
        const bool grow = residual > 0;

        Eigen::Index target = -1;
        for (Eigen::Index j = 0; j < exponents.size(); ++j) {
            if (!grow && exponents(j) == 0) {
                continue;
            }
            if (target < 0 || exponents(j) > exponents(target) ||
                (exponents(j) == exponents(target) && scaled(j) > scaled(target))) {
                target = j;
            }
        }

        // Unreachable while budget >= 0: a positive sum above budget has a positive entry
        if (target < 0) {
            throw ConsistencyError("Residual repair found no entry to adjust (residual " +
                                   std::to_string(residual) + ")");
        }

        exponents(target) += grow ? 1 : -1;
        residual += grow ? -1 : 1;
    }
}

} // namespace PolyGen
