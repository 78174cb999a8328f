#include "instance_generator.hpp"

#include <string>
#include <utility>

#include "../common/error_handling.hpp"
#include "degree_budget_sampler.hpp"
#include "instance_assembler.hpp"
#include "matrix_constraints.hpp"
#include "random_engine.hpp"

namespace PolyGen {

using polyBench::ErrorHandling::ConsistencyError;

InstanceGenerator::InstanceGenerator(const GeneratorConfig& config) : config_(config) {
    config_.coefficients.validate();
}

Instance InstanceGenerator::generate(int64_t delta, std::optional<unsigned int> seed) const {
    polyBench::ErrorHandling::validate_positive(delta, "delta");

    std::mt19937 rng = make_engine(seed);

    ShapeChooser chooser(rng, config_.shape);
    const Shape shape = chooser.choose(delta);

    DegreeBudgetSampler budget_sampler(rng);
    const DegreeBudget budget = budget_sampler.sample(delta + static_cast<int64_t>(shape.m), shape.m);

    ExponentVectorSampler exponent_sampler(rng, config_.exponents);
    ExponentMatrix matrix(static_cast<Eigen::Index>(shape.m), static_cast<Eigen::Index>(shape.n));
    for (size_t i = 0; i < shape.m; ++i) {
        matrix.row(static_cast<Eigen::Index>(i)) = exponent_sampler.sample(budget[i], shape.n).transpose();
    }

    if (config_.enforce_matrix_constraints) {
        MatrixConstraints::enforce(matrix);
    }

    const ExponentVector row_degrees = matrix.rowwise().sum();
    for (size_t i = 0; i < shape.m; ++i) {
        if (row_degrees(static_cast<Eigen::Index>(i)) != budget[i]) {
            throw ConsistencyError("Row " + std::to_string(i) + " sums to " +
                                   std::to_string(row_degrees(static_cast<Eigen::Index>(i))) +
                                   " but its degree budget is " + std::to_string(budget[i]));
        }
    }

    InstanceAssembler assembler(rng, config_.coefficients);
    return assembler.assemble(delta, std::move(matrix));
}

Instance generate_instance(int64_t delta, std::optional<unsigned int> seed, const CoefficientRange& range) {
    polyBench::ErrorHandling::validate_positive(delta, "delta");

    GeneratorConfig config;
    config.coefficients = range;
    return InstanceGenerator(config).generate(delta, seed);
}

} // namespace PolyGen
