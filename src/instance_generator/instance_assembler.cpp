#include "instance_assembler.hpp"

#include <string>
#include <utility>

#include "../common/error_handling.hpp"

namespace PolyGen {

using polyBench::ErrorHandling::ConsistencyError;

InstanceAssembler::InstanceAssembler(std::mt19937& rng, const CoefficientRange& range)
    : sampler_(rng), range_(range) {
    range_.validate();
}

Instance InstanceAssembler::assemble(int64_t delta, ExponentMatrix matrix) {
    const auto m = static_cast<size_t>(matrix.rows());
    const auto n = static_cast<size_t>(matrix.cols());

    Instance instance;
    instance.delta = delta;
    instance.m = m;
    instance.n = n;
    instance.coefficients = sampler_.sample(m, range_);
    instance.baseline = compute_baseline(matrix);
    instance.matrix = std::move(matrix);

    verify(instance);
    return instance;
}

int64_t InstanceAssembler::compute_baseline(const ExponentMatrix& matrix) {
    return matrix.sum() - static_cast<int64_t>(matrix.rows());
}

void InstanceAssembler::verify(const Instance& instance) {
    const ExponentMatrix& matrix = instance.matrix;
    if (static_cast<size_t>(matrix.rows()) != instance.m ||
        static_cast<size_t>(matrix.cols()) != instance.n) {
        throw ConsistencyError("Exponent matrix is " + std::to_string(matrix.rows()) + "x" +
                               std::to_string(matrix.cols()) + ", expected " +
                               std::to_string(instance.m) + "x" + std::to_string(instance.n));
    }
    if (static_cast<size_t>(instance.coefficients.size()) != instance.m) {
        throw ConsistencyError("Expected " + std::to_string(instance.m) + " coefficients, got " +
                               std::to_string(instance.coefficients.size()));
    }
    if (matrix.size() > 0 && matrix.minCoeff() < 0) {
        throw ConsistencyError("Exponent matrix holds a negative exponent (" +
                               std::to_string(matrix.minCoeff()) + ")");
    }
    if ((instance.coefficients.array() == 0.0).any()) {
        throw ConsistencyError("Coefficient vector holds a zero coefficient");
    }

    const int64_t baseline = compute_baseline(matrix);
    if (baseline != instance.baseline || baseline != instance.delta) {
        throw ConsistencyError("Baseline cost " + std::to_string(baseline) +
                               " does not match target delta " + std::to_string(instance.delta));
    }
}

} // namespace PolyGen
