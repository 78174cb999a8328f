#pragma once

#include <cstdint>
#include <random>

#include "coefficient_sampler.hpp"
#include "instance.hpp"

namespace PolyGen {

// Draws the coefficient vector, builds the instance record and re-derives
// the baseline cost from the matrix as a self-check.
class InstanceAssembler {
public:
    explicit InstanceAssembler(std::mt19937& rng, const CoefficientRange& range = CoefficientRange());

    // Throws ConsistencyError if the assembled record violates an invariant
    Instance assemble(int64_t delta, ExponentMatrix matrix);

    // Kbase = sum_i (sum_j K(i, j) - 1)
    static int64_t compute_baseline(const ExponentMatrix& matrix);

    // Shape, non-negative exponents, nonzero coefficients, baseline == delta
    static void verify(const Instance& instance);

private:
    CoefficientSampler sampler_;
    CoefficientRange range_;
};

} // namespace PolyGen
