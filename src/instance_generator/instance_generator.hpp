#pragma once

#include <cstdint>
#include <optional>

#include "coefficient_sampler.hpp"
#include "exponent_vector_sampler.hpp"
#include "instance.hpp"
#include "shape_chooser.hpp"

namespace PolyGen {

// Tunable constants of one generator. None of them affect the baseline
// guarantee, only the distribution of shapes and coefficients.
struct GeneratorConfig {
    ShapeParams shape;
    ExponentParams exponents;
    CoefficientRange coefficients;
    // Distinct rows and no empty columns, where a row-sum preserving move allows
    bool enforce_matrix_constraints = true;
};

// Produces instances whose naive evaluation cost equals the requested delta.
//
// Pipeline (single engine, consumed in this order):
//   delta -> (m, n) -> E_1..E_m with sum delta + m -> K row by row
//         -> structural pass -> c -> verified instance
class InstanceGenerator {
public:
    explicit InstanceGenerator(const GeneratorConfig& config = GeneratorConfig());

    Instance generate(int64_t delta, std::optional<unsigned int> seed = std::nullopt) const;

    const GeneratorConfig& get_config() const { return config_; }

private:
    GeneratorConfig config_;
};

// Convenience entry point with default tunables
Instance generate_instance(int64_t delta,
                           std::optional<unsigned int> seed = std::nullopt,
                           const CoefficientRange& range = CoefficientRange());

} // namespace PolyGen
