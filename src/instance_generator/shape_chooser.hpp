#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "../common/error_handling.hpp"
#include "instance.hpp"

namespace PolyGen {

// Ranges of the two auxiliary factors behind the (m, n) heuristic.
// alpha scales monomial density, beta trades variable width for depth.
struct ShapeParams {
    static constexpr double DEFAULT_ALPHA_MIN = 0.6;
    static constexpr double DEFAULT_ALPHA_MAX = 1.5;
    static constexpr double DEFAULT_BETA_MIN = 0.2;
    static constexpr double DEFAULT_BETA_MAX = 0.8;

    static constexpr size_t MIN_MONOMIALS = 1;
    static constexpr size_t MIN_VARIABLES = 2;

    double alpha_min;
    double alpha_max;
    double beta_min;
    double beta_max;

    explicit ShapeParams(double alpha_min = DEFAULT_ALPHA_MIN,
                         double alpha_max = DEFAULT_ALPHA_MAX,
                         double beta_min = DEFAULT_BETA_MIN,
                         double beta_max = DEFAULT_BETA_MAX)
        : alpha_min(alpha_min), alpha_max(alpha_max),
          beta_min(beta_min), beta_max(beta_max) {
        polyBench::ErrorHandling::validate_interval(alpha_min, alpha_max, "alpha range");
        polyBench::ErrorHandling::validate_interval(beta_min, beta_max, "beta range");
    }
};

// Picks the instance shape from the difficulty:
//   m = max(1, floor(alpha * sqrt(delta)))
//   n = max(2, floor(sqrt(delta) / beta))
class ShapeChooser {
public:
    explicit ShapeChooser(std::mt19937& rng, const ShapeParams& params = ShapeParams());

    // Draws alpha then beta from the engine and derives (m, n)
    Shape choose(int64_t delta);

    // A budget vector with every entry >= 1 summing to delta + m exists,
    // and a single variable may carry any exponent
    static bool is_feasible(const Shape& shape, int64_t delta);

    const ShapeParams& get_params() const { return params_; }

private:
    std::mt19937& rng_;
    ShapeParams params_;
};

// Standalone shape selection. Seeding matches generate_instance, so the same
// seed yields the shape the full generator would pick.
Shape choose_shape(int64_t delta, std::optional<unsigned int> seed = std::nullopt,
                   const ShapeParams& params = ShapeParams());

} // namespace PolyGen
