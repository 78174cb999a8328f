#include "shape_chooser.hpp"
#include "random_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace PolyGen {

using polyBench::ErrorHandling::ShapeError;

ShapeChooser::ShapeChooser(std::mt19937& rng, const ShapeParams& params)
    : rng_(rng), params_(params) {}

Shape ShapeChooser::choose(int64_t delta) {
    polyBench::ErrorHandling::validate_positive(delta, "delta");

    std::uniform_real_distribution<double> alpha_dist(params_.alpha_min, params_.alpha_max);
    std::uniform_real_distribution<double> beta_dist(params_.beta_min, params_.beta_max);
    const double alpha = alpha_dist(rng_);
    const double beta = beta_dist(rng_);

    const double root = std::sqrt(static_cast<double>(delta));
    const double raw_m = std::floor(alpha * root);
    const double raw_n = std::floor(root / beta);

    // 2^63: the first double past int64_t
    const double int64_limit = -static_cast<double>(std::numeric_limits<int64_t>::min());
    if (!(raw_m < int64_limit) || !(raw_n < int64_limit)) {
        throw ShapeError("Infeasible shape for delta " + std::to_string(delta) +
                         ": (m, n) = (" + std::to_string(raw_m) + ", " + std::to_string(raw_n) +
                         ") does not fit a 64-bit size");
    }
    const auto m = std::max<int64_t>(ShapeParams::MIN_MONOMIALS, static_cast<int64_t>(raw_m));
    const auto n = std::max<int64_t>(ShapeParams::MIN_VARIABLES, static_cast<int64_t>(raw_n));

    Shape shape{static_cast<size_t>(m), static_cast<size_t>(n)};
    if (!is_feasible(shape, delta)) {
        throw ShapeError("Infeasible shape for delta " + std::to_string(delta) +
                         ": (m, n) = (" + std::to_string(m) + ", " + std::to_string(n) + ")");
    }
    return shape;
}

bool ShapeChooser::is_feasible(const Shape& shape, int64_t delta) {
    return shape.m >= ShapeParams::MIN_MONOMIALS &&
           shape.n >= ShapeParams::MIN_VARIABLES &&
           delta >= 1;
}

Shape choose_shape(int64_t delta, std::optional<unsigned int> seed, const ShapeParams& params) {
    polyBench::ErrorHandling::validate_positive(delta, "delta");

    std::mt19937 rng = make_engine(seed);
    ShapeChooser chooser(rng, params);
    return chooser.choose(delta);
}

} // namespace PolyGen
