#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <type_traits>

#include "../common/error_handling.hpp"
#include "instance.hpp"

namespace PolyGen {

enum class CoefficientKind { Integer, Real };

// Closed range [min, max] for integer coefficients, half-open [min, max) for
// real ones. Zero is never drawn.
struct CoefficientRange {
    static constexpr double DEFAULT_MIN = -10.0;
    static constexpr double DEFAULT_MAX = 10.0;

    double min;
    double max;
    CoefficientKind kind;

    explicit CoefficientRange(double min = DEFAULT_MIN, double max = DEFAULT_MAX,
                              CoefficientKind kind = CoefficientKind::Integer)
        : min(min), max(max), kind(kind) {
        validate();
    }

    // Throws InputError unless the range holds at least one nonzero value
    void validate() const;
};

// Draws nonzero coefficients, rejecting and redrawing exact zeros
class CoefficientSampler {
public:
    explicit CoefficientSampler(std::mt19937& rng);

    // Validates the range, then draws count nonzero values from it
    CoefficientVector sample(size_t count, const CoefficientRange& range);

private:
    // Bounds come from a validated CoefficientRange
    template<typename Scalar>
    Eigen::Matrix<Scalar, Eigen::Dynamic, 1> generate_nonzero_vector(
        Eigen::Index size, Scalar min_val, Scalar max_val);

    std::mt19937& rng_;
};

// Template implementations
template<typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, 1> CoefficientSampler::generate_nonzero_vector(
    Eigen::Index size, Scalar min_val, Scalar max_val) {
    if (size <= 0) {
        throw polyBench::ErrorHandling::InputError("Coefficient count must be positive, got " +
                                                   std::to_string(size));
    }

    using Vector = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;
    Vector vector(size);

    if constexpr (std::is_integral_v<Scalar>) {
        std::uniform_int_distribution<Scalar> dist(min_val, max_val);
        for (Eigen::Index i = 0; i < size; ++i) {
            Scalar value = 0;
            while (value == 0) {
                value = dist(rng_);
            }
            vector(i) = value;
        }
    } else {
        std::uniform_real_distribution<Scalar> dist(min_val, max_val);
        for (Eigen::Index i = 0; i < size; ++i) {
            Scalar value = 0;
            while (value == Scalar(0)) {
                value = dist(rng_);
            }
            vector(i) = value;
        }
    }

    return vector;
}

} // namespace PolyGen
