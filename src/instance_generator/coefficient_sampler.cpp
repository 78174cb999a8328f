#include "coefficient_sampler.hpp"

#include <limits>
#include <string>

namespace PolyGen {

using polyBench::ErrorHandling::InputError;

void CoefficientRange::validate() const {
    const std::string bounds = "[" + std::to_string(min) + ", " + std::to_string(max) + "]";
    if (!std::isfinite(min) || !std::isfinite(max)) {
        throw InputError("Coefficient range " + bounds + " must be finite");
    }
    if (min >= max) {
        throw InputError("Coefficient range " + bounds + " must satisfy min < max");
    }
    if (kind == CoefficientKind::Integer) {
        const double lo = std::ceil(min);
        const double hi = std::floor(max);
        if (lo > hi || (lo == 0.0 && hi == 0.0)) {
            throw InputError("Coefficient range " + bounds + " contains no nonzero integer");
        }
        // -2^63 is exact as a double, 2^63 is the first value past int64_t
        const double int64_lowest = static_cast<double>(std::numeric_limits<int64_t>::min());
        if (lo < int64_lowest || hi >= -int64_lowest) {
            throw InputError("Integer coefficient range " + bounds + " exceeds the 64-bit integer range");
        }
    } else if (!std::isfinite(max - min)) {
        throw InputError("Real coefficient range " + bounds + " is wider than a double can represent");
    }
}

CoefficientSampler::CoefficientSampler(std::mt19937& rng) : rng_(rng) {}

CoefficientVector CoefficientSampler::sample(size_t count, const CoefficientRange& range) {
    range.validate();

    const auto size = static_cast<Eigen::Index>(count);
    if (range.kind == CoefficientKind::Integer) {
        const auto lo = static_cast<int64_t>(std::ceil(range.min));
        const auto hi = static_cast<int64_t>(std::floor(range.max));
        return generate_nonzero_vector<int64_t>(size, lo, hi).cast<double>();
    }
    return generate_nonzero_vector<double>(size, range.min, range.max);
}

} // namespace PolyGen
