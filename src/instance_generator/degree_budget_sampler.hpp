#pragma once

#include <cstdint>
#include <random>

#include "instance.hpp"

namespace PolyGen {

// Splits a total degree T into m positive parts, one per monomial.
// Parts are the gaps between m - 1 distinct cut points drawn uniformly
// from {1, ..., T - 1}, so every composition of T is equally likely.
class DegreeBudgetSampler {
public:
    explicit DegreeBudgetSampler(std::mt19937& rng);

    // Returns m integers, each >= 1, summing exactly to total
    DegreeBudget sample(int64_t total, size_t count);

private:
    std::mt19937& rng_;
};

} // namespace PolyGen
