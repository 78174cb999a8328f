#include "degree_budget_sampler.hpp"

#include <set>
#include <string>

#include "../common/error_handling.hpp"

namespace PolyGen {

using polyBench::ErrorHandling::BudgetError;

DegreeBudgetSampler::DegreeBudgetSampler(std::mt19937& rng) : rng_(rng) {}

DegreeBudget DegreeBudgetSampler::sample(int64_t total, size_t count) {
    if (count == 0) {
        throw BudgetError("Cannot split a degree budget into zero monomials");
    }
    const auto parts = static_cast<int64_t>(count);
    if (total < parts) {
        throw BudgetError("Cannot distribute " + std::to_string(total) + " across " +
                          std::to_string(count) + " monomials with every degree >= 1");
    }

    if (count == 1) {
        return {total};
    }

    // Floyd's sampling: choose parts - 1 distinct cut points out of [1, total - 1]
    // without materializing the population
    const int64_t population = total - 1;
    const int64_t cuts_needed = parts - 1;
    std::set<int64_t> cuts;
    for (int64_t j = population - cuts_needed + 1; j <= population; ++j) {
        std::uniform_int_distribution<int64_t> dist(1, j);
        const int64_t candidate = dist(rng_);
        if (!cuts.insert(candidate).second) {
            cuts.insert(j);
        }
    }

    DegreeBudget budget;
    budget.reserve(count);
    int64_t previous = 0;
    for (int64_t cut : cuts) {
        budget.push_back(cut - previous);
        previous = cut;
    }
    budget.push_back(total - previous);

    return budget;
}

} // namespace PolyGen
