#pragma once

#include <optional>
#include <random>

namespace PolyGen {

// Engine shared by every stage of one generation call. Without a seed it is
// seeded from std::random_device.
inline std::mt19937 make_engine(std::optional<unsigned int> seed) {
    return std::mt19937(seed ? *seed : std::random_device{}());
}

} // namespace PolyGen
