#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "../instance_generator/instance_generator.hpp"

namespace PolyGenCli {

struct CliOptions {
    std::optional<int64_t> delta;
    std::optional<unsigned int> seed;
    double coeff_min = PolyGen::CoefficientRange::DEFAULT_MIN;
    double coeff_max = PolyGen::CoefficientRange::DEFAULT_MAX;
    bool real_coefficients = false;
    bool enforce_matrix_constraints = true;
    bool verbose = false;
    bool help = false;
};

// Parses argv[1..]. Throws InputError on unknown flags, missing values,
// malformed numbers or a missing --delta.
CliOptions parse_arguments(const std::vector<std::string>& args);

// Generator configuration described by the options
PolyGen::GeneratorConfig make_config(const CliOptions& options);

void print_usage(std::ostream& os, const std::string& program);

// Human readable record plus the verification line
void print_report(std::ostream& os, const PolyGen::Instance& instance, bool verbose);

} // namespace PolyGenCli
