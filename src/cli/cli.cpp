#include "cli.hpp"

#include <limits>
#include <string>

#include <boost/program_options.hpp>

#include "../common/error_handling.hpp"
#include "../mv_polynomial/mv_polynomial.hpp"

namespace PolyGenCli {

using polyBench::ErrorHandling::InputError;

namespace po = boost::program_options;

namespace {

po::options_description describe_options() {
    po::options_description desc("Options");
    desc.add_options()
        ("delta", po::value<int64_t>()->required()->value_name("N"),
         "difficulty (target baseline constraint count), N >= 1")
        ("seed", po::value<int64_t>()->value_name("S"), "random seed for reproducibility")
        ("coeff-min", po::value<double>()->default_value(PolyGen::CoefficientRange::DEFAULT_MIN)->value_name("A"),
         "smallest coefficient")
        ("coeff-max", po::value<double>()->default_value(PolyGen::CoefficientRange::DEFAULT_MAX)->value_name("B"),
         "largest coefficient")
        ("real", po::bool_switch(), "draw real-valued coefficients")
        ("no-constraints", po::bool_switch(), "keep duplicate rows and empty columns")
        ("verbose,v", po::bool_switch(), "show algorithm steps and row degrees")
        ("help,h", po::bool_switch(), "show this message");
    return desc;
}

} // namespace

CliOptions parse_arguments(const std::vector<std::string>& args) {
    const po::options_description desc = describe_options();
    CliOptions options;

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(desc).run(), vm);

        options.help = vm["help"].as<bool>();
        if (options.help) {
            return options;
        }
        po::notify(vm);

        options.delta = vm["delta"].as<int64_t>();
        if (vm.count("seed")) {
            const int64_t seed = vm["seed"].as<int64_t>();
            if (seed < 0 || seed > static_cast<int64_t>(std::numeric_limits<unsigned int>::max())) {
                throw InputError("--seed must be in [0, " +
                                 std::to_string(std::numeric_limits<unsigned int>::max()) + "]");
            }
            options.seed = static_cast<unsigned int>(seed);
        }
        options.coeff_min = vm["coeff-min"].as<double>();
        options.coeff_max = vm["coeff-max"].as<double>();
        options.real_coefficients = vm["real"].as<bool>();
        options.enforce_matrix_constraints = !vm["no-constraints"].as<bool>();
        options.verbose = vm["verbose"].as<bool>();
    } catch (const po::error& e) {
        throw InputError(e.what());
    }
    return options;
}

PolyGen::GeneratorConfig make_config(const CliOptions& options) {
    PolyGen::GeneratorConfig config;
    config.coefficients = PolyGen::CoefficientRange(
        options.coeff_min, options.coeff_max,
        options.real_coefficients ? PolyGen::CoefficientKind::Real : PolyGen::CoefficientKind::Integer);
    config.enforce_matrix_constraints = options.enforce_matrix_constraints;
    return config;
}

void print_usage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " --delta N [options]" << std::endl
       << std::endl
       << "Generate a random polynomial whose naive evaluation cost is exactly N." << std::endl
       << std::endl
       << describe_options() << std::endl;
}

void print_report(std::ostream& os, const PolyGen::Instance& instance, bool verbose) {
    const std::string rule(50, '=');
    os << rule << std::endl
       << "POLYNOMIAL GENERATION RESULTS" << std::endl
       << rule << std::endl;

    os << "δ (difficulty parameter): " << instance.delta << std::endl;
    os << "Chosen (m, n): (" << instance.m << ", " << instance.n << ")" << std::endl;

    if (verbose) {
        os << std::endl << "Algorithm steps:" << std::endl
           << "1. Chose m=" << instance.m << " monomials, n=" << instance.n << " variables" << std::endl
           << "2. Sampled row totals summing to " << instance.delta << " + " << instance.m
           << " = " << instance.delta + static_cast<int64_t>(instance.m) << std::endl
           << "3. Distributed degrees across variables" << std::endl
           << "4. Generated " << instance.coefficients.size() << " nonzero coefficients" << std::endl;
    }

    os << std::endl << "Exponent matrix K (" << instance.m << "x" << instance.n << "):" << std::endl
       << instance.matrix << std::endl;

    os << std::endl << "Coefficients: [";
    for (Eigen::Index i = 0; i < instance.coefficients.size(); ++i) {
        if (i > 0) os << ", ";
        os << MVPolynomial::Utils::format_coefficient(instance.coefficients(i));
    }
    os << "]" << std::endl;

    os << std::endl << "Symbolic polynomial:" << std::endl
       << "P(x) = " << MVPolynomial::Utils::render(instance) << std::endl;

    os << std::endl << "Verification:" << std::endl
       << "Baseline Kbase(P): " << instance.baseline << std::endl;
    if (instance.baseline == instance.delta) {
        os << "✓ Baseline matches target δ = " << instance.delta << std::endl;
    } else {
        os << "✗ ERROR: Baseline " << instance.baseline << " ≠ target δ = " << instance.delta << std::endl;
    }

    if (verbose) {
        const PolyGen::ExponentVector degrees = instance.row_degrees();
        os << std::endl << "Row degrees (Eᵢ): [";
        for (Eigen::Index i = 0; i < degrees.size(); ++i) {
            if (i > 0) os << ", ";
            os << degrees(i);
        }
        os << "]" << std::endl << "Constraint contributions (Eᵢ-1): [";
        int64_t total = 0;
        for (Eigen::Index i = 0; i < degrees.size(); ++i) {
            if (i > 0) os << ", ";
            os << degrees(i) - 1;
            total += degrees(i) - 1;
        }
        os << "]" << std::endl << "Total: " << total << " = " << instance.baseline << std::endl;
    }
}

} // namespace PolyGenCli
