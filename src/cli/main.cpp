#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "../common/error_handling.hpp"
#include "cli.hpp"

using namespace PolyGenCli;

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "polygen";
    const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CliOptions options;
    PolyGen::GeneratorConfig config;
    try {
        options = parse_arguments(args);
        if (options.help) {
            print_usage(std::cout, program);
            return 0;
        }
        config = make_config(options);
    } catch (const polyBench::ErrorHandling::InputError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(std::cerr, program);
        return 2;
    }

    try {
        if (options.verbose) {
            std::cout << "Generating polynomial with δ = " << *options.delta << "..." << std::endl;
            if (options.seed) {
                std::cout << "Using random seed: " << *options.seed << std::endl;
            }
        }

        const PolyGen::InstanceGenerator generator(config);
        const PolyGen::Instance instance = generator.generate(*options.delta, options.seed);

        std::cout << std::endl;
        print_report(std::cout, instance, options.verbose);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
