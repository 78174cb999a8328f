#include "instance_generator.hpp"
#include "matrix_constraints.hpp"
#include "shape_chooser.hpp"
#include "../mv_polynomial/mv_polynomial.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>

using namespace PolyGen;

int main() {
    std::cout << "=== Controlled-Difficulty Polynomial Generation Example ===" << std::endl;
    std::cout << "Every instance below costs exactly delta constraints under naive evaluation" << std::endl << std::endl;

    // Example 1: One instance in full
    std::cout << "Example 1: Single Instance" << std::endl;
    std::cout << "--------------------------" << std::endl;
    const Instance small = generate_instance(15, 42);
    std::cout << "delta = " << small.delta << ", (m, n) = (" << small.m << ", " << small.n << ")" << std::endl;
    std::cout << "Exponent matrix K:" << std::endl << small.matrix << std::endl;
    std::cout << "Row degrees: " << small.row_degrees().transpose() << std::endl;
    std::cout << "P(x) = " << MVPolynomial::Utils::render(small) << std::endl;
    std::cout << "Baseline: " << small.baseline << std::endl << std::endl;

    // Example 2: Same difficulty, different structure
    std::cout << "Example 2: Structural Variety at Fixed Difficulty" << std::endl;
    std::cout << "-------------------------------------------------" << std::endl;
    const int64_t delta = 50;
    for (unsigned int seed = 1; seed <= 8; ++seed) {
        const Instance instance = generate_instance(delta, seed);
        const double mean_degree = static_cast<double>(instance.matrix.sum()) / static_cast<double>(instance.m);
        std::cout << "seed " << std::setw(2) << seed
                  << " | (m, n) = (" << std::setw(2) << instance.m << ", " << std::setw(2) << instance.n << ")"
                  << " | mean degree " << std::fixed << std::setprecision(2) << std::setw(6) << mean_degree
                  << " | max degree " << std::setw(3) << instance.row_degrees().maxCoeff()
                  << " | baseline " << instance.baseline << std::endl;
    }
    std::cout << std::endl;

    // Example 3: Shape selection on its own
    std::cout << "Example 3: Shape Heuristic" << std::endl;
    std::cout << "--------------------------" << std::endl;
    std::vector<int64_t> difficulties = {1, 10, 100, 1000, 10000};
    for (int64_t d : difficulties) {
        const Shape shape = choose_shape(d, 7);
        std::cout << "delta " << std::setw(5) << d << " => (m, n) = (" << shape.m << ", " << shape.n << ")" << std::endl;
    }
    std::cout << std::endl;

    // Example 4: Narrow/deep versus wide/shallow presets
    std::cout << "Example 4: Tuned Shape Ranges" << std::endl;
    std::cout << "-----------------------------" << std::endl;
    GeneratorConfig deep;
    deep.shape = ShapeParams(0.3, 0.5, 0.7, 0.9);
    GeneratorConfig wide;
    wide.shape = ShapeParams(1.2, 1.5, 0.2, 0.3);
    const Instance deep_instance = InstanceGenerator(deep).generate(delta, 3);
    const Instance wide_instance = InstanceGenerator(wide).generate(delta, 3);
    std::cout << "narrow/deep: (m, n) = (" << deep_instance.m << ", " << deep_instance.n
              << "), baseline " << deep_instance.baseline << std::endl;
    std::cout << "wide/shallow: (m, n) = (" << wide_instance.m << ", " << wide_instance.n
              << "), baseline " << wide_instance.baseline << std::endl << std::endl;

    // Example 5: Real-valued coefficients without the structural pass
    std::cout << "Example 5: Real Coefficients, Raw Matrix" << std::endl;
    std::cout << "----------------------------------------" << std::endl;
    GeneratorConfig raw;
    raw.coefficients = CoefficientRange(-1.0, 1.0, CoefficientKind::Real);
    raw.enforce_matrix_constraints = false;
    const Instance raw_instance = InstanceGenerator(raw).generate(20, 11);
    std::cout << "Duplicate rows: " << MatrixConstraints::count_duplicate_rows(raw_instance.matrix)
              << ", empty columns: " << MatrixConstraints::count_empty_columns(raw_instance.matrix) << std::endl;
    std::cout << "Coefficients: " << raw_instance.coefficients.transpose() << std::endl << std::endl;

    // Example 6: Performance at large difficulty
    std::cout << "Example 6: Performance Test" << std::endl;
    std::cout << "---------------------------" << std::endl;
    auto start = std::chrono::high_resolution_clock::now();
    const Instance large = generate_instance(100000, 5);
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    std::cout << "delta = 100000, (m, n) = (" << large.m << ", " << large.n << ")" << std::endl;
    std::cout << "Baseline: " << large.baseline << std::endl;
    std::cout << "Time taken: " << duration.count() << " ms" << std::endl;

    return 0;
}
