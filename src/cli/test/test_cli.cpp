#include <gtest/gtest.h>
#include "cli.hpp"
#include "../../common/error_handling.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace PolyGenCli;
using polyBench::ErrorHandling::InputError;

TEST(CliParseTest, DeltaAndSeed) {
    const CliOptions options = parse_arguments({"--delta", "15", "--seed", "42"});
    ASSERT_TRUE(options.delta.has_value());
    EXPECT_EQ(*options.delta, 15);
    ASSERT_TRUE(options.seed.has_value());
    EXPECT_EQ(*options.seed, 42u);
    EXPECT_EQ(options.coeff_min, -10.0);
    EXPECT_EQ(options.coeff_max, 10.0);
    EXPECT_FALSE(options.real_coefficients);
    EXPECT_TRUE(options.enforce_matrix_constraints);
    EXPECT_FALSE(options.verbose);
}

TEST(CliParseTest, AllFlags) {
    const CliOptions options = parse_arguments(
        {"-v", "--delta", "8", "--coeff-min", "-2.5", "--coeff-max", "4", "--real", "--no-constraints"});
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(*options.delta, 8);
    EXPECT_FALSE(options.seed.has_value());
    EXPECT_EQ(options.coeff_min, -2.5);
    EXPECT_EQ(options.coeff_max, 4.0);
    EXPECT_TRUE(options.real_coefficients);
    EXPECT_FALSE(options.enforce_matrix_constraints);
}

TEST(CliParseTest, HelpWithoutDelta) {
    const CliOptions options = parse_arguments({"--help"});
    EXPECT_TRUE(options.help);
    EXPECT_FALSE(options.delta.has_value());
}

TEST(CliParseTest, Errors) {
    EXPECT_THROW(parse_arguments({}), InputError);
    EXPECT_THROW(parse_arguments({"--seed", "3"}), InputError);
    EXPECT_THROW(parse_arguments({"--delta"}), InputError);
    EXPECT_THROW(parse_arguments({"--delta", "abc"}), InputError);
    EXPECT_THROW(parse_arguments({"--delta", "12x"}), InputError);
    EXPECT_THROW(parse_arguments({"--delta", "5", "--seed", "-1"}), InputError);
    EXPECT_THROW(parse_arguments({"--delta", "5", "--frobnicate"}), InputError);
    EXPECT_THROW(parse_arguments({"--delta", "5", "--coeff-min", "low"}), InputError);
}

TEST(CliParseTest, AttachedValues) {
    const CliOptions options = parse_arguments({"--delta=12", "--seed=7", "--coeff-min=-3", "-v"});
    EXPECT_EQ(*options.delta, 12);
    EXPECT_EQ(*options.seed, 7u);
    EXPECT_EQ(options.coeff_min, -3.0);
    EXPECT_EQ(options.coeff_max, 10.0);
    EXPECT_TRUE(options.verbose);
}

TEST(CliParseTest, SeedOutOfRange) {
    EXPECT_THROW(parse_arguments({"--delta", "5", "--seed", "4294967296"}), InputError);
    const CliOptions options = parse_arguments({"--delta", "5", "--seed", "4294967295"});
    EXPECT_EQ(*options.seed, 4294967295u);
}

TEST(CliConfigTest, CoefficientKind) {
    const PolyGen::GeneratorConfig integer = make_config(parse_arguments({"--delta", "5"}));
    EXPECT_EQ(integer.coefficients.kind, PolyGen::CoefficientKind::Integer);
    EXPECT_TRUE(integer.enforce_matrix_constraints);

    const PolyGen::GeneratorConfig real =
        make_config(parse_arguments({"--delta", "5", "--real", "--no-constraints"}));
    EXPECT_EQ(real.coefficients.kind, PolyGen::CoefficientKind::Real);
    EXPECT_FALSE(real.enforce_matrix_constraints);
}

TEST(CliConfigTest, ZeroOnlyRangeRejected) {
    const CliOptions options = parse_arguments({"--delta", "5", "--coeff-min", "0", "--coeff-max", "0"});
    EXPECT_THROW(make_config(options), InputError);
}

TEST(CliReportTest, VerificationLine) {
    const PolyGen::Instance instance = PolyGen::generate_instance(15, 42);

    std::ostringstream plain;
    print_report(plain, instance, false);
    EXPECT_NE(plain.str().find("Chosen (m, n): (" + std::to_string(instance.m) + ", " +
                               std::to_string(instance.n) + ")"),
              std::string::npos);
    EXPECT_NE(plain.str().find("✓ Baseline matches target δ = 15"), std::string::npos);
    EXPECT_NE(plain.str().find("P(x) = "), std::string::npos);
    EXPECT_EQ(plain.str().find("Row degrees"), std::string::npos);

    std::ostringstream verbose;
    print_report(verbose, instance, true);
    EXPECT_NE(verbose.str().find("Row degrees"), std::string::npos);
    EXPECT_NE(verbose.str().find("Total: 15 = 15"), std::string::npos);
}

TEST(CliReportTest, Usage) {
    std::ostringstream os;
    print_usage(os, "polygen");
    EXPECT_NE(os.str().find("Usage: polygen --delta N"), std::string::npos);
    for (const char* flag : {"--seed", "--coeff-min", "--coeff-max", "--real", "--no-constraints", "--verbose", "--help"}) {
        EXPECT_NE(os.str().find(flag), std::string::npos) << flag;
    }
}
