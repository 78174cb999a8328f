#include <gtest/gtest.h>
#include "shape_chooser.hpp"
#include "instance_generator.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <vector>

using namespace PolyGen;
using polyBench::ErrorHandling::InputError;
using polyBench::ErrorHandling::ShapeError;

const unsigned int kTestingSeed = 42069;

class ShapeChooserTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng = std::mt19937(kTestingSeed);
    }

    // Bounds implied by the default alpha and beta ranges
    static Shape lower_bound(int64_t delta) {
        const double root = std::sqrt(static_cast<double>(delta));
        return {static_cast<size_t>(std::max<int64_t>(1, static_cast<int64_t>(std::floor(0.6 * root)))),
                static_cast<size_t>(std::max<int64_t>(2, static_cast<int64_t>(std::floor(root / 0.8))))};
    }

    static Shape upper_bound(int64_t delta) {
        const double root = std::sqrt(static_cast<double>(delta));
        return {static_cast<size_t>(std::max<int64_t>(1, static_cast<int64_t>(std::floor(1.5 * root)))),
                static_cast<size_t>(std::max<int64_t>(2, static_cast<int64_t>(std::floor(root / 0.2))))};
    }

    std::mt19937 rng;
};

TEST_F(ShapeChooserTest, ShapeWithinHeuristicBounds) {
    const std::vector<int64_t> deltas = {1, 2, 5, 15, 50, 200, 10000};
    ShapeChooser chooser(rng);
    for (int64_t delta : deltas) {
        const Shape lo = lower_bound(delta);
        const Shape hi = upper_bound(delta);
        for (int trial = 0; trial < 50; ++trial) {
            const Shape shape = chooser.choose(delta);
            EXPECT_GE(shape.m, lo.m) << "delta " << delta;
            EXPECT_LE(shape.m, hi.m) << "delta " << delta;
            EXPECT_GE(shape.n, lo.n) << "delta " << delta;
            EXPECT_LE(shape.n, hi.n) << "delta " << delta;
            EXPECT_TRUE(ShapeChooser::is_feasible(shape, delta));
        }
    }
}

TEST_F(ShapeChooserTest, SmallestDifficultyClampsToFloors) {
    for (unsigned int seed = 0; seed < 50; ++seed) {
        const Shape shape = choose_shape(1, seed);
        EXPECT_EQ(shape.m, 1u);
        EXPECT_GE(shape.n, 2u);
        EXPECT_LE(shape.n, 5u);
    }
}

TEST_F(ShapeChooserTest, SameSeedSameShape) {
    for (unsigned int seed = 0; seed < 20; ++seed) {
        EXPECT_EQ(choose_shape(15, seed), choose_shape(15, seed));
        EXPECT_EQ(choose_shape(200, seed), choose_shape(200, seed));
    }
}

TEST_F(ShapeChooserTest, FixedSeedScenario) {
    const Shape first = choose_shape(15, 42);
    const Shape second = choose_shape(15, 42);
    EXPECT_EQ(first, second);
    EXPECT_GE(first.m, 2u);
    EXPECT_LE(first.m, 5u);
    EXPECT_GE(first.n, 4u);
    EXPECT_LE(first.n, 19u);
}

TEST_F(ShapeChooserTest, MatchesShapeUsedByGenerator) {
    for (unsigned int seed = 0; seed < 10; ++seed) {
        const Shape shape = choose_shape(50, seed);
        const Instance instance = generate_instance(50, seed);
        EXPECT_EQ(shape.m, instance.m);
        EXPECT_EQ(shape.n, instance.n);
    }
}

TEST_F(ShapeChooserTest, SeedsProduceDifferentShapes) {
    std::set<std::pair<size_t, size_t>> shapes;
    for (unsigned int seed = 0; seed < 30; ++seed) {
        const Shape shape = choose_shape(200, seed);
        shapes.insert({shape.m, shape.n});
    }
    EXPECT_GT(shapes.size(), 1u);
}

TEST_F(ShapeChooserTest, CustomRanges) {
    // alpha fixed near 1, beta fixed near 0.5: m ~ sqrt(delta), n ~ 2 sqrt(delta)
    ShapeChooser chooser(rng, ShapeParams(0.999, 1.0, 0.5, 0.501));
    const Shape shape = chooser.choose(100);
    EXPECT_EQ(shape.m, 9u);
    EXPECT_GE(shape.n, 19u);
    EXPECT_LE(shape.n, 20u);
}

TEST_F(ShapeChooserTest, InvalidDelta) {
    ShapeChooser chooser(rng);
    EXPECT_THROW(chooser.choose(0), InputError);
    EXPECT_THROW(chooser.choose(-3), InputError);
    EXPECT_THROW(choose_shape(0), InputError);
    EXPECT_THROW(choose_shape(-1, 42), InputError);
}

TEST_F(ShapeChooserTest, InvalidParams) {
    EXPECT_THROW(ShapeParams(0.0, 1.0), InputError);
    EXPECT_THROW(ShapeParams(1.5, 0.6), InputError);
    EXPECT_THROW(ShapeParams(0.6, 1.5, 0.8, 0.8), InputError);
    EXPECT_THROW(ShapeParams(0.6, 1.5, -0.2, 0.8), InputError);
    EXPECT_NO_THROW(ShapeParams());
}

TEST_F(ShapeChooserTest, OversizedShapeRejected) {
    ShapeChooser tiny_beta(rng, ShapeParams(0.6, 1.5, 1e-300, 2e-300));
    EXPECT_THROW(tiny_beta.choose(100), ShapeError);

    ShapeChooser huge_alpha(rng, ShapeParams(1e299, 1e300));
    EXPECT_THROW(huge_alpha.choose(100), ShapeError);

    EXPECT_THROW(choose_shape(100, kTestingSeed, ShapeParams(0.6, 1.5, 1e-300, 2e-300)), ShapeError);
}

TEST_F(ShapeChooserTest, Feasibility) {
    EXPECT_TRUE(ShapeChooser::is_feasible({1, 2}, 1));
    EXPECT_TRUE(ShapeChooser::is_feasible({40, 3}, 7));
    EXPECT_FALSE(ShapeChooser::is_feasible({0, 2}, 5));
    EXPECT_FALSE(ShapeChooser::is_feasible({3, 1}, 5));
    EXPECT_FALSE(ShapeChooser::is_feasible({3, 4}, 0));
}
