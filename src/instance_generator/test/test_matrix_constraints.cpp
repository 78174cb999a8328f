#include <gtest/gtest.h>
#include "matrix_constraints.hpp"
#include "exponent_vector_sampler.hpp"
#include <Eigen/Dense>
#include <random>

using namespace PolyGen;

class MatrixConstraintsTest : public ::testing::Test {
protected:
    static ExponentMatrix make(int rows, int cols, std::initializer_list<int64_t> values) {
        ExponentMatrix matrix(rows, cols);
        auto it = values.begin();
        for (int i = 0; i < rows; ++i) {
            for (int j = 0; j < cols; ++j) {
                matrix(i, j) = *it++;
            }
        }
        return matrix;
    }
};

TEST_F(MatrixConstraintsTest, CountsDuplicatesAndEmptyColumns) {
    const ExponentMatrix matrix = make(3, 3, {2, 1, 0,
                                              2, 1, 0,
                                              2, 1, 0});
    EXPECT_EQ(MatrixConstraints::count_duplicate_rows(matrix), 2u);
    EXPECT_EQ(MatrixConstraints::count_empty_columns(matrix), 1u);
}

TEST_F(MatrixConstraintsTest, DuplicateRowsBroken) {
    ExponentMatrix matrix = make(3, 3, {2, 1, 0,
                                        2, 1, 0,
                                        1, 1, 1});
    const ExponentVector row_sums = matrix.rowwise().sum();

    const size_t moves = MatrixConstraints::enforce(matrix);

    EXPECT_GE(moves, 1u);
    EXPECT_EQ(ExponentVector(matrix.rowwise().sum()), row_sums);
    EXPECT_EQ(MatrixConstraints::count_duplicate_rows(matrix), 0u);
    EXPECT_EQ(MatrixConstraints::count_empty_columns(matrix), 0u);
    EXPECT_GE(matrix.minCoeff(), 0);
}

TEST_F(MatrixConstraintsTest, EmptyColumnFilled) {
    ExponentMatrix matrix = make(2, 3, {3, 0, 0,
                                        0, 2, 0});
    MatrixConstraints::enforce(matrix);

    EXPECT_EQ(MatrixConstraints::count_empty_columns(matrix), 0u);
    EXPECT_EQ(matrix.row(0).sum(), 3);
    EXPECT_EQ(matrix.row(1).sum(), 2);
    EXPECT_GE(matrix.minCoeff(), 0);
}

TEST_F(MatrixConstraintsTest, InsufficientMassLeavesColumnsEmpty) {
    ExponentMatrix matrix = make(1, 3, {1, 0, 0});
    const ExponentMatrix original = matrix;

    EXPECT_EQ(MatrixConstraints::enforce(matrix), 0u);
    EXPECT_EQ(matrix, original);
    EXPECT_EQ(MatrixConstraints::count_empty_columns(matrix), 2u);
}

TEST_F(MatrixConstraintsTest, InseparableDuplicatesLeftInPlace) {
    ExponentMatrix matrix = make(2, 1, {1,
                                        1});
    MatrixConstraints::enforce(matrix);

    EXPECT_EQ(matrix(0, 0), 1);
    EXPECT_EQ(matrix(1, 0), 1);
    EXPECT_EQ(MatrixConstraints::count_duplicate_rows(matrix), 1u);
}

TEST_F(MatrixConstraintsTest, EmptyMatrix) {
    ExponentMatrix matrix(0, 0);
    EXPECT_EQ(MatrixConstraints::enforce(matrix), 0u);
}

TEST_F(MatrixConstraintsTest, RowSumsPreservedOnRandomMatrices) {
    std::mt19937 rng(2024);
    ExponentVectorSampler sampler(rng, ExponentParams(0.3));
    std::uniform_int_distribution<int64_t> degree(1, 6);

    for (int trial = 0; trial < 100; ++trial) {
        ExponentMatrix matrix(8, 5);
        for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
            matrix.row(i) = sampler.sample(degree(rng), 5).transpose();
        }
        const ExponentVector row_sums = matrix.rowwise().sum();

        MatrixConstraints::enforce(matrix);

        EXPECT_EQ(ExponentVector(matrix.rowwise().sum()), row_sums);
        EXPECT_GE(matrix.minCoeff(), 0);
    }
}
