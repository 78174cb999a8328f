#include "matrix_constraints.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <optional>
#include <vector>

namespace PolyGen {
namespace MatrixConstraints {

namespace {

using Row = std::vector<int64_t>;

struct Move {
    size_t row;
    size_t from;
    size_t to;
};

// Working copy of the matrix with row multiplicities and column coverage
class RowLedger {
public:
    explicit RowLedger(const ExponentMatrix& matrix)
        : rows_(static_cast<size_t>(matrix.rows())),
          col_sums_(static_cast<size_t>(matrix.cols()), 0) {
        for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
            Row& row = rows_[static_cast<size_t>(i)];
            row.resize(static_cast<size_t>(matrix.cols()));
            for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
                row[static_cast<size_t>(j)] = matrix(i, j);
                col_sums_[static_cast<size_t>(j)] += matrix(i, j);
            }
            ++seen_[row];
        }
    }

    size_t num_rows() const { return rows_.size(); }
    size_t num_cols() const { return col_sums_.size(); }
    const Row& row(size_t i) const { return rows_[i]; }
    int64_t col_sum(size_t j) const { return col_sums_[j]; }

    bool is_duplicate(size_t i) const { return seen_.at(rows_[i]) > 1; }

    bool would_be_fresh(const Move& move) const {
        Row candidate = rows_[move.row];
        --candidate[move.from];
        ++candidate[move.to];
        return seen_.find(candidate) == seen_.end();
    }

    void apply(const Move& move) {
        Row& row = rows_[move.row];
        auto old = seen_.find(row);
        if (--old->second == 0) {
            seen_.erase(old);
        }
        --row[move.from];
        ++row[move.to];
        ++seen_[row];
        --col_sums_[move.from];
        ++col_sums_[move.to];
    }

    void write_back(ExponentMatrix& matrix) const {
        for (size_t i = 0; i < rows_.size(); ++i) {
            for (size_t j = 0; j < col_sums_.size(); ++j) {
                matrix(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows_[i][j];
            }
        }
    }

private:
    std::vector<Row> rows_;
    std::vector<int64_t> col_sums_;
    std::map<Row, size_t> seen_;
};

// Columns with a positive entry in the row, largest entry first
std::vector<size_t> donor_columns(const Row& row) {
    std::vector<size_t> donors;
    for (size_t j = 0; j < row.size(); ++j) {
        if (row[j] > 0) {
            donors.push_back(j);
        }
    }
    std::stable_sort(donors.begin(), donors.end(),
                     [&row](size_t a, size_t b) { return row[a] > row[b]; });
    return donors;
}

// Every column, least covered first (empty columns lead)
std::vector<size_t> target_columns(const RowLedger& ledger) {
    std::vector<size_t> targets(ledger.num_cols());
    std::iota(targets.begin(), targets.end(), 0);
    std::stable_sort(targets.begin(), targets.end(), [&ledger](size_t a, size_t b) {
        return ledger.col_sum(a) < ledger.col_sum(b);
    });
    return targets;
}

size_t break_duplicate_rows(RowLedger& ledger) {
    size_t moves = 0;
    for (size_t i = 0; i < ledger.num_rows(); ++i) {
        if (!ledger.is_duplicate(i)) {
            continue;
        }
        const std::vector<size_t> targets = target_columns(ledger);
        const std::vector<size_t> donors = donor_columns(ledger.row(i));

        bool fixed = false;
        for (size_t to : targets) {
            for (size_t from : donors) {
                if (from == to) {
                    continue;
                }
                const Move move{i, from, to};
                if (ledger.would_be_fresh(move)) {
                    ledger.apply(move);
                    ++moves;
                    fixed = true;
                    break;
                }
            }
            if (fixed) {
                break;
            }
        }
        // No single-unit move reaches an unused row: leave it
    }
    return moves;
}

size_t fill_empty_columns(RowLedger& ledger) {
    size_t moves = 0;
    for (size_t to = 0; to < ledger.num_cols(); ++to) {
        if (ledger.col_sum(to) != 0) {
            continue;
        }

        std::optional<Move> fallback;
        bool fixed = false;
        for (size_t i = 0; i < ledger.num_rows() && !fixed; ++i) {
            for (size_t from : donor_columns(ledger.row(i))) {
                // Donor column must stay non-empty after giving up a unit
                if (from == to || ledger.col_sum(from) < 2) {
                    continue;
                }
                const Move move{i, from, to};
                if (ledger.would_be_fresh(move)) {
                    ledger.apply(move);
                    fixed = true;
                    break;
                }
                if (!fallback) {
                    fallback = move;
                }
            }
        }

        if (!fixed && fallback) {
            ledger.apply(*fallback);
            fixed = true;
        }
        if (fixed) {
            ++moves;
        }
    }
    return moves;
}

} // namespace

size_t enforce(ExponentMatrix& matrix) {
    if (matrix.size() == 0) {
        return 0;
    }

    RowLedger ledger(matrix);
    size_t moves = break_duplicate_rows(ledger);
    moves += fill_empty_columns(ledger);
    ledger.write_back(matrix);
    return moves;
}

size_t count_duplicate_rows(const ExponentMatrix& matrix) {
    std::map<Row, size_t> seen;
    size_t duplicates = 0;
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
        Row row(static_cast<size_t>(matrix.cols()));
        for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
            row[static_cast<size_t>(j)] = matrix(i, j);
        }
        if (seen[row]++ > 0) {
            ++duplicates;
        }
    }
    return duplicates;
}

size_t count_empty_columns(const ExponentMatrix& matrix) {
    size_t empty = 0;
    for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
        if ((matrix.col(j).array() == int64_t{0}).all()) {
            ++empty;
        }
    }
    return empty;
}

} // namespace MatrixConstraints
} // namespace PolyGen
