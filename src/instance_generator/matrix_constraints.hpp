#pragma once

#include "instance.hpp"

namespace PolyGen {

// Structural clean-up of an exponent matrix. Every adjustment moves a single
// unit of exponent between two columns of the same row, so row sums (and with
// them the baseline cost) are never changed.
namespace MatrixConstraints {

// Makes rows pairwise distinct where a single-unit move can, then fills
// all-zero columns from columns that can spare a unit.
// Returns the number of single-unit moves applied.
size_t enforce(ExponentMatrix& matrix);

size_t count_duplicate_rows(const ExponentMatrix& matrix);
size_t count_empty_columns(const ExponentMatrix& matrix);

} // namespace MatrixConstraints

} // namespace PolyGen
