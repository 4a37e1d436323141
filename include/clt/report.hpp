#pragma once

#include <cstdio>
#include "clt/stiffness_calculator.hpp"

namespace clt {

// Rows of the matrix, one per line, each entry with `precision`
// significant digits.
std::string format_matrix(const Matrix3d& m, int precision = 8);

// Per-ply Q matrices (labelled by index, angle, E1, E2), Q*, S* and a
// closing line with Ex, Ey, Gxy, nuxy.
std::string format_result(const LaminateResult& result, int precision = 8);

void print_result(const LaminateResult& result, std::FILE* out = stdout);

}  // namespace clt
