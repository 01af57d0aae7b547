/*
 * Copyright (C) Flamewing 2025 <flamewing.sonic@gmail.com>
 *
 * This program is free software: you can redistribute it and/or modify it
 * under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 * See the GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "classicrypt/modular_matrix.hh"

#include "classicrypt/cipher_error.hh"
#include "classicrypt/modular.hh"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <vector>

using std::initializer_list;
using std::span;
using std::vector;

namespace {
    constexpr int64_t cofactor_sign(size_t const row, size_t const col) noexcept {
        return ((row + col) % 2) == 0 ? 1 : -1;
    }

    size_t exact_square_root(size_t const value) noexcept {
        size_t root = 0;
        while ((root + 1) * (root + 1) <= value) {
            root++;
        }
        return root;
    }
}    // namespace

square_matrix::square_matrix(size_t const order_in)
        : size(order_in), cells(order_in * order_in, 0) {}

square_matrix::square_matrix(initializer_list<initializer_list<value_type>> const rows)
        : size(rows.size()) {
    if (size == 0) {
        throw invalid_key("matrix must not be empty");
    }
    cells.reserve(size * size);
    for (auto const& row : rows) {
        if (row.size() != size) {
            throw invalid_key("matrix must be square");
        }
        cells.insert(cells.end(), row.begin(), row.end());
    }
}

square_matrix square_matrix::from_values(span<value_type const> const values) {
    size_t const order_in = exact_square_root(values.size());
    if (order_in == 0 || order_in * order_in != values.size()) {
        throw invalid_key(
                "matrix needs a non-zero square number of values, got "
                + std::to_string(values.size()));
    }
    square_matrix result(order_in);
    result.cells.assign(values.begin(), values.end());
    return result;
}

square_matrix square_matrix::minor(size_t const row, size_t const col) const {
    square_matrix result(size - 1);
    size_t        dst_row = 0;
    for (size_t src_row = 0; src_row < size; src_row++) {
        if (src_row == row) {
            continue;
        }
        size_t dst_col = 0;
        for (size_t src_col = 0; src_col < size; src_col++) {
            if (src_col == col) {
                continue;
            }
            result(dst_row, dst_col) = (*this)(src_row, src_col);
            dst_col++;
        }
        dst_row++;
    }
    return result;
}

int64_t determinant(square_matrix const& matrix) {
    size_t const order = matrix.order();
    if (order == 0) {
        return 1;
    }
    if (order == 1) {
        return matrix(0, 0);
    }
    if (order == 2) {
        return matrix(0, 0) * matrix(1, 1) - matrix(0, 1) * matrix(1, 0);
    }
    // Laplace expansion along the first row.
    int64_t result = 0;
    for (size_t col = 0; col < order; col++) {
        if (matrix(0, col) == 0) {
            continue;
        }
        result += cofactor_sign(0, col) * matrix(0, col)
                  * determinant(matrix.minor(0, col));
    }
    return result;
}

square_matrix adjugate(square_matrix const& matrix) {
    size_t const  order = matrix.order();
    square_matrix result(order);
    if (order == 1) {
        result(0, 0) = 1;
        return result;
    }
    for (size_t row = 0; row < order; row++) {
        for (size_t col = 0; col < order; col++) {
            // Cofactor (row, col) lands transposed.
            result(col, row) = cofactor_sign(row, col) * determinant(matrix.minor(row, col));
        }
    }
    return result;
}

square_matrix reduce_mod(square_matrix const& matrix, int64_t const modulus) {
    square_matrix result(matrix.order());
    for (size_t row = 0; row < matrix.order(); row++) {
        for (size_t col = 0; col < matrix.order(); col++) {
            result(row, col) = floor_mod(matrix(row, col), modulus);
        }
    }
    return result;
}

int64_t determinant_mod(square_matrix const& matrix, int64_t const modulus) {
    size_t const order = matrix.order();
    if (order == 0) {
        return floor_mod(1, modulus);
    }
    if (order == 1) {
        return floor_mod(matrix(0, 0), modulus);
    }
    // Laplace expansion along the first row, reduced after every product.
    int64_t result = 0;
    for (size_t col = 0; col < order; col++) {
        int64_t const entry = floor_mod(matrix(0, col), modulus);
        if (entry == 0) {
            continue;
        }
        int64_t const term
                = floor_mod(entry * determinant_mod(matrix.minor(0, col), modulus), modulus);
        result = floor_mod(result + cofactor_sign(0, col) * term, modulus);
    }
    return result;
}

square_matrix modular_inverse(square_matrix const& matrix, int64_t const modulus) {
    size_t const order = matrix.order();
    if (order == 0) {
        throw invalid_key("matrix must not be empty");
    }
    square_matrix const          reduced     = reduce_mod(matrix, modulus);
    int64_t const                det         = determinant_mod(reduced, modulus);
    std::optional<int64_t> const det_inverse = inverse_mod(det, modulus);
    if (!det_inverse.has_value()) {
        throw invalid_key(
                "matrix determinant " + std::to_string(det)
                + " is not invertible modulo " + std::to_string(modulus));
    }
    square_matrix result(order);
    if (order == 1) {
        result(0, 0) = *det_inverse;
        return result;
    }
    for (size_t row = 0; row < order; row++) {
        for (size_t col = 0; col < order; col++) {
            // Cofactor (row, col) lands transposed.
            int64_t const cofactor = floor_mod(
                    cofactor_sign(row, col) * determinant_mod(reduced.minor(row, col), modulus),
                    modulus);
            result(col, row) = floor_mod(*det_inverse * cofactor, modulus);
        }
    }
    return result;
}

square_matrix multiply_mod(
        square_matrix const& left, square_matrix const& right, int64_t const modulus) {
    size_t const order = left.order();
    if (right.order() != order) {
        throw invalid_parameter(
                "cannot multiply matrices of order " + std::to_string(order) + " and "
                + std::to_string(right.order()));
    }
    square_matrix result(order);
    for (size_t row = 0; row < order; row++) {
        for (size_t col = 0; col < order; col++) {
            int64_t sum = 0;
            for (size_t inner = 0; inner < order; inner++) {
                int64_t const product = floor_mod(left(row, inner), modulus)
                                        * floor_mod(right(inner, col), modulus);
                sum = floor_mod(sum + floor_mod(product, modulus), modulus);
            }
            result(row, col) = sum;
        }
    }
    return result;
}

vector<int64_t> multiply_mod(
        square_matrix const& matrix, span<int64_t const> const column,
        int64_t const modulus) {
    size_t const order = matrix.order();
    if (column.size() != order) {
        throw invalid_parameter(
                "cannot multiply a matrix of order " + std::to_string(order)
                + " by a column of " + std::to_string(column.size()) + " values");
    }
    vector<int64_t> result(order, 0);
    for (size_t row = 0; row < order; row++) {
        int64_t sum = 0;
        for (size_t col = 0; col < order; col++) {
            int64_t const product
                    = floor_mod(matrix(row, col), modulus) * floor_mod(column[col], modulus);
            sum = floor_mod(sum + floor_mod(product, modulus), modulus);
        }
        result[row] = sum;
    }
    return result;
}
