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

#ifndef LIB_MODULAR_MATRIX_HH
#define LIB_MODULAR_MATRIX_HH

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

/*
 * Square integer matrix. All arithmetic on it is exact: the determinant and
 * adjugate are computed by cofactor expansion over integers, never through a
 * floating-point inverse, so results stay exact for any block size.
 * determinant and adjugate work on the entries as given; the _mod functions
 * reduce them first and never overflow.
 */
class square_matrix {
public:
    using value_type = int64_t;

    square_matrix() noexcept = default;

    // Zero matrix of the given order.
    explicit square_matrix(size_t order_in);

    // Throws invalid_key if the rows do not form a non-empty square.
    square_matrix(std::initializer_list<std::initializer_list<value_type>> rows);

    // Row-major values; throws invalid_key unless values.size() is a perfect
    // square greater than zero.
    static square_matrix from_values(std::span<value_type const> values);

    [[nodiscard]] size_t order() const noexcept {
        return size;
    }

    [[nodiscard]] value_type& operator()(size_t const row, size_t const col) noexcept {
        return cells[row * size + col];
    }

    [[nodiscard]] value_type operator()(size_t const row, size_t const col) const noexcept {
        return cells[row * size + col];
    }

    // The matrix with the given row and column removed.
    [[nodiscard]] square_matrix minor(size_t row, size_t col) const;

    bool operator==(square_matrix const&) const = default;

private:
    size_t                  size{0};
    std::vector<value_type> cells;
};

[[nodiscard]] int64_t determinant(square_matrix const& matrix);

// Transpose of the cofactor matrix.
[[nodiscard]] square_matrix adjugate(square_matrix const& matrix);

// Every entry replaced by its residue in [0, modulus).
[[nodiscard]] square_matrix reduce_mod(square_matrix const& matrix, int64_t modulus);

// determinant(matrix) mod modulus, in [0, modulus). Entries are reduced
// before every product, so any int64_t entries are safe for a modulus below
// 2^31.
[[nodiscard]] int64_t determinant_mod(square_matrix const& matrix, int64_t modulus);

// det^-1 * adj(matrix) mod modulus, computed on the reduced matrix. Throws
// invalid_key when the determinant is not invertible modulo modulus.
[[nodiscard]] square_matrix modular_inverse(
        square_matrix const& matrix, int64_t modulus);

// left * right mod modulus. Throws invalid_parameter unless both matrices
// have the same order.
[[nodiscard]] square_matrix multiply_mod(
        square_matrix const& left, square_matrix const& right, int64_t modulus);

// matrix * column mod modulus. Throws invalid_parameter unless column.size()
// equals matrix.order().
[[nodiscard]] std::vector<int64_t> multiply_mod(
        square_matrix const& matrix, std::span<int64_t const> column, int64_t modulus);

#endif    // LIB_MODULAR_MATRIX_HH
