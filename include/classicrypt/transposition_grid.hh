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

#ifndef LIB_TRANSPOSITION_GRID_HH
#define LIB_TRANSPOSITION_GRID_HH

#include "classicrypt/alphabet.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace detail {
    template <typename T1, typename T2>
    requires requires(T1 value1, T2 value2) {
        value1 + value2;
        value1 - value2;
        value1 / value2;
    }
    constexpr inline auto round_up(T1 const value, T2 const factor) noexcept {
        constexpr decltype(factor) const one{1};
        return ((value + factor - one) / factor) * factor;
    }
}    // namespace detail

struct grid_coord {
    size_t row;
    size_t col;

    constexpr bool operator==(grid_coord const&) const noexcept = default;
};

// Sequence of grid cells that visits every cell of a rows x cols grid
// exactly once. Orders depend on the grid shape (and for Myszkowski, the
// key) only, never on the text, so the same order can be rebuilt for
// decryption.
using coordinate_order = std::vector<grid_coord>;

enum class route_pattern : uint8_t {
    spiral_in,
    spiral_out,
    snake,
    diagonal
};

// Accepts "spiral_in", "spiral_out", "snake" and "diagonal"; throws
// invalid_parameter for anything else.
[[nodiscard]] route_pattern parse_route_pattern(std::string_view name);

[[nodiscard]] std::string_view route_pattern_name(route_pattern pattern) noexcept;

class char_grid {
public:
    // A grid full of pad characters.
    char_grid(size_t rows_in, size_t cols_in);

    [[nodiscard]] size_t rows() const noexcept {
        return num_rows;
    }

    [[nodiscard]] size_t cols() const noexcept {
        return num_cols;
    }

    [[nodiscard]] char& operator()(size_t const row, size_t const col) noexcept {
        return cells[row * num_cols + col];
    }

    [[nodiscard]] char operator()(size_t const row, size_t const col) const noexcept {
        return cells[row * num_cols + col];
    }

    // Stores text[i] at order[i]; text must not be longer than order.
    void write(coordinate_order const& order, std::string_view text);

    // Concatenates the cells named by order.
    [[nodiscard]] std::string read(coordinate_order const& order) const;

private:
    size_t      num_rows;
    size_t      num_cols;
    std::string cells;
};

[[nodiscard]] coordinate_order row_major_order(size_t rows, size_t cols);

// Clockwise rings from the outside in: top row left to right, right column
// downwards, bottom row right to left, left column upwards.
[[nodiscard]] coordinate_order spiral_in_order(size_t rows, size_t cols);

// spiral_in_order, reversed.
[[nodiscard]] coordinate_order spiral_out_order(size_t rows, size_t cols);

// Even rows left to right, odd rows right to left.
[[nodiscard]] coordinate_order snake_order(size_t rows, size_t cols);

// Anti-diagonals (row + col constant) in ascending order, each by increasing
// row.
[[nodiscard]] coordinate_order diagonal_order(size_t rows, size_t cols);

[[nodiscard]] coordinate_order route_order(route_pattern pattern, size_t rows, size_t cols);

// Rail of every text position for a pointer bouncing between rail 0 and rail
// rails - 1.
[[nodiscard]] std::vector<size_t> rail_assignment(size_t length, size_t rails);

// Text positions in ciphertext order: rail by rail, left to right within a
// rail. Holds one entry per character, whatever the rail count.
[[nodiscard]] std::vector<size_t> rail_fence_permutation(size_t length, size_t rails);

// result[i] = text[permutation[i]]; text must be permutation.size() long.
[[nodiscard]] std::string permute(
        std::string_view text, std::vector<size_t> const& permutation);

// Inverse of permute: result[permutation[i]] = text[i].
[[nodiscard]] std::string unpermute(
        std::string_view text, std::vector<size_t> const& permutation);

// Columns grouped by (uppercased) key letter, groups in ascending letter
// order, columns of a group left to right; every column is emitted whole,
// top to bottom, before the next one.
[[nodiscard]] coordinate_order myszkowski_order(std::string_view key, size_t rows);

// Lays text on a rows x cols grid along write_order, then reads it back along
// read_order. Encryption and decryption of a transposition cipher are the
// same call with the two orders swapped.
[[nodiscard]] std::string transpose(
        std::string_view text, size_t rows, size_t cols,
        coordinate_order const& write_order, coordinate_order const& read_order);

// text followed by enough pad characters to fill whole blocks.
[[nodiscard]] std::string pad_to_block(std::string_view text, size_t block);

#endif    // LIB_TRANSPOSITION_GRID_HH
