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

#include "classicrypt/transposition_grid.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/cipher_error.hh"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using std::string;
using std::string_view;
using std::vector;
using namespace std::string_view_literals;

namespace {
    constexpr std::array const pattern_names{
            std::pair{ "spiral_in"sv,  route_pattern::spiral_in},
            std::pair{"spiral_out"sv, route_pattern::spiral_out},
            std::pair{     "snake"sv,      route_pattern::snake},
            std::pair{  "diagonal"sv,   route_pattern::diagonal},
    };
}    // namespace

route_pattern parse_route_pattern(string_view const name) {
    auto const iter = std::ranges::find_if(pattern_names, [&](auto const& entry) {
        return entry.first == name;
    });
    if (iter == std::ranges::end(pattern_names)) {
        throw invalid_parameter(
                "unknown route pattern '" + string(name)
                + "'; expected spiral_in, spiral_out, snake or diagonal");
    }
    return iter->second;
}

string_view route_pattern_name(route_pattern const pattern) noexcept {
    switch (pattern) {
    case route_pattern::spiral_in:
        return "spiral_in"sv;
    case route_pattern::spiral_out:
        return "spiral_out"sv;
    case route_pattern::snake:
        return "snake"sv;
    case route_pattern::diagonal:
        return "diagonal"sv;
    }
    __builtin_unreachable();
}

char_grid::char_grid(size_t const rows_in, size_t const cols_in)
        : num_rows(rows_in), num_cols(cols_in), cells(rows_in * cols_in, pad_character) {}

void char_grid::write(coordinate_order const& order, string_view const text) {
    for (size_t ii = 0; ii < text.size(); ii++) {
        auto const [row, col] = order[ii];
        (*this)(row, col)     = text[ii];
    }
}

string char_grid::read(coordinate_order const& order) const {
    string result;
    result.reserve(order.size());
    for (auto const [row, col] : order) {
        result.push_back((*this)(row, col));
    }
    return result;
}

coordinate_order row_major_order(size_t const rows, size_t const cols) {
    coordinate_order order;
    order.reserve(rows * cols);
    for (size_t row = 0; row < rows; row++) {
        for (size_t col = 0; col < cols; col++) {
            order.push_back({row, col});
        }
    }
    return order;
}

coordinate_order spiral_in_order(size_t const rows, size_t const cols) {
    coordinate_order order;
    order.reserve(rows * cols);
    // Signed bounds: the right and bottom edges step past zero on the last
    // ring.
    auto top    = ptrdiff_t{0};
    auto bottom = static_cast<ptrdiff_t>(rows) - 1;
    auto left   = ptrdiff_t{0};
    auto right  = static_cast<ptrdiff_t>(cols) - 1;
    auto const push = [&](ptrdiff_t const row, ptrdiff_t const col) {
        order.push_back({static_cast<size_t>(row), static_cast<size_t>(col)});
    };
    while (top <= bottom && left <= right) {
        for (ptrdiff_t col = left; col <= right; col++) {
            push(top, col);
        }
        top++;
        for (ptrdiff_t row = top; row <= bottom; row++) {
            push(row, right);
        }
        right--;
        if (top <= bottom) {
            for (ptrdiff_t col = right; col >= left; col--) {
                push(bottom, col);
            }
            bottom--;
        }
        if (left <= right) {
            for (ptrdiff_t row = bottom; row >= top; row--) {
                push(row, left);
            }
            left++;
        }
    }
    return order;
}

coordinate_order spiral_out_order(size_t const rows, size_t const cols) {
    coordinate_order order = spiral_in_order(rows, cols);
    std::ranges::reverse(order);
    return order;
}

coordinate_order snake_order(size_t const rows, size_t const cols) {
    coordinate_order order;
    order.reserve(rows * cols);
    for (size_t row = 0; row < rows; row++) {
        for (size_t ii = 0; ii < cols; ii++) {
            size_t const col = (row % 2) == 0 ? ii : cols - 1 - ii;
            order.push_back({row, col});
        }
    }
    return order;
}

coordinate_order diagonal_order(size_t const rows, size_t const cols) {
    coordinate_order order;
    order.reserve(rows * cols);
    if (rows == 0 || cols == 0) {
        return order;
    }
    for (size_t sum = 0; sum < rows + cols - 1; sum++) {
        for (size_t row = 0; row < rows && row <= sum; row++) {
            size_t const col = sum - row;
            if (col < cols) {
                order.push_back({row, col});
            }
        }
    }
    return order;
}

coordinate_order route_order(
        route_pattern const pattern, size_t const rows, size_t const cols) {
    switch (pattern) {
    case route_pattern::spiral_in:
        return spiral_in_order(rows, cols);
    case route_pattern::spiral_out:
        return spiral_out_order(rows, cols);
    case route_pattern::snake:
        return snake_order(rows, cols);
    case route_pattern::diagonal:
        return diagonal_order(rows, cols);
    }
    __builtin_unreachable();
}

vector<size_t> rail_assignment(size_t const length, size_t const rails) {
    vector<size_t> result;
    result.reserve(length);
    size_t rail      = 0;
    bool   downwards = true;
    for (size_t ii = 0; ii < length; ii++) {
        result.push_back(rail);
        if (rails < 2) {
            continue;
        }
        if (rail == 0) {
            downwards = true;
        } else if (rail == rails - 1) {
            downwards = false;
        }
        rail = downwards ? rail + 1 : rail - 1;
    }
    return result;
}

vector<size_t> rail_fence_permutation(size_t const length, size_t const rails) {
    vector<size_t> const rail_of = rail_assignment(length, rails);
    vector<size_t>       positions(length);
    std::iota(positions.begin(), positions.end(), size_t{0});
    std::ranges::stable_sort(positions, std::ranges::less{}, [&](size_t const pos) {
        return rail_of[pos];
    });
    return positions;
}

string permute(string_view const text, vector<size_t> const& permutation) {
    string result;
    result.reserve(permutation.size());
    for (size_t const pos : permutation) {
        result.push_back(text[pos]);
    }
    return result;
}

string unpermute(string_view const text, vector<size_t> const& permutation) {
    string result(permutation.size(), pad_character);
    for (size_t ii = 0; ii < permutation.size(); ii++) {
        result[permutation[ii]] = text[ii];
    }
    return result;
}

coordinate_order myszkowski_order(string_view const key, size_t const rows) {
    string const   letters = upper_copy(key);
    vector<size_t> columns(letters.size());
    std::iota(columns.begin(), columns.end(), size_t{0});
    std::ranges::stable_sort(columns, std::ranges::less{}, [&](size_t const col) {
        return letters[col];
    });

    coordinate_order order;
    order.reserve(rows * columns.size());
    for (size_t const col : columns) {
        for (size_t row = 0; row < rows; row++) {
            order.push_back({row, col});
        }
    }
    return order;
}

string transpose(
        string_view const text, size_t const rows, size_t const cols,
        coordinate_order const& write_order, coordinate_order const& read_order) {
    char_grid grid(rows, cols);
    grid.write(write_order, text);
    return grid.read(read_order);
}

string pad_to_block(string_view const text, size_t const block) {
    string result(text);
    if (block > 0) {
        result.resize(detail::round_up(text.size(), block), pad_character);
    }
    return result;
}
