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

#include "classicrypt/route.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/cipher_error.hh"
#include "classicrypt/transposition_grid.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

using std::string;
using std::string_view;

class route_internal {
public:
    struct shape {
        size_t rows;
        size_t cols;

        [[nodiscard]] size_t cells() const noexcept {
            return rows * cols;
        }
    };

    static shape checked_shape(route_key const& key) {
        if (key.rows < 1 || key.cols < 1) {
            throw invalid_parameter(
                    "route grid must be at least 1x1, got "
                    + std::to_string(key.rows) + "x" + std::to_string(key.cols));
        }
        return {static_cast<size_t>(key.rows), static_cast<size_t>(key.cols)};
    }
};

string route::encrypt(string_view const text, route_key const& key) {
    auto const [rows, cols] = route_internal::checked_shape(key);
    string canonical        = canonical_text(text);
    if (canonical.size() > rows * cols) {
        throw invalid_parameter(
                "text of " + std::to_string(canonical.size())
                + " characters does not fit a " + std::to_string(rows) + "x"
                + std::to_string(cols) + " route grid");
    }
    canonical.resize(rows * cols, pad_character);
    return transpose(
            canonical, rows, cols, row_major_order(rows, cols),
            route_order(key.pattern, rows, cols));
}

string route::decrypt(string_view const text, route_key const& key) {
    auto const [rows, cols] = route_internal::checked_shape(key);
    string const canonical  = canonical_text(text);
    if (canonical.size() != rows * cols) {
        throw invalid_parameter(
                "route ciphertext of " + std::to_string(canonical.size())
                + " characters does not fill a " + std::to_string(rows) + "x"
                + std::to_string(cols) + " grid");
    }
    return transpose(
            canonical, rows, cols, route_order(key.pattern, rows, cols),
            row_major_order(rows, cols));
}

size_t route::padding_for(string_view const text, route_key const& key) {
    auto const   grid   = route_internal::checked_shape(key);
    size_t const length = canonical_text(text).size();
    return length < grid.cells() ? grid.cells() - length : 0;
}
