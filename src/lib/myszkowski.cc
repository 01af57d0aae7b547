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

#include "classicrypt/myszkowski.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/cipher_error.hh"
#include "classicrypt/transposition_grid.hh"

#include <cstddef>
#include <string>
#include <string_view>

using std::string;
using std::string_view;

class myszkowski_internal {
public:
    static size_t checked_columns(myszkowski_key const& key) {
        if (key.keyword.empty()) {
            throw invalid_key("Myszkowski keyword must not be empty");
        }
        return key.keyword.size();
    }
};

string myszkowski::encrypt(string_view const text, myszkowski_key const& key) {
    size_t const cols   = myszkowski_internal::checked_columns(key);
    string const padded = pad_to_block(canonical_text(text), cols);
    size_t const rows   = padded.size() / cols;
    return transpose(
            padded, rows, cols, row_major_order(rows, cols),
            myszkowski_order(key.keyword, rows));
}

string myszkowski::decrypt(string_view const text, myszkowski_key const& key) {
    size_t const cols      = myszkowski_internal::checked_columns(key);
    string const canonical = canonical_text(text);
    if ((canonical.size() % cols) != 0) {
        throw invalid_parameter(
                "Myszkowski ciphertext length " + std::to_string(canonical.size())
                + " is not a multiple of the key length " + std::to_string(cols));
    }
    size_t const rows = canonical.size() / cols;
    return transpose(
            canonical, rows, cols, myszkowski_order(key.keyword, rows),
            row_major_order(rows, cols));
}

size_t myszkowski::padding_for(string_view const text, myszkowski_key const& key) {
    size_t const cols   = myszkowski_internal::checked_columns(key);
    size_t const length = canonical_text(text).size();
    return detail::round_up(length, cols) - length;
}
