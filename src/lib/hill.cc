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

#include "classicrypt/hill.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/cipher_error.hh"
#include "classicrypt/modular.hh"
#include "classicrypt/modular_matrix.hh"
#include "classicrypt/transposition_grid.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using std::string;
using std::string_view;
using std::vector;

class hill_internal {
public:
    // The key matrix reduced mod 26. Throws invalid_key when it is empty or
    // not invertible.
    static square_matrix checked_matrix(hill_key const& key) {
        if (key.matrix.order() == 0) {
            throw invalid_key("Hill key matrix must not be empty");
        }
        square_matrix reduced = reduce_mod(key.matrix, alphabet_size);
        int64_t const det     = determinant_mod(reduced, alphabet_size);
        if (!is_unit_mod(det, alphabet_size)) {
            throw invalid_key(
                    "Hill key matrix determinant " + std::to_string(det)
                    + " (mod 26) is not invertible modulo 26");
        }
        return reduced;
    }

    // letters holds uppercase letters only, in whole blocks.
    static string apply(string_view const letters, square_matrix const& matrix) {
        size_t const    order = matrix.order();
        string          result;
        vector<int64_t> block(order);
        result.reserve(letters.size());
        for (size_t start = 0; start < letters.size(); start += order) {
            for (size_t ii = 0; ii < order; ii++) {
                block[ii] = letters[start + ii] - 'A';
            }
            for (int64_t const value : multiply_mod(matrix, block, alphabet_size)) {
                result.push_back(from_residue(value, true));
            }
        }
        return result;
    }
};

string hill::encrypt(string_view const text, hill_key const& key) {
    square_matrix const matrix  = hill_internal::checked_matrix(key);
    string const        letters = pad_to_block(canonical_letters(text), matrix.order());
    return hill_internal::apply(letters, matrix);
}

string hill::decrypt(string_view const text, hill_key const& key) {
    square_matrix const inverse
            = modular_inverse(hill_internal::checked_matrix(key), alphabet_size);
    string const letters = canonical_letters(text);
    if ((letters.size() % inverse.order()) != 0) {
        throw invalid_parameter(
                "Hill ciphertext length " + std::to_string(letters.size())
                + " is not a multiple of the block size "
                + std::to_string(inverse.order()));
    }
    return hill_internal::apply(letters, inverse);
}

size_t hill::padding_for(string_view const text, hill_key const& key) {
    size_t const order = key.matrix.order();
    if (order == 0) {
        return 0;
    }
    size_t const length = canonical_letters(text).size();
    return detail::round_up(length, order) - length;
}
