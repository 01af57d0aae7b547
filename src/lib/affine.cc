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

#include "classicrypt/affine.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/cipher_error.hh"
#include "classicrypt/modular.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using std::string;
using std::string_view;

class affine_internal {
public:
    // Returns a^-1 mod 26.
    static int64_t checked_inverse(affine_key const& key) {
        std::optional<int64_t> const inverse = inverse_mod(key.a, alphabet_size);
        if (!inverse.has_value()) {
            throw invalid_key(
                    "affine multiplier " + std::to_string(key.a)
                    + " is not coprime with 26");
        }
        return *inverse;
    }
};

string affine::encrypt(string_view const text, affine_key const& key) {
    affine_internal::checked_inverse(key);
    int64_t const mult = floor_mod(key.a, alphabet_size);
    int64_t const add  = floor_mod(key.b, alphabet_size);
    return substitute(text, [&](int const residue) {
        return mult * residue + add;
    });
}

string affine::decrypt(string_view const text, affine_key const& key) {
    int64_t const inverse = affine_internal::checked_inverse(key);
    int64_t const add     = floor_mod(key.b, alphabet_size);
    return substitute(text, [&](int const residue) {
        return inverse * (residue - add);
    });
}
