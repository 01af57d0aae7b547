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

#include "classicrypt/caesar.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/modular.hh"

#include <cstdint>
#include <string>
#include <string_view>

using std::string;
using std::string_view;

string caesar::encrypt(string_view const text, caesar_key const& key) {
    int64_t const shift = floor_mod(key.shift, alphabet_size);
    return substitute(text, [&](int const residue) {
        return residue + shift;
    });
}

string caesar::decrypt(string_view const text, caesar_key const& key) {
    return encrypt(text, caesar_key{.shift = -floor_mod(key.shift, alphabet_size)});
}
