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

#include "classicrypt/august.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/key_stream.hh"
#include "classicrypt/modular.hh"

#include <string>
#include <string_view>

using std::string;
using std::string_view;

string august::encrypt(string_view const text, august_key const& key) {
    progressive_key_stream shifts(floor_mod(key.initial_shift, alphabet_size));
    return substitute(text, [&](int const residue) {
        return residue + shifts.next();
    });
}

string august::decrypt(string_view const text, august_key const& key) {
    progressive_key_stream shifts(floor_mod(key.initial_shift, alphabet_size));
    return substitute(text, [&](int const residue) {
        return residue - shifts.next();
    });
}
