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

#include "classicrypt/atbash.hh"

#include "classicrypt/alphabet.hh"

#include <string>
#include <string_view>

using std::string;
using std::string_view;

string atbash::encrypt(string_view const text, atbash_key const&) {
    return substitute(text, [](int const residue) {
        return alphabet_size - 1 - residue;
    });
}

string atbash::decrypt(string_view const text, atbash_key const& key) {
    return encrypt(text, key);
}
