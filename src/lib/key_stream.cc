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

#include "classicrypt/key_stream.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/cipher_error.hh"

#include <string>
#include <string_view>

using std::string_view;

repeating_key_stream::repeating_key_stream(string_view const keyword) {
    if (keyword.empty()) {
        throw invalid_key("keyword must not be empty");
    }
    shifts.reserve(keyword.size());
    for (char const chr : keyword) {
        shifts.push_back(key_residue(chr));
    }
}

int repeating_key_stream::next() noexcept {
    int const shift = shifts[index];
    index           = (index + 1) % shifts.size();
    return shift;
}

autokey_key_stream::autokey_key_stream(string_view const priming_key)
        : priming(priming_key) {
    if (priming.empty()) {
        throw invalid_key("autokey priming key must not be empty");
    }
}

int autokey_key_stream::at(size_t const position, string_view const source) const noexcept {
    if (position < priming.size()) {
        return key_residue(priming[position]);
    }
    return key_residue(source[position - priming.size()]);
}
