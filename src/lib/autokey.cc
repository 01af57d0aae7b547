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

#include "classicrypt/autokey.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/key_stream.hh"

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

using std::string;
using std::string_view;

string autokey::encrypt(string_view const text, autokey_key const& key) {
    autokey_key_stream const keys(key.priming_key);
    string                   result;
    result.reserve(text.size());
    for (size_t ii = 0; ii < text.size(); ii++) {
        auto const symbol = to_residue(text[ii]);
        if (auto const* alpha = std::get_if<alpha_symbol>(&symbol)) {
            result.push_back(from_residue(alpha->residue + keys.at(ii, text), alpha->upper));
        } else {
            result.push_back(text[ii]);
        }
    }
    return result;
}

string autokey::decrypt(string_view const text, autokey_key const& key) {
    autokey_key_stream const keys(key.priming_key);
    string                   result;
    result.reserve(text.size());
    for (size_t ii = 0; ii < text.size(); ii++) {
        auto const symbol = to_residue(text[ii]);
        if (auto const* alpha = std::get_if<alpha_symbol>(&symbol)) {
            // The key slot comes from plaintext recovered in earlier steps.
            result.push_back(from_residue(alpha->residue - keys.at(ii, result), alpha->upper));
        } else {
            result.push_back(text[ii]);
        }
    }
    return result;
}
