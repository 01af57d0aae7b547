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

#ifndef LIB_VIGENERE_HH
#define LIB_VIGENERE_HH

#include <classicrypt/basic_cipher.hh>

#include <iosfwd>
#include <string>
#include <string_view>

class vigenere;

struct vigenere_key {
    using format_t = vigenere;

    std::string keyword;
};

using basic_vigenere = basic_cipher<vigenere, vigenere_key>;

// Adds the repeating keyword to the letters of the text. An empty keyword
// is an invalid_key.
class vigenere : public basic_vigenere {
public:
    using basic_vigenere::decrypt;
    using basic_vigenere::encrypt;

    static std::string encrypt(std::string_view text, vigenere_key const& key);
    static std::string decrypt(std::string_view text, vigenere_key const& key);
};

#endif    // LIB_VIGENERE_HH
