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

#ifndef LIB_HILL_HH
#define LIB_HILL_HH

#include <classicrypt/basic_cipher.hh>
#include <classicrypt/modular_matrix.hh>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

class hill;

struct hill_key {
    using format_t = hill;

    square_matrix matrix;
};

using basic_hill = basic_cipher<hill, hill_key>;

/*
 * Polygraphic cipher: the letters of the text (uppercased, everything else
 * dropped) are cut into blocks of matrix.order() letters, the last block
 * padded with 'X', and every block P becomes K * P mod 26. Decryption uses
 * the exact modular inverse of K and requires whole blocks.
 *
 * Both directions throw invalid_key if det(K) is not coprime with 26.
 */
class hill : public basic_hill {
public:
    using basic_hill::decrypt;
    using basic_hill::encrypt;

    static std::string encrypt(std::string_view text, hill_key const& key);
    static std::string decrypt(std::string_view text, hill_key const& key);

    // Number of pad letters encrypt appends to text.
    static size_t padding_for(std::string_view text, hill_key const& key);
};

#endif    // LIB_HILL_HH
