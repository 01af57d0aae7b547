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

#ifndef LIB_BEAUFORT_HH
#define LIB_BEAUFORT_HH

#include <classicrypt/basic_cipher.hh>

#include <iosfwd>
#include <string>
#include <string_view>

class beaufort;

struct beaufort_key {
    using format_t = beaufort;

    std::string keyword;
};

using basic_beaufort = basic_cipher<beaufort, beaufort_key>;

// C = (K - P) mod 26 with a repeating keyword; encryption and decryption are
// the same operation.
class beaufort : public basic_beaufort {
public:
    using basic_beaufort::decrypt;
    using basic_beaufort::encrypt;

    static std::string encrypt(std::string_view text, beaufort_key const& key);
    static std::string decrypt(std::string_view text, beaufort_key const& key);
};

#endif    // LIB_BEAUFORT_HH
