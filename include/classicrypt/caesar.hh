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

#ifndef LIB_CAESAR_HH
#define LIB_CAESAR_HH

#include <classicrypt/basic_cipher.hh>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

class caesar;

struct caesar_key {
    using format_t = caesar;

    int64_t shift{0};
};

using basic_caesar = basic_cipher<caesar, caesar_key>;

// Shifts every letter by a fixed amount; case and non-letters are kept.
class caesar : public basic_caesar {
public:
    using basic_caesar::decrypt;
    using basic_caesar::encrypt;

    static std::string encrypt(std::string_view text, caesar_key const& key);
    static std::string decrypt(std::string_view text, caesar_key const& key);
};

#endif    // LIB_CAESAR_HH
