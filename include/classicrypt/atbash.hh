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

#ifndef LIB_ATBASH_HH
#define LIB_ATBASH_HH

#include <classicrypt/basic_cipher.hh>

#include <iosfwd>
#include <string>
#include <string_view>

class atbash;

struct atbash_key {
    using format_t = atbash;
};

using basic_atbash = basic_cipher<atbash, atbash_key>;

// Mirrors the alphabet (A <-> Z); its own inverse.
class atbash : public basic_atbash {
public:
    using basic_atbash::decrypt;
    using basic_atbash::encrypt;

    static std::string encrypt(std::string_view text, atbash_key const& key);
    static std::string decrypt(std::string_view text, atbash_key const& key);
};

#endif    // LIB_ATBASH_HH
