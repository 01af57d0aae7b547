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

#ifndef LIB_MYSZKOWSKI_HH
#define LIB_MYSZKOWSKI_HH

#include <classicrypt/basic_cipher.hh>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

class myszkowski;

struct myszkowski_key {
    using format_t = myszkowski;

    std::string keyword;
};

using basic_myszkowski = basic_cipher<myszkowski, myszkowski_key>;

// Columnar transposition with one column per keyword letter; columns that
// share a letter are read together, left to right. See myszkowski_order.
class myszkowski : public basic_myszkowski {
public:
    using basic_myszkowski::decrypt;
    using basic_myszkowski::encrypt;

    static std::string encrypt(std::string_view text, myszkowski_key const& key);
    static std::string decrypt(std::string_view text, myszkowski_key const& key);

    static size_t padding_for(std::string_view text, myszkowski_key const& key);
};

#endif    // LIB_MYSZKOWSKI_HH
