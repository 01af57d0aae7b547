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

#ifndef LIB_AUGUST_HH
#define LIB_AUGUST_HH

#include <classicrypt/basic_cipher.hh>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

class august;

struct august_key {
    using format_t = august;

    int64_t initial_shift{1};
};

using basic_august = basic_cipher<august, august_key>;

// Caesar shift that grows by one after every letter, starting at
// initial_shift.
class august : public basic_august {
public:
    using basic_august::decrypt;
    using basic_august::encrypt;

    static std::string encrypt(std::string_view text, august_key const& key);
    static std::string decrypt(std::string_view text, august_key const& key);
};

#endif    // LIB_AUGUST_HH
