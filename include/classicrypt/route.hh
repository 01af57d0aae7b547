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

#ifndef LIB_ROUTE_HH
#define LIB_ROUTE_HH

#include <classicrypt/basic_cipher.hh>
#include <classicrypt/transposition_grid.hh>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

class route;

struct route_key {
    using format_t = route;

    int64_t       rows{1};
    int64_t       cols{1};
    route_pattern pattern{route_pattern::spiral_in};
};

using basic_route = basic_cipher<route, route_key>;

/*
 * The canonical text is written row by row into a rows x cols grid, padded
 * with 'X', and read out along the route pattern. Decryption writes along
 * the pattern and reads row by row.
 *
 * Throws invalid_parameter if rows or cols is below 1, if the text does not
 * fit the grid when encrypting, or if it does not fill it exactly when
 * decrypting.
 */
class route : public basic_route {
public:
    using basic_route::decrypt;
    using basic_route::encrypt;

    static std::string encrypt(std::string_view text, route_key const& key);
    static std::string decrypt(std::string_view text, route_key const& key);

    static size_t padding_for(std::string_view text, route_key const& key);
};

#endif    // LIB_ROUTE_HH
