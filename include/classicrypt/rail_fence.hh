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

#ifndef LIB_RAIL_FENCE_HH
#define LIB_RAIL_FENCE_HH

#include <classicrypt/basic_cipher.hh>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

class rail_fence;

struct rail_fence_key {
    using format_t = rail_fence;

    int64_t rails{2};
};

using basic_rail_fence = basic_cipher<rail_fence, rail_fence_key>;

// Zigzag transposition over the canonical text (uppercase letters and
// digits). Never pads. Throws invalid_parameter unless
// 2 <= rails <= length of the canonical text.
class rail_fence : public basic_rail_fence {
public:
    using basic_rail_fence::decrypt;
    using basic_rail_fence::encrypt;

    static std::string encrypt(std::string_view text, rail_fence_key const& key);
    static std::string decrypt(std::string_view text, rail_fence_key const& key);
};

#endif    // LIB_RAIL_FENCE_HH
