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

#ifndef LIB_AFFINE_HH
#define LIB_AFFINE_HH

#include <classicrypt/basic_cipher.hh>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

class affine;

struct affine_key {
    using format_t = affine;

    int64_t a{1};
    int64_t b{0};
};

using basic_affine = basic_cipher<affine, affine_key>;

/*
 * E(x) = (a*x + b) mod 26, D(x) = a^-1 * (x - b) mod 26. Both directions
 * throw invalid_key unless gcd(a, 26) == 1.
 */
class affine : public basic_affine {
public:
    using basic_affine::decrypt;
    using basic_affine::encrypt;

    static std::string encrypt(std::string_view text, affine_key const& key);
    static std::string decrypt(std::string_view text, affine_key const& key);
};

#endif    // LIB_AFFINE_HH
