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

#ifndef LIB_MODULAR_HH
#define LIB_MODULAR_HH

#include <cstdint>
#include <numeric>
#include <optional>

namespace detail {
    struct euclid_result {
        int64_t gcd;
        int64_t x;
        int64_t y;
    };

    // Solves a*x + b*y = gcd(a, b).
    constexpr inline euclid_result extended_euclid(int64_t a, int64_t b) noexcept {
        int64_t old_r = a;
        int64_t r     = b;
        int64_t old_s = 1;
        int64_t s     = 0;
        int64_t old_t = 0;
        int64_t t     = 1;
        while (r != 0) {
            int64_t const quotient = old_r / r;
            int64_t const next_r   = old_r - quotient * r;
            int64_t const next_s   = old_s - quotient * s;
            int64_t const next_t   = old_t - quotient * t;
            old_r                  = r;
            r                      = next_r;
            old_s                  = s;
            s                      = next_s;
            old_t                  = t;
            t                      = next_t;
        }
        return {old_r, old_s, old_t};
    }
}    // namespace detail

// Remainder with the sign of the modulus; result is always in [0, modulus).
constexpr inline int64_t floor_mod(int64_t const value, int64_t const modulus) noexcept {
    int64_t const remainder = value % modulus;
    return remainder < 0 ? remainder + modulus : remainder;
}

constexpr inline bool is_unit_mod(int64_t const value, int64_t const modulus) noexcept {
    return std::gcd(floor_mod(value, modulus), modulus) == 1;
}

// Multiplicative inverse of value modulo modulus, or nothing if value and
// modulus are not coprime.
constexpr inline std::optional<int64_t> inverse_mod(
        int64_t const value, int64_t const modulus) noexcept {
    auto const euclid = detail::extended_euclid(floor_mod(value, modulus), modulus);
    if (euclid.gcd != 1) {
        return std::nullopt;
    }
    return floor_mod(euclid.x, modulus);
}

#endif    // LIB_MODULAR_HH
