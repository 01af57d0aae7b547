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

#ifndef LIB_CIPHER_HH
#define LIB_CIPHER_HH

#include <classicrypt/affine.hh>
#include <classicrypt/atbash.hh>
#include <classicrypt/august.hh>
#include <classicrypt/autokey.hh>
#include <classicrypt/beaufort.hh>
#include <classicrypt/caesar.hh>
#include <classicrypt/hill.hh>
#include <classicrypt/myszkowski.hh>
#include <classicrypt/rail_fence.hh>
#include <classicrypt/route.hh>
#include <classicrypt/vigenere.hh>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

// One alternative per cipher; the alternative held selects the algorithm.
using cipher_key = std::variant<
        caesar_key, affine_key, atbash_key, august_key, vigenere_key, beaufort_key,
        autokey_key, hill_key, rail_fence_key, route_key, myszkowski_key>;

struct cipher_result {
    std::string text;
    // Pad characters appended to fill the last block (Hill, Route and
    // Myszkowski only). Hand it back to decrypt to drop them again.
    size_t padding{0};
};

[[nodiscard]] cipher_result encrypt(std::string_view text, cipher_key const& key);

// Drops up to padding trailing characters from the decrypted text.
[[nodiscard]] std::string decrypt(
        std::string_view text, cipher_key const& key, size_t padding = 0);

// "caesar", "affine", ..., "myszkowski".
[[nodiscard]] std::string_view cipher_name(cipher_key const& key) noexcept;

#endif    // LIB_CIPHER_HH
