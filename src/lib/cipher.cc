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

#include "classicrypt/cipher.hh"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

using std::string;
using std::string_view;
using namespace std::string_view_literals;

namespace detail {
    template <typename Format, typename Key>
    concept reports_padding = requires(string_view text, Key const& key) {
        { Format::padding_for(text, key) } -> std::same_as<size_t>;
    };

    // Same order as the alternatives of cipher_key.
    constexpr std::array const cipher_names{
            "caesar"sv,  "affine"sv,    "atbash"sv, "august"sv,
            "vigenere"sv, "beaufort"sv, "autokey"sv, "hill"sv,
            "railfence"sv, "route"sv,   "myszkowski"sv,
    };
    static_assert(cipher_names.size() == std::variant_size_v<cipher_key>);
}    // namespace detail

cipher_result encrypt(string_view const text, cipher_key const& key) {
    return std::visit(
            [&](auto const& alternative) {
                using key_t    = std::decay_t<decltype(alternative)>;
                using format_t = typename key_t::format_t;
                cipher_result result{format_t::encrypt(text, alternative)};
                if constexpr (detail::reports_padding<format_t, key_t>) {
                    result.padding = format_t::padding_for(text, alternative);
                }
                return result;
            },
            key);
}

string decrypt(string_view const text, cipher_key const& key, size_t const padding) {
    string result = std::visit(
            [&](auto const& alternative) {
                using format_t = typename std::decay_t<decltype(alternative)>::format_t;
                return format_t::decrypt(text, alternative);
            },
            key);
    result.resize(result.size() - std::min(padding, result.size()));
    return result;
}

string_view cipher_name(cipher_key const& key) noexcept {
    return detail::cipher_names[key.index()];
}
