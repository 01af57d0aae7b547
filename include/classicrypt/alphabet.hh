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

#ifndef LIB_ALPHABET_HH
#define LIB_ALPHABET_HH

#include "classicrypt/modular.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

constexpr inline int64_t alphabet_size = 26;
constexpr inline char    pad_character = 'X';

// A letter, as its position in the alphabet plus its case.
struct alpha_symbol {
    int  residue;
    bool upper;

    constexpr bool operator==(alpha_symbol const&) const noexcept = default;
};

// Anything that is not a letter; carried through unchanged.
struct other_symbol {
    char value;

    constexpr bool operator==(other_symbol const&) const noexcept = default;
};

using text_symbol = std::variant<alpha_symbol, other_symbol>;

constexpr inline bool is_upper_letter(char const chr) noexcept {
    return chr >= 'A' && chr <= 'Z';
}

constexpr inline bool is_lower_letter(char const chr) noexcept {
    return chr >= 'a' && chr <= 'z';
}

constexpr inline bool is_letter(char const chr) noexcept {
    return is_upper_letter(chr) || is_lower_letter(chr);
}

constexpr inline bool is_digit(char const chr) noexcept {
    return chr >= '0' && chr <= '9';
}

constexpr inline bool is_alnum(char const chr) noexcept {
    return is_letter(chr) || is_digit(chr);
}

constexpr inline char to_upper(char const chr) noexcept {
    return is_lower_letter(chr) ? static_cast<char>(chr - 'a' + 'A') : chr;
}

constexpr inline char to_lower(char const chr) noexcept {
    return is_upper_letter(chr) ? static_cast<char>(chr - 'A' + 'a') : chr;
}

constexpr inline text_symbol to_residue(char const chr) noexcept {
    if (is_upper_letter(chr)) {
        return alpha_symbol{chr - 'A', true};
    }
    if (is_lower_letter(chr)) {
        return alpha_symbol{chr - 'a', false};
    }
    return other_symbol{chr};
}

// Any integer is accepted and reduced modulo the alphabet size first.
constexpr inline char from_residue(int64_t const residue, bool const upper) noexcept {
    auto const offset = static_cast<char>(floor_mod(residue, alphabet_size));
    return static_cast<char>((upper ? 'A' : 'a') + offset);
}

// Shift contributed by a key character: its residue if it is a letter, else 0.
constexpr inline int key_residue(char const chr) noexcept {
    auto const symbol = to_residue(chr);
    if (auto const* alpha = std::get_if<alpha_symbol>(&symbol)) {
        return alpha->residue;
    }
    return 0;
}

// Uppercased copy holding only letters and digits. This is the text every
// transposition cipher works on.
inline std::string canonical_text(std::string_view const text) {
    std::string result;
    result.reserve(text.size());
    for (char const chr : text) {
        if (is_alnum(chr)) {
            result.push_back(to_upper(chr));
        }
    }
    return result;
}

// Uppercased copy holding only letters; used by the Hill cipher.
inline std::string canonical_letters(std::string_view const text) {
    std::string result;
    result.reserve(text.size());
    for (char const chr : text) {
        if (is_letter(chr)) {
            result.push_back(to_upper(chr));
        }
    }
    return result;
}

inline std::string upper_copy(std::string_view const text) {
    std::string result(text);
    for (char& chr : result) {
        chr = to_upper(chr);
    }
    return result;
}

// Applies transform to the residue of each letter of text, keeping its case;
// all other characters are copied unchanged and never reach transform.
template <typename Transform>
std::string substitute(std::string_view const text, Transform&& transform) {
    std::string result;
    result.reserve(text.size());
    for (char const chr : text) {
        auto const symbol = to_residue(chr);
        if (auto const* alpha = std::get_if<alpha_symbol>(&symbol)) {
            auto const residue = transform(alpha->residue);
            result.push_back(from_residue(residue, alpha->upper));
        } else {
            result.push_back(chr);
        }
    }
    return result;
}

#endif    // LIB_ALPHABET_HH
