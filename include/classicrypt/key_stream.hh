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

#ifndef LIB_KEY_STREAM_HH
#define LIB_KEY_STREAM_HH

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/*
 * Key streams hand out one shift per letter of the text they are driven
 * with. They are owned by a single encrypt or decrypt call and advanced by
 * the caller only for letters, so punctuation never consumes a key position.
 */

// Cycles the letters of a keyword: K[0], K[1], ..., K[n-1], K[0], ...
class repeating_key_stream {
public:
    // Throws invalid_key if the keyword is empty.
    explicit repeating_key_stream(std::string_view keyword);

    [[nodiscard]] int next() noexcept;

    [[nodiscard]] size_t period() const noexcept {
        return shifts.size();
    }

private:
    std::vector<int> shifts;
    size_t           index{0};
};

// shift, shift + 1, shift + 2, ...
class progressive_key_stream {
public:
    constexpr explicit progressive_key_stream(int64_t const initial_shift) noexcept
            : shift(initial_shift) {}

    [[nodiscard]] constexpr int64_t next() noexcept {
        return shift++;
    }

private:
    int64_t shift;
};

// Self-extending stream: position i uses priming_key[i] while it lasts, and
// source[i - len(priming_key)] after that. Every character of the text takes
// a position, letters or not.
class autokey_key_stream {
public:
    // Throws invalid_key if the priming key is empty, as the stream would
    // then depend on the very character being deciphered.
    explicit autokey_key_stream(std::string_view priming_key);

    // source is the plaintext when encrypting. When decrypting it is the
    // output built so far, which always holds the character needed because
    // position - priming_length() < position.
    [[nodiscard]] int at(size_t position, std::string_view source) const noexcept;

    [[nodiscard]] size_t priming_length() const noexcept {
        return priming.size();
    }

private:
    std::string priming;
};

#endif    // LIB_KEY_STREAM_HH
