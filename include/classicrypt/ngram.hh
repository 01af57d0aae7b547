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

#ifndef LIB_NGRAM_HH
#define LIB_NGRAM_HH

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/*
 * Statistics used to attack the ciphers in this library. All of them are
 * pure functions of their arguments.
 */

struct ngram_count {
    std::string gram;
    size_t      count;
    // Share of all n-grams of the text, in percent.
    double percentage;
};

// Most frequent first; equal counts keep the order of first appearance.
using frequency_table = std::vector<ngram_count>;

// Sequence -> ascending start offsets; only sequences seen at least twice.
using sequence_offsets = std::map<std::string, std::vector<size_t>>;

// Character n-grams of the uppercased text (every character counts,
// including spaces), or, with as_word, n-grams of the lowercased words of
// the text joined by single spaces. A word is a run of letters, digits and
// underscores. Throws invalid_domain if n < 1; yields nothing when the text
// is shorter than n.
[[nodiscard]] std::vector<std::string> ngrams(
        std::string_view text, int64_t n, bool as_word = false);

[[nodiscard]] frequency_table frequency_analysis(
        std::string_view text, int64_t n = 1, bool as_word = false);

// Purely alphabetic substrings of the uppercased text with length in
// [min_length, max_length] that occur more than once. Throws invalid_domain
// if min_length < 1.
[[nodiscard]] sequence_offsets find_repeated_sequences(
        std::string_view text, int64_t min_length = 3, int64_t max_length = 10);

// Chance that two letters drawn from the text are equal; non-letters are
// ignored, and texts with fewer than two letters give 0.
[[nodiscard]] double index_of_coincidence(std::string_view text);

#endif    // LIB_NGRAM_HH
