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

#include "classicrypt/ngram.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/cipher_error.hh"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

using std::string;
using std::string_view;
using std::vector;

class ngram_internal {
public:
    static constexpr bool is_word_char(char const chr) noexcept {
        return is_alnum(chr) || chr == '_';
    }

    static vector<string> split_words(string_view const text) {
        vector<string> words;
        string         current;
        for (char const chr : text) {
            if (is_word_char(chr)) {
                current.push_back(to_lower(chr));
            } else if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty()) {
            words.push_back(std::move(current));
        }
        return words;
    }

    static bool all_letters(string_view const text) noexcept {
        return std::ranges::all_of(text, is_letter);
    }
};

vector<string> ngrams(string_view const text, int64_t const n, bool const as_word) {
    if (n < 1) {
        throw invalid_domain("n-gram size must be at least 1, got " + std::to_string(n));
    }
    auto const     size = static_cast<size_t>(n);
    vector<string> result;
    if (as_word) {
        vector<string> const words = ngram_internal::split_words(text);
        if (words.size() < size) {
            return result;
        }
        result.reserve(words.size() - size + 1);
        for (size_t start = 0; start + size <= words.size(); start++) {
            string gram = words[start];
            for (size_t ii = 1; ii < size; ii++) {
                gram += ' ';
                gram += words[start + ii];
            }
            result.push_back(std::move(gram));
        }
        return result;
    }
    string const upper = upper_copy(text);
    if (upper.size() < size) {
        return result;
    }
    result.reserve(upper.size() - size + 1);
    for (size_t start = 0; start + size <= upper.size(); start++) {
        result.push_back(upper.substr(start, size));
    }
    return result;
}

frequency_table frequency_analysis(
        string_view const text, int64_t const n, bool const as_word) {
    vector<string> const grams = ngrams(text, n, as_word);
    frequency_table      table;
    if (grams.empty()) {
        return table;
    }
    std::unordered_map<string, size_t> slot_of;
    for (auto const& gram : grams) {
        auto const [iter, inserted] = slot_of.try_emplace(gram, table.size());
        if (inserted) {
            table.push_back({gram, 0, 0.0});
        }
        table[iter->second].count++;
    }
    auto const total = static_cast<double>(grams.size());
    for (auto& entry : table) {
        entry.percentage = static_cast<double>(entry.count) / total * 100.0;
    }
    std::ranges::stable_sort(table, std::ranges::greater{}, &ngram_count::count);
    return table;
}

sequence_offsets find_repeated_sequences(
        string_view const text, int64_t const min_length, int64_t const max_length) {
    if (min_length < 1) {
        throw invalid_domain(
                "minimum sequence length must be at least 1, got "
                + std::to_string(min_length));
    }
    string const     upper = upper_copy(text);
    sequence_offsets result;
    for (auto length = static_cast<size_t>(min_length);
         std::cmp_less_equal(length, max_length) && length <= upper.size(); length++) {
        for (size_t start = 0; start + length <= upper.size(); start++) {
            string_view const sequence = string_view(upper).substr(start, length);
            if (ngram_internal::all_letters(sequence)) {
                result[string(sequence)].push_back(start);
            }
        }
    }
    std::erase_if(result, [](auto const& entry) {
        return entry.second.size() < 2;
    });
    return result;
}

double index_of_coincidence(string_view const text) {
    std::array<size_t, alphabet_size> counts{};
    size_t                            total = 0;
    for (char const chr : text) {
        if (is_letter(chr)) {
            counts[static_cast<size_t>(to_upper(chr) - 'A')]++;
            total++;
        }
    }
    if (total <= 1) {
        return 0.0;
    }
    size_t pairs = 0;
    for (size_t const count : counts) {
        if (count > 1) {
            pairs += count * (count - 1);
        }
    }
    auto const letters = static_cast<double>(total);
    return static_cast<double>(pairs) / (letters * (letters - 1.0));
}
