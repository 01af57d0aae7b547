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

#define BOOST_TEST_MODULE ngram
#include "classicrypt/cipher_error.hh"
#include "classicrypt/ngram.hh"
#include "classicrypt/vigenere.hh"

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace {
    constexpr char const* const dickens
            = "It was the best of times, it was the worst of times, it was the age "
              "of wisdom, it was the age of foolishness, it was the epoch of belief, "
              "it was the epoch of incredulity, it was the season of Light, it was "
              "the season of Darkness, it was the spring of hope, it was the winter "
              "of despair.";
}    // namespace

BOOST_AUTO_TEST_CASE(character_ngrams) {
    std::vector<std::string> const pairs{"HE", "EL", "LL", "LO"};
    BOOST_TEST(ngrams("hello", 2) == pairs, boost::test_tools::per_element());
    std::vector<std::string> const spaced{"A B", " B ", "B C"};
    BOOST_TEST(ngrams("a b c", 3) == spaced, boost::test_tools::per_element());
    BOOST_TEST(ngrams("abc", 4).empty());
    BOOST_CHECK_EQUAL(ngrams("abc", 3).size(), 1U);
}

BOOST_AUTO_TEST_CASE(word_ngrams) {
    std::vector<std::string> const pairs{"the cat", "cat the", "the dog_2"};
    BOOST_TEST(
            ngrams("The cat, the   DOG_2!", 2, true) == pairs, boost::test_tools::per_element());
    std::vector<std::string> const single{"it", "s", "fine"};
    BOOST_TEST(ngrams("It's fine.", 1, true) == single, boost::test_tools::per_element());
    BOOST_TEST(ngrams("one two", 3, true).empty());
}

BOOST_AUTO_TEST_CASE(ngram_size_domain) {
    BOOST_CHECK_THROW(ngrams("hello", 0), invalid_domain);
    BOOST_CHECK_THROW(ngrams("hello", -3, true), invalid_domain);
    BOOST_CHECK_THROW(frequency_analysis("hello", 0), invalid_domain);
}

BOOST_AUTO_TEST_CASE(frequency_table_order_and_shares) {
    frequency_table const table = frequency_analysis("abcab!");
    BOOST_REQUIRE_EQUAL(table.size(), 4U);
    BOOST_CHECK_EQUAL(table[0].gram, "A");
    BOOST_CHECK_EQUAL(table[0].count, 2U);
    BOOST_CHECK_EQUAL(table[1].gram, "B");
    BOOST_CHECK_EQUAL(table[1].count, 2U);
    // Ties keep first-appearance order.
    BOOST_CHECK_EQUAL(table[2].gram, "C");
    BOOST_CHECK_EQUAL(table[3].gram, "!");
    BOOST_CHECK_CLOSE(table[0].percentage, 100.0 / 3.0, 1e-9);
    BOOST_CHECK_CLOSE(table[3].percentage, 100.0 / 6.0, 1e-9);

    double total = 0.0;
    for (auto const& entry : frequency_analysis(dickens, 2)) {
        total += entry.percentage;
    }
    BOOST_CHECK_CLOSE(total, 100.0, 1e-9);
    BOOST_TEST(frequency_analysis("", 1).empty());
}

BOOST_AUTO_TEST_CASE(frequency_of_words) {
    frequency_table const table = frequency_analysis(dickens, 1, true);
    BOOST_REQUIRE(!table.empty());
    BOOST_CHECK_EQUAL(table[0].gram, "it");
    BOOST_CHECK_EQUAL(table[0].count, 10U);
}

BOOST_AUTO_TEST_CASE(repeated_sequences) {
    sequence_offsets const repeats = find_repeated_sequences("ABCXABC", 3, 3);
    BOOST_REQUIRE_EQUAL(repeats.size(), 1U);
    std::vector<size_t> const offsets{0, 4};
    BOOST_TEST(repeats.at("ABC") == offsets, boost::test_tools::per_element());

    sequence_offsets const longer = find_repeated_sequences("abcdabcd", 3, 4);
    BOOST_CHECK_EQUAL(longer.size(), 3U);
    BOOST_TEST(longer.contains("ABC"));
    BOOST_TEST(longer.contains("BCD"));
    BOOST_TEST(longer.contains("ABCD"));
    std::vector<size_t> const bcd{1, 5};
    BOOST_TEST(longer.at("BCD") == bcd, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(repeated_sequences_skip_non_letters) {
    // "B C" repeats but holds a space; "THE" repeats across the punctuation.
    sequence_offsets const repeats = find_repeated_sequences("b c, the b c the", 3, 3);
    BOOST_CHECK_EQUAL(repeats.size(), 1U);
    std::vector<size_t> const the{5, 13};
    BOOST_TEST(repeats.at("THE") == the, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(repeated_sequence_bounds) {
    BOOST_CHECK_THROW(find_repeated_sequences("ABCABC", 0, 3), invalid_domain);
    BOOST_TEST(find_repeated_sequences("ABCABC", 4, 3).empty());
    BOOST_TEST(find_repeated_sequences("AB", 3, 10).empty());
}

BOOST_AUTO_TEST_CASE(coincidence_of_small_texts) {
    BOOST_CHECK_CLOSE(index_of_coincidence("AABBC"), 0.2, 1e-9);
    BOOST_CHECK_CLOSE(index_of_coincidence("a a, b b; c"), 0.2, 1e-9);
    BOOST_CHECK_EQUAL(index_of_coincidence(""), 0.0);
    BOOST_CHECK_EQUAL(index_of_coincidence("A"), 0.0);
    BOOST_CHECK_EQUAL(index_of_coincidence("AB"), 0.0);
    BOOST_CHECK_EQUAL(index_of_coincidence("AA"), 1.0);
}

BOOST_AUTO_TEST_CASE(coincidence_separates_english_from_random) {
    constexpr double english = 0.066;
    constexpr double random  = 1.0 / 26.0;

    double const plain = index_of_coincidence(dickens);
    BOOST_TEST(std::abs(plain - english) < std::abs(plain - random));

    std::string uniform;
    for (int round = 0; round < 10; round++) {
        uniform += "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    }
    double const flat = index_of_coincidence(uniform);
    BOOST_TEST(std::abs(flat - random) < std::abs(flat - english));
    BOOST_CHECK_CLOSE(flat, 2340.0 / 67340.0, 1e-9);

    // A long key flattens the letter distribution.
    std::string const cipher = vigenere::encrypt(dickens, {.keyword = "QWERTYUIOPLKJHG"});
    BOOST_TEST(index_of_coincidence(cipher) < plain);
}
