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

#define BOOST_TEST_MODULE ciphers
#include "classicrypt/affine.hh"
#include "classicrypt/alphabet.hh"
#include "classicrypt/atbash.hh"
#include "classicrypt/august.hh"
#include "classicrypt/autokey.hh"
#include "classicrypt/beaufort.hh"
#include "classicrypt/caesar.hh"
#include "classicrypt/cipher_error.hh"
#include "classicrypt/hill.hh"
#include "classicrypt/myszkowski.hh"
#include "classicrypt/rail_fence.hh"
#include "classicrypt/route.hh"
#include "classicrypt/vigenere.hh"

#include <boost/test/unit_test.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace {
    constexpr char const* const sample = "The quick brown Fox, 1 jumps over the lazy dog!";

    // Same length, and every non-letter in the same place.
    bool same_shape(std::string const& left, std::string const& right) {
        if (left.size() != right.size()) {
            return false;
        }
        for (size_t ii = 0; ii < left.size(); ii++) {
            if (is_letter(left[ii]) != is_letter(right[ii])) {
                return false;
            }
            if (!is_letter(left[ii]) && left[ii] != right[ii]) {
                return false;
            }
            if (is_upper_letter(left[ii]) != is_upper_letter(right[ii])) {
                return false;
            }
        }
        return true;
    }
}    // namespace

BOOST_AUTO_TEST_SUITE(substitution)

BOOST_AUTO_TEST_CASE(caesar_vectors) {
    BOOST_CHECK_EQUAL(caesar::encrypt("HELLO", {.shift = 3}), "KHOOR");
    BOOST_CHECK_EQUAL(caesar::decrypt("KHOOR", {.shift = 3}), "HELLO");
    BOOST_CHECK_EQUAL(caesar::encrypt("xyz", {.shift = 3}), "abc");
    BOOST_CHECK_EQUAL(caesar::encrypt("HELLO", {.shift = -23}), "KHOOR");
    BOOST_CHECK_EQUAL(caesar::encrypt("HELLO", {.shift = 29}), "KHOOR");
}

BOOST_AUTO_TEST_CASE(caesar_round_trip) {
    for (int64_t const shift : {0, 1, 13, 25, 26, -7, 1000}) {
        caesar_key const  key{.shift = shift};
        std::string const cipher = caesar::encrypt(sample, key);
        BOOST_TEST(same_shape(cipher, sample));
        BOOST_CHECK_EQUAL(caesar::decrypt(cipher, key), sample);
    }
}

BOOST_AUTO_TEST_CASE(affine_vectors) {
    affine_key const key{.a = 5, .b = 8};
    BOOST_CHECK_EQUAL(affine::encrypt("HELLO WORLD", key), "RCLLA OAPLX");
    BOOST_CHECK_EQUAL(affine::decrypt("RCLLA OAPLX", key), "HELLO WORLD");
    BOOST_CHECK_EQUAL(affine::decrypt(affine::encrypt(sample, key), key), sample);
}

BOOST_AUTO_TEST_CASE(affine_needs_unit_multiplier) {
    BOOST_CHECK_THROW(affine::encrypt("HELLO", {.a = 2, .b = 1}), invalid_key);
    BOOST_CHECK_THROW(affine::decrypt("HELLO", {.a = 13, .b = 0}), invalid_key);
    BOOST_CHECK_THROW(affine::encrypt("HELLO", {.a = 0, .b = 0}), invalid_key);
    for (int64_t const mult : {1, 3, 5, 7, 9, 11, 15, 17, 19, 21, 23, 25, -3}) {
        affine_key const key{.a = mult, .b = 11};
        BOOST_CHECK_EQUAL(affine::decrypt(affine::encrypt(sample, key), key), sample);
    }
}

BOOST_AUTO_TEST_CASE(atbash_is_self_inverse) {
    BOOST_CHECK_EQUAL(atbash::encrypt("HELLO", {}), "SVOOL");
    BOOST_CHECK_EQUAL(atbash::encrypt("abc xyz", {}), "zyx cba");
    BOOST_CHECK_EQUAL(atbash::encrypt(atbash::encrypt(sample, {}), {}), sample);
    BOOST_CHECK_EQUAL(atbash::decrypt("SVOOL", {}), "HELLO");
}

BOOST_AUTO_TEST_CASE(august_shift_grows_per_letter) {
    BOOST_CHECK_EQUAL(august::encrypt("HELLO", {.initial_shift = 1}), "IGOPT");
    // Punctuation does not advance the shift.
    BOOST_CHECK_EQUAL(august::encrypt("HE, LLO", {.initial_shift = 1}), "IG, OPT");
    BOOST_CHECK_EQUAL(august::decrypt("IGOPT", {.initial_shift = 1}), "HELLO");
    BOOST_CHECK_EQUAL(august::encrypt("AAA", {.initial_shift = 0}), "ABC");
    august_key const key{.initial_shift = 25};
    BOOST_CHECK_EQUAL(august::decrypt(august::encrypt(sample, key), key), sample);
}

BOOST_AUTO_TEST_CASE(vigenere_vectors) {
    BOOST_CHECK_EQUAL(vigenere::encrypt("HELLO", {.keyword = "KEY"}), "RIJVS");
    BOOST_CHECK_EQUAL(vigenere::decrypt("RIJVS", {.keyword = "KEY"}), "HELLO");
    BOOST_CHECK_EQUAL(
            vigenere::encrypt("ATTACKATDAWN", {.keyword = "LEMON"}), "LXFOPVEFRNHR");
    // Spaces keep their place and do not consume key letters.
    BOOST_CHECK_EQUAL(vigenere::encrypt("Hel lo", {.keyword = "key"}), "Rij vs");
    vigenere_key const key{.keyword = "Lemon"};
    std::string const  cipher = vigenere::encrypt(sample, key);
    BOOST_TEST(same_shape(cipher, sample));
    BOOST_CHECK_EQUAL(vigenere::decrypt(cipher, key), sample);
    BOOST_CHECK_THROW(vigenere::encrypt("HELLO", {.keyword = ""}), invalid_key);
}

BOOST_AUTO_TEST_CASE(beaufort_vectors) {
    beaufort_key const key{.keyword = "FORTIFICATION"};
    BOOST_CHECK_EQUAL(
            beaufort::encrypt("DEFENDTHEEASTWALLOFTHECASTLE", key),
            "CKMPVCPVWPIWUJOGIUAPVWRIWUUK");
    BOOST_CHECK_EQUAL(
            beaufort::decrypt("CKMPVCPVWPIWUJOGIUAPVWRIWUUK", key),
            "DEFENDTHEEASTWALLOFTHECASTLE");
    for (auto const* keyword : {"A", "KEY", "fortification", "Z9"}) {
        beaufort_key const other{.keyword = keyword};
        BOOST_CHECK_EQUAL(beaufort::encrypt(beaufort::encrypt(sample, other), other), sample);
    }
    BOOST_CHECK_THROW(beaufort::encrypt("HELLO", {.keyword = ""}), invalid_key);
}

BOOST_AUTO_TEST_CASE(autokey_vectors) {
    autokey_key const key{.priming_key = "QUEENLY"};
    BOOST_CHECK_EQUAL(autokey::encrypt("ATTACKATDAWN", key), "QNXEPVYTWTWP");
    BOOST_CHECK_EQUAL(autokey::decrypt("QNXEPVYTWTWP", key), "ATTACKATDAWN");
    // Every character takes a key slot, spaces included.
    BOOST_CHECK_EQUAL(autokey::encrypt("Attack at dawn", key), "Qnxepv am dcgn");
    BOOST_CHECK_EQUAL(autokey::decrypt("Qnxepv am dcgn", key), "Attack at dawn");
    BOOST_CHECK_EQUAL(autokey::decrypt(autokey::encrypt(sample, key), key), sample);
    BOOST_CHECK_THROW(autokey::encrypt("HELLO", {.priming_key = ""}), invalid_key);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(hill_cipher)

BOOST_AUTO_TEST_CASE(hill_2x2) {
    hill_key const    key{.matrix = {{2, 1}, {3, 4}}};
    std::string const cipher = hill::encrypt("HELP", key);
    BOOST_CHECK_EQUAL(cipher.size(), 4U);
    BOOST_CHECK_EQUAL(cipher, "SLLP");
    BOOST_CHECK_EQUAL(hill::decrypt(cipher, key), "HELP");
    BOOST_CHECK_EQUAL(hill::padding_for("HELP", key), 0U);
}

BOOST_AUTO_TEST_CASE(hill_3x3) {
    hill_key const key{
            .matrix = {{6, 24, 1}, {13, 16, 10}, {20, 17, 15}}
    };
    BOOST_CHECK_EQUAL(hill::encrypt("ACT", key), "POH");
    BOOST_CHECK_EQUAL(hill::decrypt("POH", key), "ACT");
}

BOOST_AUTO_TEST_CASE(hill_pads_and_filters) {
    hill_key const key{.matrix = {{2, 1}, {3, 4}}};
    BOOST_CHECK_EQUAL(hill::padding_for("Hi, you", key), 1U);
    std::string const cipher = hill::encrypt("Hi, you", key);
    BOOST_CHECK_EQUAL(cipher.size(), 6U);
    BOOST_CHECK_EQUAL(hill::decrypt(cipher, key), "HIYOUX");
}

BOOST_AUTO_TEST_CASE(hill_reduces_large_entries) {
    // 2^40 + 13 is 3 mod 26.
    constexpr int64_t const big = (int64_t{1} << 40) + 13;
    hill_key const          huge{.matrix = {{big, big - 2}, {big + 1, big + 2}}};
    hill_key const          small{.matrix = {{3, 1}, {4, 5}}};
    BOOST_CHECK_EQUAL(hill::encrypt("HELP", huge), hill::encrypt("HELP", small));
    BOOST_CHECK_EQUAL(hill::decrypt(hill::encrypt("HELP", huge), huge), "HELP");
    constexpr int64_t const low = std::numeric_limits<int64_t>::min() + 13;
    hill_key const          negative{.matrix = {{-23, 1 - 26 * 1000}, {-22, low}}};
    BOOST_CHECK_EQUAL(hill::encrypt("HELP", negative), hill::encrypt("HELP", small));
    // Congruent to {{2, 4}, {1, 2}}, which is singular.
    BOOST_CHECK_THROW(
            hill::encrypt("HELP", {.matrix = {{big - 1, big + 1}, {big - 2, big - 1}}}),
            invalid_key);
}

BOOST_AUTO_TEST_CASE(hill_key_validation) {
    BOOST_CHECK_THROW(hill::encrypt("HELP", {.matrix = {{2, 4}, {1, 2}}}), invalid_key);
    BOOST_CHECK_THROW(hill::encrypt("HELP", {.matrix = {{2, 0}, {0, 1}}}), invalid_key);
    BOOST_CHECK_THROW(hill::encrypt("HELP", hill_key{}), invalid_key);
    BOOST_CHECK_THROW(hill::decrypt("SLL", {.matrix = {{2, 1}, {3, 4}}}), invalid_parameter);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(transposition)

BOOST_AUTO_TEST_CASE(rail_fence_vectors) {
    rail_fence_key const key{.rails = 3};
    BOOST_CHECK_EQUAL(rail_fence::encrypt("Hello, World", key), "HOLELWRDLO");
    BOOST_CHECK_EQUAL(rail_fence::decrypt("HOLELWRDLO", key), "HELLOWORLD");
    BOOST_CHECK_EQUAL(
            rail_fence::encrypt("WEAREDISCOVEREDFLEEATONCE", key),
            "WECRLTEERDSOEEFEAOCAIVDEN");
    for (int64_t rails = 2; rails <= 12; rails++) {
        rail_fence_key const other{.rails = rails};
        BOOST_CHECK_EQUAL(
                rail_fence::decrypt(rail_fence::encrypt(sample, other), other),
                canonical_text(sample));
    }
}

BOOST_AUTO_TEST_CASE(rail_fence_rail_count_is_checked) {
    BOOST_CHECK_THROW(rail_fence::encrypt("HELLO", {.rails = 1}), invalid_parameter);
    BOOST_CHECK_THROW(rail_fence::encrypt("HELLO", {.rails = 0}), invalid_parameter);
    BOOST_CHECK_THROW(rail_fence::encrypt("HI!", {.rails = 3}), invalid_parameter);
    BOOST_CHECK_THROW(rail_fence::decrypt("HELLO", {.rails = -2}), invalid_parameter);
    BOOST_CHECK_EQUAL(rail_fence::encrypt("ABC", {.rails = 3}), "ABC");
}

BOOST_AUTO_TEST_CASE(rail_fence_many_rails_on_long_text) {
    std::string plain;
    for (size_t ii = 0; ii < 200000; ii++) {
        plain.push_back(static_cast<char>('A' + (ii * 7) % 26));
    }
    rail_fence_key const key{.rails = 100000};
    std::string const    cipher = rail_fence::encrypt(plain, key);
    BOOST_CHECK_EQUAL(cipher.size(), plain.size());
    // Rail 0 holds positions 0 and 199998, which sit next to each other.
    BOOST_CHECK_EQUAL(cipher[0], plain[0]);
    BOOST_CHECK_EQUAL(cipher[1], plain[199998]);
    BOOST_TEST(rail_fence::decrypt(cipher, key) == plain);
}

BOOST_AUTO_TEST_CASE(route_vectors) {
    route_key const key{.rows = 3, .cols = 3, .pattern = route_pattern::spiral_in};
    BOOST_CHECK_EQUAL(route::encrypt("abc def ghi", key), "ABCFIHGDE");
    BOOST_CHECK_EQUAL(route::decrypt("ABCFIHGDE", key), "ABCDEFGHI");
    BOOST_CHECK_EQUAL(route::padding_for("abcdefg", key), 2U);
    BOOST_CHECK_EQUAL(route::encrypt("abcdefg", key), "ABCFXXGDE");
    BOOST_CHECK_EQUAL(route::decrypt("ABCFXXGDE", key), "ABCDEFGXX");
}

BOOST_AUTO_TEST_CASE(route_round_trip_every_pattern) {
    std::string const text = canonical_text(sample);
    for (auto const pattern :
         {route_pattern::spiral_in, route_pattern::spiral_out, route_pattern::snake,
          route_pattern::diagonal}) {
        for (auto const [rows, cols] : {std::pair{6, 6}, std::pair{4, 9}, std::pair{9, 4}}) {
            route_key const   key{.rows = rows, .cols = cols, .pattern = pattern};
            std::string const cipher = route::encrypt(sample, key);
            BOOST_CHECK_EQUAL(cipher.size(), static_cast<size_t>(rows * cols));
            std::string plain = route::decrypt(cipher, key);
            plain.resize(plain.size() - route::padding_for(sample, key));
            BOOST_CHECK_EQUAL(plain, text);
        }
    }
}

BOOST_AUTO_TEST_CASE(route_shape_is_checked) {
    BOOST_CHECK_THROW(route::encrypt("ABC", {.rows = 0, .cols = 3}), invalid_parameter);
    BOOST_CHECK_THROW(route::encrypt("ABC", {.rows = 3, .cols = -1}), invalid_parameter);
    BOOST_CHECK_THROW(route::encrypt("ABCDEFGHIJ", {.rows = 3, .cols = 3}), invalid_parameter);
    BOOST_CHECK_THROW(route::decrypt("ABCDEFGH", {.rows = 3, .cols = 3}), invalid_parameter);
}

BOOST_AUTO_TEST_CASE(myszkowski_vectors) {
    myszkowski_key const key{.keyword = "TOMATO"};
    std::string const    plain = "WEAREDISCOVEREDFLEEATONCE";
    BOOST_CHECK_EQUAL(myszkowski::padding_for(plain, key), 5U);
    std::string const cipher = myszkowski::encrypt(plain, key);
    BOOST_CHECK_EQUAL(cipher, "ROFOXACDTXESEAXDEECXWIREEEVLNX");
    BOOST_CHECK_EQUAL(myszkowski::decrypt(cipher, key), plain + "XXXXX");
    BOOST_CHECK_EQUAL(myszkowski::encrypt("abcdef", {.keyword = "bab"}), "BEADCF");
}

BOOST_AUTO_TEST_CASE(myszkowski_validation) {
    BOOST_CHECK_THROW(myszkowski::encrypt("ABC", {.keyword = ""}), invalid_key);
    BOOST_CHECK_THROW(myszkowski::decrypt("ABCDE", {.keyword = "KEY"}), invalid_parameter);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_CASE(stream_front_end) {
    std::istringstream input("Hello, World");
    std::ostringstream output;
    BOOST_TEST(caesar::encrypt(input, output, caesar_key{.shift = 3}));
    BOOST_CHECK_EQUAL(output.str(), "Khoor, Zruog");

    std::istringstream cipher("ROFOXACDTXESEAXDEECXWIREEEVLNX");
    std::ostringstream plain;
    BOOST_TEST(myszkowski::decrypt(cipher, plain, myszkowski_key{.keyword = "TOMATO"}, 5));
    BOOST_CHECK_EQUAL(plain.str(), "WEAREDISCOVEREDFLEEATONCE");
}
