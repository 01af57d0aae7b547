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

#define BOOST_TEST_MODULE key_stream
#include "classicrypt/cipher_error.hh"
#include "classicrypt/key_stream.hh"

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(repeating_stream_cycles_keyword) {
    repeating_key_stream keys("KEY");
    BOOST_CHECK_EQUAL(keys.period(), 3U);
    BOOST_CHECK_EQUAL(keys.next(), 10);
    BOOST_CHECK_EQUAL(keys.next(), 4);
    BOOST_CHECK_EQUAL(keys.next(), 24);
    BOOST_CHECK_EQUAL(keys.next(), 10);
    BOOST_CHECK_EQUAL(keys.next(), 4);
}

BOOST_AUTO_TEST_CASE(repeating_stream_is_case_blind) {
    repeating_key_stream upper("Lemon");
    repeating_key_stream lower("LEMON");
    for (int ii = 0; ii < 7; ii++) {
        BOOST_CHECK_EQUAL(upper.next(), lower.next());
    }
}

BOOST_AUTO_TEST_CASE(repeating_stream_non_letters_shift_nothing) {
    repeating_key_stream keys("B-1");
    BOOST_CHECK_EQUAL(keys.next(), 1);
    BOOST_CHECK_EQUAL(keys.next(), 0);
    BOOST_CHECK_EQUAL(keys.next(), 0);
}

BOOST_AUTO_TEST_CASE(repeating_stream_rejects_empty_keyword) {
    BOOST_CHECK_THROW(repeating_key_stream(""), invalid_key);
}

BOOST_AUTO_TEST_CASE(progressive_stream_counts_up) {
    progressive_key_stream shifts(5);
    BOOST_CHECK_EQUAL(shifts.next(), 5);
    BOOST_CHECK_EQUAL(shifts.next(), 6);
    BOOST_CHECK_EQUAL(shifts.next(), 7);
}

BOOST_AUTO_TEST_CASE(autokey_stream_switches_to_source) {
    autokey_key_stream const keys("KEY");
    BOOST_CHECK_EQUAL(keys.priming_length(), 3U);
    BOOST_CHECK_EQUAL(keys.at(0, "HELLO"), 10);
    BOOST_CHECK_EQUAL(keys.at(2, "HELLO"), 24);
    // Past the priming key the stream reads the source, three behind.
    BOOST_CHECK_EQUAL(keys.at(3, "HELLO"), 7);
    BOOST_CHECK_EQUAL(keys.at(4, "HELLO"), 4);
    BOOST_CHECK_EQUAL(keys.at(5, "HE LO"), 0);
}

BOOST_AUTO_TEST_CASE(autokey_stream_rejects_empty_priming_key) {
    BOOST_CHECK_THROW(autokey_key_stream(""), invalid_key);
}
