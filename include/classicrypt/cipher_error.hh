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

#ifndef LIB_CIPHER_ERROR_HH
#define LIB_CIPHER_ERROR_HH

#include <stdexcept>
#include <string>

// Base of every error thrown by the library.
class cipher_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The key cannot be used: an affine multiplier or Hill matrix that is not
// invertible modulo 26, or an empty keyword.
class invalid_key : public cipher_error {
public:
    using cipher_error::cipher_error;
};

// A size or shape parameter is out of range, or the input does not fit the
// grid or block size implied by the key.
class invalid_parameter : public cipher_error {
public:
    using cipher_error::cipher_error;
};

// Analysis requested outside of its domain (n-gram size below 1).
class invalid_domain : public cipher_error {
public:
    using cipher_error::cipher_error;
};

#endif    // LIB_CIPHER_ERROR_HH
