/*
 * Copyright (C) Flamewing 2025 <flamewing.sonic@gmail.com>
 *
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with main.c; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor Boston, MA 02110-1301,  USA
 */

#ifndef LIB_BASIC_CIPHER_HH
#define LIB_BASIC_CIPHER_HH

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

/*
 * Stream front-end shared by every cipher. Format provides
 *     static std::string encrypt(std::string_view, Key const&);
 *     static std::string decrypt(std::string_view, Key const&);
 * and pulls these overloads in with a using-declaration.
 */
template <typename Format, typename Key>
class basic_cipher {
public:
    using key_type = Key;

    static bool encrypt(std::istream& source, std::ostream& dest, Key const& key);

    // Drops up to padding trailing characters of the result; pass the pad
    // count recorded at encryption time for block ciphers.
    static bool decrypt(
            std::istream& source, std::ostream& dest, Key const& key,
            size_t padding = 0);

private:
    static std::string read_all(std::istream& source);
};

template <typename Format, typename Key>
std::string basic_cipher<Format, Key>::read_all(std::istream& source) {
    auto start = source.tellg();
    source.ignore(std::numeric_limits<std::streamsize>::max());
    auto full_size = static_cast<size_t>(source.gcount());
    source.clear();
    source.seekg(start);
    std::string data(full_size, '\0');
    source.read(data.data(), std::ssize(data));
    return data;
}

template <typename Format, typename Key>
bool basic_cipher<Format, Key>::encrypt(
        std::istream& source, std::ostream& dest, Key const& key) {
    std::string const data   = read_all(source);
    std::string const result = Format::encrypt(data, key);
    dest.write(result.data(), std::ssize(result));
    return dest.good();
}

template <typename Format, typename Key>
bool basic_cipher<Format, Key>::decrypt(
        std::istream& source, std::ostream& dest, Key const& key, size_t const padding) {
    std::string const data   = read_all(source);
    std::string       result = Format::decrypt(data, key);
    result.resize(result.size() - std::min(padding, result.size()));
    dest.write(result.data(), std::ssize(result));
    return dest.good();
}

#endif    // LIB_BASIC_CIPHER_HH
