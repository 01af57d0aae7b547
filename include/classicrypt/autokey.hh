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

#ifndef LIB_AUTOKEY_HH
#define LIB_AUTOKEY_HH

#include <classicrypt/basic_cipher.hh>

#include <iosfwd>
#include <string>
#include <string_view>

class autokey;

struct autokey_key {
    using format_t = autokey;

    std::string priming_key;
};

using basic_autokey = basic_cipher<autokey, autokey_key>;

/*
 * Vigenere variant whose key is the priming key followed by the plaintext
 * itself. Every character of the text, letter or not, takes one key slot;
 * a slot holding a non-letter shifts by 0. Decryption reads the key slots
 * past the priming key from its own output, one character at a time.
 */
class autokey : public basic_autokey {
public:
    using basic_autokey::decrypt;
    using basic_autokey::encrypt;

    static std::string encrypt(std::string_view text, autokey_key const& key);
    static std::string decrypt(std::string_view text, autokey_key const& key);
};

#endif    // LIB_AUTOKEY_HH
