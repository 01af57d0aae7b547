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

#include "classicrypt/autokey.hh"
#include "classicrypt/options_lib.hh"

struct options_t {
    explicit options_t(std::span<char*> args) : arguments(args) {}

    [[nodiscard]] autokey_key get_key() const {
        return {.priming_key = keyword};
    }

    constexpr static inline std::array const long_options{
            option{"decrypt",       no_argument, nullptr, 'd'},
            option{    "key", required_argument, nullptr, 'k'},
            option{  nullptr,                 0, nullptr,   0}
    };

    constexpr static inline auto short_options = make_short_options<&long_options>();

    std::filesystem::path program;
    std::span<char*>      arguments;
    std::span<char*>      positional;

    std::string keyword;
    bool        decrypt = false;

    using format_t = autokey;
};

int main(int argc, char* argv[]) {
    return auto_encrypter_decrypter(options_t({argv, static_cast<size_t>(argc)}));
}
