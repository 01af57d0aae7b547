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

#include "classicrypt/hill.hh"
#include "classicrypt/options_lib.hh"

struct options_t {
    explicit options_t(std::span<char*> args) : arguments(args) {}

    // Throws invalid_key unless matrix holds a square number of values.
    [[nodiscard]] hill_key get_key() const {
        return {.matrix = square_matrix::from_values(matrix)};
    }

    constexpr static inline std::array const long_options{
            option{"decrypt",       no_argument, nullptr, 'd'},
            option{ "matrix", required_argument, nullptr, 'm'},
            option{"padding", required_argument, nullptr, 'P'},
            option{   "info",       no_argument, nullptr, 'i'},
            option{  nullptr,                 0, nullptr,   0}
    };

    constexpr static inline auto short_options = make_short_options<&long_options>();

    std::filesystem::path program;
    std::span<char*>      arguments;
    std::span<char*>      positional;

    std::vector<int64_t> matrix;
    size_t               padding       = 0;
    bool                 decrypt       = false;
    bool                 print_padding = false;

    using format_t = hill;
};

int main(int argc, char* argv[]) {
    return auto_encrypter_decrypter(options_t({argv, static_cast<size_t>(argc)}));
}
