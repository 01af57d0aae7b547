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

#ifndef LIB_OPTIONS_LIB_HH
#define LIB_OPTIONS_LIB_HH

#include "classicrypt/cipher_error.hh"
#include "classicrypt/transposition_grid.hh"

#include <getopt.h>

#include <array>
#include <charconv>
#include <concepts>    // IWYU pragma: keep
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iostream>
#include <iterator>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

template <auto* long_options>
requires requires(decltype(long_options) opt) {
    { opt->size() } -> std::same_as<size_t>;
    { opt->data() } -> std::same_as<option const*>;
}
consteval inline auto make_short_options() {
    static_assert(long_options->back().name == nullptr);
    constexpr auto const result = [&]() consteval noexcept {
        std::array<char, 3U * (long_options->size() - 1U)> intermediate{};

        size_t length = 0;
        for (auto const& opt : *long_options) {
            if (opt.name == nullptr) {
                break;
            }
            char const val = static_cast<char>(opt.val);
            if (val == '\0') {
                // Allow options without a short form.
                continue;
            }
            intermediate[length++] = val;
            switch (opt.has_arg) {
            case no_argument:
                break;
            case optional_argument:
                intermediate[length++] = ':';
                intermediate[length++] = ':';
                break;
            case required_argument:
                intermediate[length++] = ':';
                break;
            }
        }
        return std::pair{intermediate, length};
    }();
    auto const to_init = [&]<size_t... Is>(std::index_sequence<Is...>) {
        return std::array{result.first[Is]..., '\0'};
    };
    return to_init(std::make_index_sequence<result.second>());
}

namespace detail {
    [[noreturn]] inline void print_error(
            std::errc error, std::string const& parameter, char const* value) {
        if (error == std::errc::invalid_argument) {
            std::cerr << "Invalid value '" << value << "' given for '" << parameter
                      << "' parameter!\n";
        } else if (error == std::errc::result_out_of_range) {
            std::cerr << "The value '" << value << "' given for '" << parameter
                      << "' parameter is out of range!\n";
        } else {
            std::cerr << "Unknown error happened when parsing value '" << value
                      << "' given for '" << parameter << "' parameter!\n";
        }
        throw 5;
    }

    template <typename options_t>
    concept has_shift = requires(options_t opt) {
        { opt.shift } -> std::same_as<int64_t&>;
    };
    template <typename options_t>
    concept has_multiplier = requires(options_t opt) {
        { opt.multiplier } -> std::same_as<int64_t&>;
    };
    template <typename options_t>
    concept has_increment = requires(options_t opt) {
        { opt.increment } -> std::same_as<int64_t&>;
    };
    template <typename options_t>
    concept has_keyword = requires(options_t opt) {
        { opt.keyword } -> std::same_as<std::string&>;
    };
    template <typename options_t>
    concept has_matrix = requires(options_t opt) {
        { opt.matrix } -> std::same_as<std::vector<int64_t>&>;
    };
    template <typename options_t>
    concept has_rails = requires(options_t opt) {
        { opt.rails } -> std::same_as<int64_t&>;
    };
    template <typename options_t>
    concept has_grid = requires(options_t opt) {
        { opt.rows } -> std::same_as<int64_t&>;
        { opt.cols } -> std::same_as<int64_t&>;
        { opt.pattern } -> std::same_as<route_pattern&>;
    };
    template <typename options_t>
    concept has_padding = requires(options_t opt) {
        { opt.padding } -> std::same_as<size_t&>;
    };
    template <typename options_t>
    concept has_print_padding = requires(options_t opt) {
        { opt.print_padding } -> std::same_as<bool&>;
    };

    template <typename value_t>
    inline void parse_number(value_t& value, char const* parameter, char const* text) {
        std::string_view const input(text);
        auto [ptr, ec] = std::from_chars(input.data(), input.data() + input.size(), value);
        if (ec == std::errc{} && ptr != input.data() + input.size()) {
            ec = std::errc::invalid_argument;
        }
        if (ec != std::errc{}) {
            print_error(ec, parameter, text);
        }
    }

    // Comma-separated integers, e.g. "2,1,3,4".
    inline void parse_number_list(
            std::vector<int64_t>& values, char const* parameter, char const* text) {
        values.clear();
        std::string_view input(text);
        while (true) {
            size_t const      comma = input.find(',');
            std::string const field(input.substr(0, comma));
            int64_t           value = 0;
            parse_number(value, parameter, field.c_str());
            values.push_back(value);
            if (comma == std::string_view::npos) {
                break;
            }
            input.remove_prefix(comma + 1);
        }
    }

    template <typename options_t>
    inline void parse_shift(options_t& options, char const* parameter) {
        if constexpr (has_shift<options_t>) {
            parse_number(options.shift, "shift", parameter);
        }
    }

    template <typename options_t>
    inline void parse_multiplier(options_t& options, char const* parameter) {
        if constexpr (has_multiplier<options_t>) {
            parse_number(options.multiplier, "multiplier", parameter);
        }
    }

    template <typename options_t>
    inline void parse_increment(options_t& options, char const* parameter) {
        if constexpr (has_increment<options_t>) {
            parse_number(options.increment, "increment", parameter);
        }
    }

    template <typename options_t>
    inline void parse_keyword(options_t& options, char const* parameter) {
        if constexpr (has_keyword<options_t>) {
            options.keyword = parameter;
        }
    }

    template <typename options_t>
    inline void parse_matrix(options_t& options, char const* parameter) {
        if constexpr (has_matrix<options_t>) {
            parse_number_list(options.matrix, "matrix", parameter);
        }
    }

    template <typename options_t>
    inline void parse_rails(options_t& options, char const* parameter) {
        if constexpr (has_rails<options_t>) {
            parse_number(options.rails, "rails", parameter);
        }
    }

    template <typename options_t>
    inline void parse_rows(options_t& options, char const* parameter) {
        if constexpr (has_grid<options_t>) {
            parse_number(options.rows, "rows", parameter);
        }
    }

    template <typename options_t>
    inline void parse_cols(options_t& options, char const* parameter) {
        if constexpr (has_grid<options_t>) {
            parse_number(options.cols, "cols", parameter);
        }
    }

    template <typename options_t>
    inline void parse_pattern(options_t& options, char const* parameter) {
        if constexpr (has_grid<options_t>) {
            try {
                options.pattern = parse_route_pattern(parameter);
            } catch (invalid_parameter const& error) {
                std::cerr << "Invalid value '" << parameter
                          << "' given for 'pattern' parameter: " << error.what() << '\n';
                throw 5;
            }
        }
    }

    template <typename options_t>
    inline void parse_padding(options_t& options, char const* parameter) {
        if constexpr (has_padding<options_t>) {
            parse_number(options.padding, "padding", parameter);
        }
    }

    template <typename options_t>
    inline void parse_print_padding(options_t& options) {
        if constexpr (has_print_padding<options_t>) {
            options.print_padding = true;
        }
    }

    inline bool read_file(std::filesystem::path const& infile, std::string& text) {
        std::ifstream input(infile, std::ios::in | std::ios::binary);
        if (!input.good()) {
            std::cerr << "Input file '" << infile << "' could not be opened.\n\n";
            return false;
        }
        std::stringstream buffer(std::ios::in | std::ios::out | std::ios::binary);
        buffer << input.rdbuf();
        text = buffer.str();
        return true;
    }

    template <typename options_t>
    inline int encrypt_file(
            std::filesystem::path& infile, std::filesystem::path& outfile,
            options_t const& options) {
        std::string text;
        if (!read_file(infile, text)) {
            return 2;
        }
        auto const        key    = options.get_key();
        std::string const result = options_t::format_t::encrypt(text, key);
        std::ofstream     output(outfile, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!output.good()) {
            std::cerr << "Output file '" << outfile << "' could not be opened.\n\n";
            return 3;
        }
        output.write(result.data(), std::ssize(result));
        output.flush();
        if (!output.good()) {
            std::cerr << "Output file '" << outfile << "' could not be written.\n\n";
            return 3;
        }
        if constexpr (has_print_padding<options_t>) {
            if (options.print_padding) {
                std::cout << options_t::format_t::padding_for(text, key) << std::endl;
            }
        }
        return 0;
    }

    template <typename options_t>
    inline int decrypt_file(
            std::filesystem::path& infile, std::filesystem::path& outfile,
            options_t const& options) {
        std::ifstream input(infile, std::ios::in | std::ios::binary);
        if (!input.good()) {
            std::cerr << "Input file '" << infile << "' could not be opened.\n\n";
            return 2;
        }
        // Build the key before touching the output file.
        auto const    key = options.get_key();
        std::ofstream output(outfile, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!output.good()) {
            std::cerr << "Output file '" << outfile << "' could not be opened.\n\n";
            return 3;
        }
        size_t padding = 0;
        if constexpr (has_padding<options_t>) {
            padding = options.padding;
        }
        if (!options_t::format_t::decrypt(input, output, key, padding) || !output.flush()) {
            std::cerr << "Output file '" << outfile << "' could not be written.\n\n";
            return 3;
        }
        return 0;
    }

    template <typename options_t>
    inline void command_argument_parser(options_t& options) {
        options.program = options.arguments.front();
        int const count = static_cast<int>(std::ssize(options.arguments));
        while (true) {
            int       option_index = 0;
            int const option_char  = getopt_long(
                    count, options.arguments.data(), options_t::short_options.data(),
                    options_t::long_options.data(), &option_index);
            if (option_char == -1) {
                break;
            }

            switch (option_char) {
            case 'd':
                options.decrypt = true;
                break;
            case 's':
                parse_shift(options, optarg);
                break;
            case 'a':
                parse_multiplier(options, optarg);
                break;
            case 'b':
                parse_increment(options, optarg);
                break;
            case 'k':
                parse_keyword(options, optarg);
                break;
            case 'm':
                parse_matrix(options, optarg);
                break;
            case 'r':
                parse_rails(options, optarg);
                break;
            case 'R':
                parse_rows(options, optarg);
                break;
            case 'C':
                parse_cols(options, optarg);
                break;
            case 'p':
                parse_pattern(options, optarg);
                break;
            case 'P':
                parse_padding(options, optarg);
                break;
            case 'i':
                parse_print_padding(options);
                break;
            default:
                break;
            }
        }
        options.positional = options.arguments.subspan(static_cast<size_t>(optind));
    }

    template <typename options_t>
    int print_usage(options_t const& options, std::ostream& out) {
        using namespace std::string_view_literals;
        auto const program = options.program.filename().string();
        out << "Usage: " << program << " [-d|--decrypt]"sv;
        if constexpr (has_shift<options_t>) {
            out << " -s|--shift={shift}"sv;
        }
        if constexpr (has_multiplier<options_t>) {
            out << " -a|--multiplier={a}"sv;
        }
        if constexpr (has_increment<options_t>) {
            out << " -b|--increment={b}"sv;
        }
        if constexpr (has_keyword<options_t>) {
            out << " -k|--key={keyword}"sv;
        }
        if constexpr (has_matrix<options_t>) {
            out << " -m|--matrix={a,b,...}"sv;
        }
        if constexpr (has_rails<options_t>) {
            out << " -r|--rails={rails}"sv;
        }
        if constexpr (has_grid<options_t>) {
            out << " -R|--rows={rows} -C|--cols={cols} [-p|--pattern={pattern}]"sv;
        }
        if constexpr (has_padding<options_t>) {
            out << " [-P|--padding={count}]"sv;
        }
        if constexpr (has_print_padding<options_t>) {
            out << " [-i|--info]"sv;
        }
        out << " {input_filename} {output_filename}\n"sv;
        out << "    Encrypts {input_filename} into {output_filename}.\n"sv;
        out << "        -d,--decrypt    Decrypt {input_filename} instead.\n"sv;
        if constexpr (has_matrix<options_t>) {
            out << "        -m,--matrix     Key matrix in row-major order; needs a square number of values.\n"sv;
        }
        if constexpr (has_grid<options_t>) {
            out << "        -p,--pattern    One of spiral_in (default), spiral_out, snake, diagonal.\n"sv;
        }
        if constexpr (has_padding<options_t>) {
            out << "        -P,--padding    Requires -d|--decrypt. Drops {count} trailing pad characters.\n"sv;
        }
        if constexpr (has_print_padding<options_t>) {
            out << "        -i,--info       Print the number of pad characters added by encryption.\n"sv;
        }
        return 1;
    }
}    // namespace detail

template <typename options_t>
inline int auto_encrypter_decrypter(options_t options) {
    try {
        detail::command_argument_parser(options);
        if (options.positional.size() != 2) {
            detail::print_usage(options, std::cout);
            return 1;
        }
        if constexpr (detail::has_print_padding<options_t>) {
            if (options.print_padding && options.decrypt) {
                std::cerr << "Error: --info can't be used with --decrypt.\n\n";
                return 4;
            }
        }
        if constexpr (detail::has_padding<options_t>) {
            if (options.padding != 0 && !options.decrypt) {
                std::cerr << "Error: --padding requires --decrypt.\n\n";
                return 4;
            }
        }

        std::filesystem::path infile{options.positional.front()};
        std::filesystem::path outfile{options.positional.back()};

        if (options.decrypt) {
            return detail::decrypt_file(infile, outfile, options);
        }
        return detail::encrypt_file(infile, outfile, options);
    } catch (cipher_error const& error) {
        std::cerr << "Error: " << error.what() << "\n\n";
        return 6;
    } catch (int error) {
        return error;
    }
}

#endif    // LIB_OPTIONS_LIB_HH
