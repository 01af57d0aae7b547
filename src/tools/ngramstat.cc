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
#include "classicrypt/options_lib.hh"

#include <boost/io/ios_state.hpp>

#include <getopt.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
    constexpr std::array const long_options{
            option{ "size", required_argument, nullptr, 'n'},
            option{"words",       no_argument, nullptr, 'w'},
            option{  "min", required_argument, nullptr, 'l'},
            option{  "max", required_argument, nullptr, 'L'},
            option{nullptr,                 0, nullptr,   0}
    };

    constexpr auto const short_options = make_short_options<&long_options>();
}    // namespace

static void usage(char* prog) {
    std::cerr << "Usage: " << prog
              << " [-n|--size={n}] [-w|--words] [-l|--min={min}] [-L|--max={max}] "
                 "{input_filename}"
              << std::endl;
    std::cerr << std::endl;
    std::cerr << "\t-n,--size \tLength of the n-grams to count (default 1)." << std::endl;
    std::cerr << "\t-w,--words\tCount word n-grams instead of character n-grams."
              << std::endl;
    std::cerr << "\t-l,--min  \tShortest repeated letter sequence to report (default 3)."
              << std::endl;
    std::cerr << "\t-L,--max  \tLongest repeated letter sequence to report (default 10)."
              << std::endl;
}

static void print_frequencies(frequency_table const& table) {
    boost::io::ios_all_saver const flags(std::cout);
    std::cout << "Frequencies:" << std::endl;
    for (auto const& [gram, count, percentage] : table) {
        std::cout << '\t' << std::quoted(gram) << '\t' << count << '\t' << std::fixed
                  << std::setprecision(2) << percentage << '%' << std::endl;
    }
}

static void print_repeats(sequence_offsets const& repeats) {
    std::cout << "Repeated sequences:" << std::endl;
    for (auto const& [sequence, offsets] : repeats) {
        std::cout << '\t' << sequence << '\t';
        char const* separator = "";
        for (auto const offset : offsets) {
            std::cout << separator << offset;
            separator = ",";
        }
        std::cout << "\tdistances ";
        separator = "";
        for (size_t ii = 1; ii < offsets.size(); ii++) {
            std::cout << separator << offsets[ii] - offsets[ii - 1];
            separator = ",";
        }
        std::cout << std::endl;
    }
}

static void print_coincidence(double const value) {
    boost::io::ios_all_saver const flags(std::cout);
    std::cout << "Index of coincidence: " << std::fixed << std::setprecision(4) << value
              << std::endl;
}

int main(int argc, char* argv[]) {
    int64_t size       = 1;
    int64_t min_length = 3;
    int64_t max_length = 10;
    bool    words      = false;

    try {
        while (true) {
            int       option_index = 0;
            int const option_char  = getopt_long(
                    argc, argv, short_options.data(), long_options.data(), &option_index);
            if (option_char == -1) {
                break;
            }

            switch (option_char) {
            case 'n':
                detail::parse_number(size, "size", optarg);
                break;
            case 'w':
                words = true;
                break;
            case 'l':
                detail::parse_number(min_length, "min", optarg);
                break;
            case 'L':
                detail::parse_number(max_length, "max", optarg);
                break;
            default:
                break;
            }
        }

        if (argc - optind < 1) {
            usage(argv[0]);
            return 1;
        }

        std::string text;
        if (!detail::read_file(argv[optind], text)) {
            return 2;
        }

        print_frequencies(frequency_analysis(text, size, words));
        print_repeats(find_repeated_sequences(text, min_length, max_length));
        print_coincidence(index_of_coincidence(text));
    } catch (cipher_error const& error) {
        std::cerr << "Error: " << error.what() << std::endl << std::endl;
        return 6;
    } catch (int error) {
        return error;
    }
    return 0;
}
