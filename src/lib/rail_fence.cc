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

#include "classicrypt/rail_fence.hh"

#include "classicrypt/alphabet.hh"
#include "classicrypt/cipher_error.hh"
#include "classicrypt/transposition_grid.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

using std::string;
using std::string_view;

class rail_fence_internal {
public:
    static size_t checked_rails(rail_fence_key const& key, size_t const length) {
        if (key.rails < 2) {
            throw invalid_parameter(
                    "rail fence needs at least 2 rails, got " + std::to_string(key.rails));
        }
        if (static_cast<uint64_t>(key.rails) > length) {
            throw invalid_parameter(
                    "rail fence cannot use " + std::to_string(key.rails)
                    + " rails on a text of " + std::to_string(length)
                    + " characters");
        }
        return static_cast<size_t>(key.rails);
    }
};

string rail_fence::encrypt(string_view const text, rail_fence_key const& key) {
    string const canonical = canonical_text(text);
    size_t const length    = canonical.size();
    size_t const rails     = rail_fence_internal::checked_rails(key, length);
    return permute(canonical, rail_fence_permutation(length, rails));
}

string rail_fence::decrypt(string_view const text, rail_fence_key const& key) {
    string const canonical = canonical_text(text);
    size_t const length    = canonical.size();
    size_t const rails     = rail_fence_internal::checked_rails(key, length);
    return unpermute(canonical, rail_fence_permutation(length, rails));
}
