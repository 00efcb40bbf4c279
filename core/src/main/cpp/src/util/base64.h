/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keep {
namespace util {

/**
 * Padded standard-alphabet base64 over Boost.Archive dataflow iterators.
 */
inline std::string base64_encode(const std::vector<uint8_t>& data) {
    using namespace boost::archive::iterators;
    using It = base64_from_binary<transform_width<std::vector<uint8_t>::const_iterator, 6, 8>>;

    std::string out(It(data.begin()), It(data.end()));
    out.append((3 - data.size() % 3) % 3, '=');
    return out;
}

// nullopt on characters outside the alphabet or a bad length
inline std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    using namespace boost::archive::iterators;
    using It = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    size_t padding = 0;
    while (padding < 2 && padding < text.size() && text[text.size() - 1 - padding] == '=') {
        ++padding;
    }
    std::string body = text;
    for (size_t i = 0; i < body.size() - padding; ++i) {
        char c = body[i];
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!ok) {
            return std::nullopt;
        }
    }
    // Padding decodes as zero bits and is cut off afterwards
    body.replace(body.size() - padding, padding, padding, 'A');

    try {
        std::vector<uint8_t> out(It(body.begin()), It(body.end()));
        out.resize(out.size() - padding);
        return out;
    } catch (const boost::archive::iterators::dataflow_exception&) {
        return std::nullopt;
    }
}

} // namespace util
} // namespace keep
