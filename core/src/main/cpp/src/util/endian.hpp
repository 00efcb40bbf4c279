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

#include <cstdint>
#include <cstring>
#include <vector>

namespace keep {
namespace util {

/**
 * Byte order helpers for the on-disk formats.
 *
 * Value payloads are little-endian; the consolidated file's frame lengths
 * are big-endian. Both are written byte by byte so the host order never
 * leaks into a file.
 */

inline void append_le16(std::vector<uint8_t>& out, uint16_t val) {
    out.push_back(static_cast<uint8_t>(val));
    out.push_back(static_cast<uint8_t>(val >> 8));
}

inline void append_le32(std::vector<uint8_t>& out, uint32_t val) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>(val >> shift));
    }
}

inline void append_le64(std::vector<uint8_t>& out, uint64_t val) {
    for (int shift = 0; shift < 64; shift += 8) {
        out.push_back(static_cast<uint8_t>(val >> shift));
    }
}

inline void append_lef64(std::vector<uint8_t>& out, double val) {
    uint64_t bits;
    std::memcpy(&bits, &val, sizeof(double));
    append_le64(out, bits);
}

inline void append_be32(std::vector<uint8_t>& out, uint32_t val) {
    out.push_back(static_cast<uint8_t>(val >> 24));
    out.push_back(static_cast<uint8_t>(val >> 16));
    out.push_back(static_cast<uint8_t>(val >> 8));
    out.push_back(static_cast<uint8_t>(val));
}

inline uint16_t load_le16(const uint8_t* buf) {
    return static_cast<uint16_t>(buf[0]) |
           (static_cast<uint16_t>(buf[1]) << 8);
}

inline uint32_t load_le32(const uint8_t* buf) {
    return static_cast<uint32_t>(buf[0]) |
           (static_cast<uint32_t>(buf[1]) << 8) |
           (static_cast<uint32_t>(buf[2]) << 16) |
           (static_cast<uint32_t>(buf[3]) << 24);
}

inline uint64_t load_le64(const uint8_t* buf) {
    uint64_t val = 0;
    for (int i = 7; i >= 0; --i) {
        val = (val << 8) | buf[i];
    }
    return val;
}

inline double load_lef64(const uint8_t* buf) {
    uint64_t bits = load_le64(buf);
    double val;
    std::memcpy(&val, &bits, sizeof(double));
    return val;
}

inline uint32_t load_be32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24) |
           (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8) |
           static_cast<uint32_t>(buf[3]);
}

} // namespace util
} // namespace keep
