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

#include "codec.h"
#include "json_value.h"

namespace keep {

    void CodecV1::encode_payload(const Value& value, ByteBuffer& out) const {
        std::string json = value_to_json(value);
        out.insert(out.end(), json.begin(), json.end());
    }

    std::optional<Value> CodecV1::decode_payload(const uint8_t* data, size_t size,
                                                 ValueType declared) const {
        std::optional<Value> value =
            value_from_json(std::string(reinterpret_cast<const char*>(data), size));
        if (value && declared == ValueType::Bytes) {
            return bytes_from_int_list(*value);
        }
        return value;
    }

} // namespace keep
