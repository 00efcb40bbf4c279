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

#include "value.h"
#include <sstream>

namespace keep {

    const char* valueTypeToString(ValueType t) {
        switch (t) {
        case ValueType::Null:   return "null";
        case ValueType::Int:    return "int";
        case ValueType::Double: return "double";
        case ValueType::Bool:   return "bool";
        case ValueType::String: return "string";
        case ValueType::Bytes:  return "bytes";
        case ValueType::List:   return "list";
        case ValueType::Map:    return "map";
        }
        return "unknown";
    }

    ValueType valueTypeFromByte(uint8_t b) {
        if (b > static_cast<uint8_t>(ValueType::Map)) {
            return ValueType::Null;
        }
        return static_cast<ValueType>(b);
    }

    ValueType Value::type() const {
        switch (data_.index()) {
        case 1: return ValueType::Int;
        case 2: return ValueType::Double;
        case 3: return ValueType::Bool;
        case 4: return ValueType::String;
        case 5: return ValueType::Bytes;
        case 6: return ValueType::List;
        case 7: return ValueType::Map;
        default: return ValueType::Null;
        }
    }

    double Value::as_number() const {
        if (is_int()) {
            return static_cast<double>(as_int());
        }
        return as_double();
    }

    const Value* Value::find(const std::string& key) const {
        const Map* m = std::get_if<Map>(&data_);
        if (!m) {
            return nullptr;
        }
        auto it = m->find(key);
        return it == m->end() ? nullptr : &it->second;
    }

    static void render(std::ostringstream& os, const Value& v) {
        switch (v.type()) {
        case ValueType::Null:
            os << "null";
            break;
        case ValueType::Int:
            os << v.as_int();
            break;
        case ValueType::Double:
            os << v.as_double();
            break;
        case ValueType::Bool:
            os << (v.as_bool() ? "true" : "false");
            break;
        case ValueType::String:
            os << '"' << v.as_string() << '"';
            break;
        case ValueType::Bytes:
            os << "<" << v.as_bytes().size() << " bytes>";
            break;
        case ValueType::List: {
            os << '[';
            bool first = true;
            for (const auto& item : v.as_list()) {
                if (!first) os << ',';
                first = false;
                render(os, item);
            }
            os << ']';
            break;
        }
        case ValueType::Map: {
            os << '{';
            bool first = true;
            for (const auto& kv : v.as_map()) {
                if (!first) os << ',';
                first = false;
                os << '"' << kv.first << "\":";
                render(os, kv.second);
            }
            os << '}';
            break;
        }
        }
    }

    std::string Value::to_string() const {
        std::ostringstream os;
        render(os, *this);
        return os.str();
    }

} // namespace keep
