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

#include "json_value.h"
#include "../util/log.h"

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

#include <cmath>

namespace keep {

    using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

    static void write_value(JsonWriter& writer, const Value& value) {
        switch (value.type()) {
        case ValueType::Null:
            writer.Null();
            break;
        case ValueType::Int:
            writer.Int64(value.as_int());
            break;
        case ValueType::Double:
            if (std::isfinite(value.as_double())) {
                writer.Double(value.as_double());
            } else {
                writer.Null();
            }
            break;
        case ValueType::Bool:
            writer.Bool(value.as_bool());
            break;
        case ValueType::String: {
            const std::string& s = value.as_string();
            writer.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
            break;
        }
        case ValueType::Bytes:
            writer.StartArray();
            for (uint8_t b : value.as_bytes()) {
                writer.Uint(b);
            }
            writer.EndArray();
            break;
        case ValueType::List:
            writer.StartArray();
            for (const auto& item : value.as_list()) {
                write_value(writer, item);
            }
            writer.EndArray();
            break;
        case ValueType::Map:
            writer.StartObject();
            for (const auto& kv : value.as_map()) {
                writer.Key(kv.first.data(), static_cast<rapidjson::SizeType>(kv.first.size()));
                write_value(writer, kv.second);
            }
            writer.EndObject();
            break;
        }
    }

    std::string value_to_json(const Value& value) {
        rapidjson::StringBuffer buffer;
        JsonWriter writer(buffer);
        write_value(writer, value);
        return std::string(buffer.GetString(), buffer.GetSize());
    }

    static Value read_value(const rapidjson::Value& json) {
        if (json.IsNull()) {
            return Value();
        }
        if (json.IsBool()) {
            return Value(json.GetBool());
        }
        if (json.IsInt64()) {
            return Value(static_cast<long long>(json.GetInt64()));
        }
        if (json.IsNumber()) {
            // uint64 beyond int64 range falls through to double
            return Value(json.GetDouble());
        }
        if (json.IsString()) {
            return Value(std::string(json.GetString(), json.GetStringLength()));
        }
        if (json.IsArray()) {
            Value::List list;
            list.reserve(json.Size());
            for (rapidjson::SizeType i = 0; i < json.Size(); i++) {
                list.push_back(read_value(json[i]));
            }
            return Value(std::move(list));
        }
        Value::Map map;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            map[std::string(it->name.GetString(), it->name.GetStringLength())] = read_value(it->value);
        }
        return Value(std::move(map));
    }

    std::optional<Value> value_from_json(const std::string& json) {
        rapidjson::Document doc;
        doc.Parse(json.data(), json.size());

        if (doc.HasParseError()) {
            debug() << "JSON parse error at offset " << doc.GetErrorOffset()
                    << ": " << rapidjson::GetParseError_En(doc.GetParseError());
            return std::nullopt;
        }
        return read_value(doc);
    }

    Value bytes_from_int_list(const Value& value) {
        if (!value.is_list()) {
            return value;
        }
        Value::Bytes bytes;
        bytes.reserve(value.as_list().size());
        for (const auto& item : value.as_list()) {
            if (!item.is_int() || item.as_int() < 0 || item.as_int() > 255) {
                return value;
            }
            bytes.push_back(static_cast<uint8_t>(item.as_int()));
        }
        return Value(std::move(bytes));
    }

} // namespace keep
