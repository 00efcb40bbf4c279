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
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "../codec/json_value.h"
#include "../codec/value.h"
#include "../keep_exception.h"

namespace keep {

    /**
     * Default conversion between a key's C++ type and its stored Value.
     * from_value returns nullopt when the stored value does not fit T.
     */
    template <class T, class Enable = void>
    struct ValueTraits;

    template <>
    struct ValueTraits<Value> {
        static Value to_value(const Value& v) { return v; }
        static std::optional<Value> from_value(const Value& v) { return v; }
    };

    template <>
    struct ValueTraits<bool> {
        static Value to_value(bool v) { return Value(v); }
        static std::optional<bool> from_value(const Value& v) {
            if (v.is_bool()) return v.as_bool();
            return std::nullopt;
        }
    };

    // Every integral type except bool, range-checked on the way back
    template <class T>
    struct ValueTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
        static Value to_value(T v) { return Value(static_cast<long long>(v)); }
        static std::optional<T> from_value(const Value& v) {
            if (!v.is_int()) return std::nullopt;
            int64_t i = v.as_int();
            if constexpr (std::is_unsigned_v<T>) {
                if (i < 0 || static_cast<uint64_t>(i) > std::numeric_limits<T>::max()) return std::nullopt;
            } else {
                if (i < std::numeric_limits<T>::min() || i > std::numeric_limits<T>::max()) return std::nullopt;
            }
            return static_cast<T>(i);
        }
    };

    template <>
    struct ValueTraits<double> {
        static Value to_value(double v) { return Value(v); }
        static std::optional<double> from_value(const Value& v) {
            if (v.is_double() || v.is_int()) return v.as_number();
            return std::nullopt;
        }
    };

    template <>
    struct ValueTraits<std::string> {
        static Value to_value(const std::string& v) { return Value(v); }
        static std::optional<std::string> from_value(const Value& v) {
            if (v.is_string()) return v.as_string();
            return std::nullopt;
        }
    };

    // Accepts the integer-list form bytes take inside JSON
    template <>
    struct ValueTraits<Value::Bytes> {
        static Value to_value(const Value::Bytes& v) { return Value(v); }
        static std::optional<Value::Bytes> from_value(const Value& v) {
            Value b = bytes_from_int_list(v);
            if (b.is_bytes()) return b.as_bytes();
            return std::nullopt;
        }
    };

    template <class T>
    struct ValueTraits<std::vector<T>, std::enable_if_t<!std::is_same_v<T, uint8_t>>> {
        static Value to_value(const std::vector<T>& v) {
            Value::List list;
            list.reserve(v.size());
            for (const auto& item : v) list.push_back(ValueTraits<T>::to_value(item));
            return Value(std::move(list));
        }
        static std::optional<std::vector<T>> from_value(const Value& v) {
            if (!v.is_list()) return std::nullopt;
            std::vector<T> out;
            out.reserve(v.as_list().size());
            for (const auto& item : v.as_list()) {
                std::optional<T> t = ValueTraits<T>::from_value(item);
                if (!t) return std::nullopt;
                out.push_back(std::move(*t));
            }
            return out;
        }
    };

    template <class T>
    struct ValueTraits<std::map<std::string, T>> {
        static Value to_value(const std::map<std::string, T>& v) {
            Value::Map map;
            for (const auto& kv : v) map[kv.first] = ValueTraits<T>::to_value(kv.second);
            return Value(std::move(map));
        }
        static std::optional<std::map<std::string, T>> from_value(const Value& v) {
            if (!v.is_map()) return std::nullopt;
            std::map<std::string, T> out;
            for (const auto& kv : v.as_map()) {
                std::optional<T> t = ValueTraits<T>::from_value(kv.second);
                if (!t) return std::nullopt;
                out.emplace(kv.first, std::move(*t));
            }
            return out;
        }
    };

    template <class T, class = void>
    struct has_value_traits : std::false_type {};

    template <class T>
    struct has_value_traits<T, std::void_t<decltype(ValueTraits<T>::from_value(std::declval<const Value&>()))>>
        : std::true_type {};

    /**
     * Per-key override of ValueTraits. Either side left empty falls back
     * to the default; types without ValueTraits must set both.
     */
    template <class T>
    struct Converter {
        std::function<Value(const T&)> to_storage;
        std::function<std::optional<T>(const Value&)> from_storage;

        Value to(const T& v) const {
            if (to_storage) return to_storage(v);
            if constexpr (has_value_traits<T>::value) {
                return ValueTraits<T>::to_value(v);
            } else {
                throw KeepException(ErrorCode::Codec, "No to_storage conversion for this key type");
            }
        }

        std::optional<T> from(const Value& v) const {
            if (from_storage) return from_storage(v);
            if constexpr (has_value_traits<T>::value) {
                return ValueTraits<T>::from_value(v);
            } else {
                throw KeepException(ErrorCode::Codec, "No from_storage conversion for this key type");
            }
        }
    };

} // namespace keep
