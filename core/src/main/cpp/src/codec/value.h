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
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace keep {

    // On-disk type tag (one byte in every record header)
    enum class ValueType : uint8_t {
        Null   = 0,
        Int    = 1,
        Double = 2,
        Bool   = 3,
        String = 4,
        Bytes  = 5,
        List   = 6,
        Map    = 7
    };

    const char* valueTypeToString(ValueType t);

    // Unknown tags read back as Null
    ValueType valueTypeFromByte(uint8_t b);

    /**
     * Dynamically typed payload of a stored record.
     *
     * Integers are widened to int64; maps are keyed by string and ordered,
     * which keeps encodings deterministic.
     */
    class Value {
    public:
        using Bytes = std::vector<uint8_t>;
        using List  = std::vector<Value>;
        using Map   = std::map<std::string, Value>;

        Value() = default;
        Value(std::nullptr_t) {}
        Value(bool b) : data_(b) {}
        Value(int i) : data_(static_cast<int64_t>(i)) {}
        Value(long i) : data_(static_cast<int64_t>(i)) {}
        Value(long long i) : data_(static_cast<int64_t>(i)) {}
        Value(unsigned i) : data_(static_cast<int64_t>(i)) {}
        Value(double d) : data_(d) {}
        Value(const char* s) : data_(std::string(s)) {}
        Value(std::string s) : data_(std::move(s)) {}
        Value(Bytes b) : data_(std::move(b)) {}
        Value(List l) : data_(std::move(l)) {}
        Value(Map m) : data_(std::move(m)) {}

        ValueType type() const;

        bool is_null() const   { return std::holds_alternative<std::monostate>(data_); }
        bool is_int() const    { return std::holds_alternative<int64_t>(data_); }
        bool is_double() const { return std::holds_alternative<double>(data_); }
        bool is_bool() const   { return std::holds_alternative<bool>(data_); }
        bool is_string() const { return std::holds_alternative<std::string>(data_); }
        bool is_bytes() const  { return std::holds_alternative<Bytes>(data_); }
        bool is_list() const   { return std::holds_alternative<List>(data_); }
        bool is_map() const    { return std::holds_alternative<Map>(data_); }

        // Accessors throw std::bad_variant_access on a type mismatch
        int64_t as_int() const               { return std::get<int64_t>(data_); }
        double as_double() const             { return std::get<double>(data_); }
        bool as_bool() const                 { return std::get<bool>(data_); }
        const std::string& as_string() const { return std::get<std::string>(data_); }
        const Bytes& as_bytes() const        { return std::get<Bytes>(data_); }
        const List& as_list() const          { return std::get<List>(data_); }
        const Map& as_map() const            { return std::get<Map>(data_); }

        // Int or Double, widened to double
        double as_number() const;

        // Map lookup; null when absent or when this is not a map
        const Value* find(const std::string& key) const;

        bool operator==(const Value& other) const { return data_ == other.data_; }
        bool operator!=(const Value& other) const { return !(*this == other); }

        // Debug rendering, JSON-like
        std::string to_string() const;

    private:
        std::variant<std::monostate, int64_t, double, bool, std::string, Bytes, List, Map> data_;
    };

} // namespace keep
