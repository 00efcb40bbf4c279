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

#include <gtest/gtest.h>
#include "codec/value.h"
#include "codec/json_value.h"

#include <limits>

using namespace keep;

TEST(ValueTest, TypeTags) {
    EXPECT_EQ(Value().type(), ValueType::Null);
    EXPECT_EQ(Value(7).type(), ValueType::Int);
    EXPECT_EQ(Value(1.5).type(), ValueType::Double);
    EXPECT_EQ(Value(true).type(), ValueType::Bool);
    EXPECT_EQ(Value("s").type(), ValueType::String);
    EXPECT_EQ(Value(Value::Bytes{1, 2}).type(), ValueType::Bytes);
    EXPECT_EQ(Value(Value::List{}).type(), ValueType::List);
    EXPECT_EQ(Value(Value::Map{}).type(), ValueType::Map);

    // On-disk tag values are fixed
    EXPECT_EQ(static_cast<int>(ValueType::Int), 1);
    EXPECT_EQ(static_cast<int>(ValueType::Map), 7);
    EXPECT_EQ(valueTypeFromByte(200), ValueType::Null);
}

TEST(ValueTest, IntegersWiden) {
    Value v(static_cast<long long>(1) << 40);
    ASSERT_TRUE(v.is_int());
    EXPECT_EQ(v.as_int(), int64_t(1) << 40);
    EXPECT_DOUBLE_EQ(Value(3).as_number(), 3.0);
    EXPECT_THROW(Value("x").as_int(), std::bad_variant_access);
}

TEST(ValueTest, MapFind) {
    Value::Map m;
    m["a"] = Value(1);
    Value v(m);
    ASSERT_NE(v.find("a"), nullptr);
    EXPECT_EQ(*v.find("a"), Value(1));
    EXPECT_EQ(v.find("b"), nullptr);
    EXPECT_EQ(Value(5).find("a"), nullptr);
}

TEST(ValueTest, EqualityIsTypeSensitive) {
    EXPECT_EQ(Value("a"), Value(std::string("a")));
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_NE(Value(true), Value(1));
}

TEST(JsonValueTest, RendersNestedValues) {
    Value::Map m;
    m["n"] = Value(42);
    m["l"] = Value(Value::List{Value(true), Value()});
    EXPECT_EQ(value_to_json(Value(m)), "{\"l\":[true,null],\"n\":42}");
}

TEST(JsonValueTest, BytesBecomeIntegerLists) {
    std::string json = value_to_json(Value(Value::Bytes{0, 255}));
    EXPECT_EQ(json, "[0,255]");

    std::optional<Value> back = value_from_json(json);
    ASSERT_TRUE(back);
    EXPECT_TRUE(back->is_list());
    EXPECT_EQ(bytes_from_int_list(*back), Value(Value::Bytes{0, 255}));
}

TEST(JsonValueTest, IntListOutOfByteRangeStaysList) {
    Value list(Value::List{Value(1), Value(256)});
    EXPECT_EQ(bytes_from_int_list(list), list);
}

TEST(JsonValueTest, NonFiniteDoublesWriteNull) {
    EXPECT_EQ(value_to_json(Value(std::numeric_limits<double>::infinity())), "null");
}

TEST(JsonValueTest, ParseErrorIsNullopt) {
    EXPECT_FALSE(value_from_json("{\"a\":"));
    EXPECT_FALSE(value_from_json(""));
}

TEST(JsonValueTest, ParsesScalars) {
    EXPECT_EQ(*value_from_json("-12"), Value(-12));
    EXPECT_EQ(*value_from_json("2.5"), Value(2.5));
    EXPECT_EQ(*value_from_json("\"hi\""), Value("hi"));
    EXPECT_EQ(*value_from_json("null"), Value());
}
