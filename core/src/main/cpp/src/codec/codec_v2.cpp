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
#include "../util/endian.hpp"

#include <limits>

namespace keep {

    namespace {

        // Payload tags
        enum : uint8_t {
            TAG_NULL         = 0,
            TAG_TRUE         = 1,
            TAG_FALSE        = 2,
            TAG_INT32        = 3,
            TAG_INT64        = 4,
            TAG_LARGE_INT    = 5,
            TAG_FLOAT64      = 6,
            TAG_STRING       = 7,
            TAG_UINT8_LIST   = 8,
            TAG_INT32_LIST   = 9,
            TAG_INT64_LIST   = 10,
            TAG_FLOAT64_LIST = 11,
            TAG_LIST         = 12,
            TAG_MAP          = 13
        };

        constexpr int MAX_DEPTH = 256;

        void write_size(ByteBuffer& out, size_t size) {
            if (size < 254) {
                out.push_back(static_cast<uint8_t>(size));
            } else if (size <= 0xffff) {
                out.push_back(254);
                util::append_le16(out, static_cast<uint16_t>(size));
            } else {
                out.push_back(255);
                util::append_le32(out, static_cast<uint32_t>(size));
            }
        }

        void align(ByteBuffer& out, size_t alignment) {
            while (out.size() % alignment != 0) {
                out.push_back(0);
            }
        }

        void write_value(ByteBuffer& out, const Value& value) {
            switch (value.type()) {
            case ValueType::Null:
                out.push_back(TAG_NULL);
                break;
            case ValueType::Bool:
                out.push_back(value.as_bool() ? TAG_TRUE : TAG_FALSE);
                break;
            case ValueType::Int: {
                int64_t v = value.as_int();
                if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max()) {
                    out.push_back(TAG_INT32);
                    util::append_le32(out, static_cast<uint32_t>(static_cast<int32_t>(v)));
                } else {
                    out.push_back(TAG_INT64);
                    util::append_le64(out, static_cast<uint64_t>(v));
                }
                break;
            }
            case ValueType::Double:
                out.push_back(TAG_FLOAT64);
                align(out, 8);
                util::append_lef64(out, value.as_double());
                break;
            case ValueType::String: {
                const std::string& s = value.as_string();
                out.push_back(TAG_STRING);
                write_size(out, s.size());
                out.insert(out.end(), s.begin(), s.end());
                break;
            }
            case ValueType::Bytes: {
                const Value::Bytes& b = value.as_bytes();
                out.push_back(TAG_UINT8_LIST);
                write_size(out, b.size());
                out.insert(out.end(), b.begin(), b.end());
                break;
            }
            case ValueType::List:
                out.push_back(TAG_LIST);
                write_size(out, value.as_list().size());
                for (const auto& item : value.as_list()) {
                    write_value(out, item);
                }
                break;
            case ValueType::Map:
                out.push_back(TAG_MAP);
                write_size(out, value.as_map().size());
                for (const auto& kv : value.as_map()) {
                    write_value(out, Value(kv.first));
                    write_value(out, kv.second);
                }
                break;
            }
        }

        // Bounds-checked cursor; every read fails softly
        class Reader {
        public:
            Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

            bool done() const { return pos_ == size_; }

            bool byte(uint8_t& out) {
                if (pos_ >= size_) return false;
                out = data_[pos_++];
                return true;
            }

            const uint8_t* take(size_t n) {
                if (n > size_ - pos_) return nullptr;
                const uint8_t* p = data_ + pos_;
                pos_ += n;
                return p;
            }

            bool skip_align(size_t alignment) {
                size_t mod = pos_ % alignment;
                return mod == 0 || take(alignment - mod) != nullptr;
            }

            bool size(size_t& out) {
                uint8_t b;
                if (!byte(b)) return false;
                if (b < 254) {
                    out = b;
                    return true;
                }
                const uint8_t* p = take(b == 254 ? 2 : 4);
                if (!p) return false;
                out = b == 254 ? util::load_le16(p) : util::load_le32(p);
                return true;
            }

        private:
            const uint8_t* data_;
            size_t size_;
            size_t pos_ = 0;
        };

        bool read_value(Reader& in, Value& out, int depth) {
            if (depth > MAX_DEPTH) {
                return false;
            }
            uint8_t tag;
            if (!in.byte(tag)) {
                return false;
            }
            switch (tag) {
            case TAG_NULL:
                out = Value();
                return true;
            case TAG_TRUE:
                out = Value(true);
                return true;
            case TAG_FALSE:
                out = Value(false);
                return true;
            case TAG_INT32: {
                const uint8_t* p = in.take(4);
                if (!p) return false;
                out = Value(static_cast<int32_t>(util::load_le32(p)));
                return true;
            }
            case TAG_INT64: {
                const uint8_t* p = in.take(8);
                if (!p) return false;
                out = Value(static_cast<long long>(static_cast<int64_t>(util::load_le64(p))));
                return true;
            }
            case TAG_FLOAT64: {
                if (!in.skip_align(8)) return false;
                const uint8_t* p = in.take(8);
                if (!p) return false;
                out = Value(util::load_lef64(p));
                return true;
            }
            case TAG_STRING:
            case TAG_UINT8_LIST: {
                size_t n;
                if (!in.size(n)) return false;
                const uint8_t* p = in.take(n);
                if (!p) return false;
                if (tag == TAG_STRING) {
                    out = Value(std::string(reinterpret_cast<const char*>(p), n));
                } else {
                    out = Value(Value::Bytes(p, p + n));
                }
                return true;
            }
            case TAG_INT32_LIST:
            case TAG_INT64_LIST:
            case TAG_FLOAT64_LIST: {
                size_t n;
                if (!in.size(n)) return false;
                size_t width = tag == TAG_INT32_LIST ? 4 : 8;
                if (!in.skip_align(width)) return false;
                const uint8_t* p = in.take(n * width);
                if (!p) return false;
                Value::List list;
                list.reserve(n);
                for (size_t i = 0; i < n; ++i, p += width) {
                    if (tag == TAG_INT32_LIST) {
                        list.emplace_back(static_cast<int32_t>(util::load_le32(p)));
                    } else if (tag == TAG_INT64_LIST) {
                        list.emplace_back(static_cast<long long>(static_cast<int64_t>(util::load_le64(p))));
                    } else {
                        list.emplace_back(util::load_lef64(p));
                    }
                }
                out = Value(std::move(list));
                return true;
            }
            case TAG_LIST: {
                size_t n;
                if (!in.size(n)) return false;
                Value::List list;
                for (size_t i = 0; i < n; ++i) {
                    Value item;
                    if (!read_value(in, item, depth + 1)) return false;
                    list.push_back(std::move(item));
                }
                out = Value(std::move(list));
                return true;
            }
            case TAG_MAP: {
                size_t n;
                if (!in.size(n)) return false;
                Value::Map map;
                for (size_t i = 0; i < n; ++i) {
                    Value key, item;
                    if (!read_value(in, key, depth + 1) || !key.is_string()) return false;
                    if (!read_value(in, item, depth + 1)) return false;
                    map[key.as_string()] = std::move(item);
                }
                out = Value(std::move(map));
                return true;
            }
            default:
                // TAG_LARGE_INT and unknown tags
                return false;
            }
        }

    } // namespace

    void CodecV2::encode_payload(const Value& value, ByteBuffer& out) const {
        write_value(out, value);
    }

    std::optional<Value> CodecV2::decode_payload(const uint8_t* data, size_t size,
                                                 ValueType /*declared*/) const {
        Reader in(data, size);
        Value value;
        if (!read_value(in, value, 0) || !in.done()) {
            return std::nullopt;
        }
        return value;
    }

} // namespace keep
