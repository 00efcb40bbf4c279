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
#include "../keep_exception.h"
#include "../util/endian.hpp"
#include "../util/log.h"

#include <algorithm>

namespace keep {

    static const CodecV1 codec_v1;
    static const CodecV2 codec_v2;

    void rotate_bytes(uint8_t* data, size_t size) {
        for (size_t i = 0; i < size; ++i) {
            uint8_t b = data[i];
            data[i] = static_cast<uint8_t>((b << 1) | (b >> 7));
        }
    }

    void unrotate_bytes(uint8_t* data, size_t size) {
        for (size_t i = 0; i < size; ++i) {
            uint8_t b = data[i];
            data[i] = static_cast<uint8_t>((b >> 1) | (b << 7));
        }
    }

    std::string hash_name(const std::string& name) {
        uint64_t hash = 5381;
        for (unsigned char c : name) {
            hash = (hash << 5) + hash + c;
        }
        if (hash == 0) {
            return "0";
        }
        static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        std::string out;
        while (hash > 0) {
            out.push_back(digits[hash % 36]);
            hash /= 36;
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    const Codec& Codec::current() {
        return codec_v2;
    }

    const Codec& Codec::for_version(uint8_t version) {
        switch (version) {
        case 1: return codec_v1;
        case 2: return codec_v2;
        default:
            throw KeepException(ErrorCode::Codec,
                                "Unsupported codec version: " + std::to_string(version));
        }
    }

    const Codec* Codec::of(const uint8_t* data, size_t size) {
        if (size == 0) {
            return nullptr;
        }
        uint8_t first = data[0];
        unrotate_bytes(&first, 1);
        switch (first) {
        case 1: return &codec_v1;
        case 2: return &codec_v2;
        default: return nullptr;
        }
    }

    ByteBuffer Codec::encode(const std::string& physical_id, const std::string& logical_name,
                             const Value& value, uint8_t flags) const {
        if (physical_id.size() > KEEP_MAX_NAME_BYTES) {
            throw KeepException(ErrorCode::Codec, "Physical id too long", physical_id);
        }
        if (logical_name.size() > KEEP_MAX_NAME_BYTES) {
            throw KeepException(ErrorCode::Codec, "Key name too long: " + logical_name, physical_id);
        }

        ByteBuffer out;
        out.reserve(RECORD_FIXED_HEADER + physical_id.size() + logical_name.size() + 16);
        out.push_back(version());
        out.push_back(flags);
        out.push_back(static_cast<uint8_t>(value.type()));
        out.push_back(static_cast<uint8_t>(physical_id.size()));
        out.push_back(static_cast<uint8_t>(logical_name.size()));
        out.insert(out.end(), physical_id.begin(), physical_id.end());
        out.insert(out.end(), logical_name.begin(), logical_name.end());

        // Payload offsets are relative to its own start
        ByteBuffer payload;
        encode_payload(value, payload);
        out.insert(out.end(), payload.begin(), payload.end());

        rotate_bytes(out.data(), out.size());
        return out;
    }

    std::optional<RecordHeader> Codec::header(const uint8_t* data, size_t size) const {
        if (size < RECORD_FIXED_HEADER) {
            return std::nullopt;
        }
        uint8_t fixed[RECORD_FIXED_HEADER];
        std::copy(data, data + RECORD_FIXED_HEADER, fixed);
        unrotate_bytes(fixed, RECORD_FIXED_HEADER);

        size_t id_len = fixed[3];
        size_t name_len = fixed[4];
        if (RECORD_FIXED_HEADER + id_len + name_len > size) {
            return std::nullopt;
        }

        std::string names(reinterpret_cast<const char*>(data + RECORD_FIXED_HEADER), id_len + name_len);
        unrotate_bytes(reinterpret_cast<uint8_t*>(&names[0]), names.size());

        RecordHeader h;
        h.version = fixed[0];
        h.flags = fixed[1];
        h.type = valueTypeFromByte(fixed[2]);
        h.physical_id = names.substr(0, id_len);
        h.logical_name = names.substr(id_len);
        return h;
    }

    std::optional<StoredRecord> Codec::decode(const uint8_t* data, size_t size) const {
        std::optional<RecordHeader> h = header(data, size);
        if (!h) {
            return std::nullopt;
        }

        size_t offset = RECORD_FIXED_HEADER + h->physical_id.size() + h->logical_name.size();
        ByteBuffer payload(data + offset, data + size);
        unrotate_bytes(payload.data(), payload.size());

        std::optional<Value> value = decode_payload(payload.data(), payload.size(), h->type);
        if (!value || value->is_null()) {
            return std::nullopt;
        }
        return StoredRecord{std::move(*h), std::move(*value)};
    }

    std::optional<StoredRecord> decode_record(const uint8_t* data, size_t size) {
        const Codec* codec = Codec::of(data, size);
        if (!codec) {
            return std::nullopt;
        }
        return codec->decode(data, size);
    }

    std::optional<RecordHeader> parse_header(const uint8_t* data, size_t size) {
        const Codec* codec = Codec::of(data, size);
        if (!codec) {
            return std::nullopt;
        }
        return codec->header(data, size);
    }

    ByteBuffer encode_all(const std::map<std::string, StoredRecord>& records) {
        ByteBuffer out;
        for (const auto& kv : records) {
            const StoredRecord& rec = kv.second;
            ByteBuffer frame = Codec::current().encode(kv.first, rec.header.logical_name,
                                                       rec.value, rec.header.flags);
            util::append_be32(out, static_cast<uint32_t>(frame.size()));
            out.insert(out.end(), frame.begin(), frame.end());
        }
        rotate_bytes(out.data(), out.size());
        return out;
    }

    std::map<std::string, StoredRecord> decode_all(const ByteBuffer& bytes) {
        std::map<std::string, StoredRecord> records;
        if (bytes.empty()) {
            return records;
        }

        ByteBuffer data(bytes);
        unrotate_bytes(data.data(), data.size());

        size_t offset = 0;
        size_t frames = 0;
        while (offset + 4 <= data.size()) {
            uint32_t len = util::load_be32(data.data() + offset);
            offset += 4;
            if (len > data.size() - offset) {
                warning() << "consolidated file: truncated frame at offset " << (offset - 4)
                          << ", " << (data.size() - offset) << " of " << len << " bytes";
                break;
            }
            ++frames;
            std::optional<StoredRecord> rec = decode_record(data.data() + offset, len);
            if (rec) {
                std::string id = rec->header.physical_id;
                records[id] = std::move(*rec);
            } else {
                warning() << "consolidated file: skipping undecodable record at offset " << offset;
            }
            offset += len;
        }

        if (frames == 0) {
            throw KeepException(ErrorCode::Codec,
                                "No readable frame in " + std::to_string(bytes.size()) + " bytes");
        }
        return records;
    }

} // namespace keep
