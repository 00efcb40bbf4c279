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
#include "value.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace keep {

    using ByteBuffer = std::vector<uint8_t>;

    constexpr uint8_t FLAG_REMOVABLE = 0x01;
    constexpr uint8_t FLAG_SECURE    = 0x02;

    // version, flags, type, physical id length, logical name length
    constexpr size_t RECORD_FIXED_HEADER = 5;

    /**
     * Fixed-size prefix of an encoded record. Parsing it never touches the
     * payload, so it is what per-record discovery and keep_inspect read.
     */
    struct RecordHeader {
        uint8_t version = 0;
        uint8_t flags = 0;
        ValueType type = ValueType::Null;
        std::string physical_id;
        std::string logical_name;

        bool removable() const { return (flags & FLAG_REMOVABLE) != 0; }
        bool secure() const { return (flags & FLAG_SECURE) != 0; }
    };

    struct StoredRecord {
        RecordHeader header;
        Value value;
    };

    /**
     * One on-disk record format version.
     *
     * Layout (before rotation):
     *   [version][flags][type][idLen][nameLen][id][name][payload]
     * The whole buffer is then rotated left by one bit per byte. Versions
     * differ only in how the payload is written.
     */
    class Codec {
    public:
        virtual ~Codec() = default;

        virtual uint8_t version() const = 0;

        // Throws KeepException(Codec) when a name exceeds 255 bytes
        ByteBuffer encode(const std::string& physical_id, const std::string& logical_name,
                          const Value& value, uint8_t flags) const;

        // Rotated bytes in; nullopt when truncated, malformed or null-valued
        std::optional<StoredRecord> decode(const uint8_t* data, size_t size) const;
        std::optional<StoredRecord> decode(const ByteBuffer& bytes) const {
            return decode(bytes.data(), bytes.size());
        }

        // Rotated bytes in; only the header prefix needs to be present
        std::optional<RecordHeader> header(const uint8_t* data, size_t size) const;
        std::optional<RecordHeader> header(const ByteBuffer& bytes) const {
            return header(bytes.data(), bytes.size());
        }

        // The version every encode uses
        static const Codec& current();

        // Throws KeepException(Codec) for unknown versions
        static const Codec& for_version(uint8_t version);

        // Selects by the version byte; nullptr for empty input or an unknown version
        static const Codec* of(const uint8_t* data, size_t size);
        static const Codec* of(const ByteBuffer& bytes) { return of(bytes.data(), bytes.size()); }

    protected:
        virtual void encode_payload(const Value& value, ByteBuffer& out) const = 0;
        virtual std::optional<Value> decode_payload(const uint8_t* data, size_t size,
                                                    ValueType declared) const = 0;
    };

    // v1: JSON payload
    class CodecV1 : public Codec {
    public:
        uint8_t version() const override { return 1; }
    protected:
        void encode_payload(const Value& value, ByteBuffer& out) const override;
        std::optional<Value> decode_payload(const uint8_t* data, size_t size,
                                            ValueType declared) const override;
    };

    // v2: compact tagged binary payload
    class CodecV2 : public Codec {
    public:
        uint8_t version() const override { return 2; }
    protected:
        void encode_payload(const Value& value, ByteBuffer& out) const override;
        std::optional<Value> decode_payload(const uint8_t* data, size_t size,
                                            ValueType declared) const override;
    };

    // Decode any record regardless of version
    std::optional<StoredRecord> decode_record(const uint8_t* data, size_t size);
    inline std::optional<StoredRecord> decode_record(const ByteBuffer& bytes) {
        return decode_record(bytes.data(), bytes.size());
    }
    std::optional<RecordHeader> parse_header(const uint8_t* data, size_t size);

    // ROL 1 / ROR 1 in place
    void rotate_bytes(uint8_t* data, size_t size);
    void unrotate_bytes(uint8_t* data, size_t size);

    // DJB2 over UTF-8 bytes, as an unsigned 64-bit base-36 string
    std::string hash_name(const std::string& name);

    /**
     * Consolidated file framing: [u32 BE length][record]... with the whole
     * buffer rotated once more. Keyed by physical id.
     */
    ByteBuffer encode_all(const std::map<std::string, StoredRecord>& records);

    /**
     * Truncated trailing frames and undecodable records are skipped.
     * Throws KeepException(Codec) when a non-empty buffer yields no frame at all.
     */
    std::map<std::string, StoredRecord> decode_all(const ByteBuffer& bytes);

} // namespace keep
