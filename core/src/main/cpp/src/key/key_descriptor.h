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
#include <optional>
#include <string>

#include "../pch.h"
#include "../codec/codec.h"

namespace keep {

    /**
     * Identity of a key: where its record lives and how it is flagged.
     */
    struct KeyDescriptor {
        std::string logical_name;
        std::string physical_id;
        bool removable = false;
        bool external = false;
        bool secure = false;
        std::optional<std::string> parent;  // parent physical id for sub-keys

        uint8_t flags() const {
            uint8_t f = 0;
            if (removable) f |= FLAG_REMOVABLE;
            if (secure) f |= FLAG_SECURE;
            return f;
        }

        // Name written into the record header; secure records keep it encrypted only
        std::string stored_name() const {
            return secure ? std::string() : logical_name;
        }

        bool is_sub_key() const { return parent.has_value(); }

        bool operator==(const KeyDescriptor& o) const {
            return logical_name == o.logical_name && physical_id == o.physical_id &&
                   removable == o.removable && external == o.external &&
                   secure == o.secure && parent == o.parent;
        }
    };

    // Sub-key id: parent id, separator, hash of the sub identifier
    inline std::string sub_key_id(const std::string& parent_id, const std::string& sub) {
        return parent_id + KEEP_SEPARATOR + hash_name(sub);
    }

    // True when id is parent_id + separator + one more segment without separator
    inline bool is_direct_child(const std::string& id, const std::string& parent_id) {
        if (id.size() <= parent_id.size() + 1 || id.compare(0, parent_id.size(), parent_id) != 0 ||
            id[parent_id.size()] != KEEP_SEPARATOR) {
            return false;
        }
        return id.find(KEEP_SEPARATOR, parent_id.size() + 1) == std::string::npos;
    }

} // namespace keep
