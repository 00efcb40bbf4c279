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
#include <optional>
#include <string>

namespace keep {

    /**
     * JSON rendering of a Value.
     *
     * Bytes have no JSON form and are written as a list of integers;
     * non-finite doubles are written as null.
     */
    std::string value_to_json(const Value& value);

    // nullopt on a parse error
    std::optional<Value> value_from_json(const std::string& json);

    // Restores Bytes from a list of 0..255 integers; other values unchanged
    Value bytes_from_int_list(const Value& value);

} // namespace keep
