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
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../persistence/storage.h"

namespace keep {

    enum class SubKeyEvent : uint8_t {
        Added,
        Removed,
        Cleared
    };

    /**
     * Children of one parent key.
     *
     * Tracks the sub identifiers instantiated in this process and finds the
     * persisted ones by matching "<parent id>$" against the ids of the given
     * stores. Only direct children are reported.
     */
    class SubKeyRegistry {
    public:
        using Listener = std::function<void(SubKeyEvent, const std::string& name)>;

        // Recovers the logical name of a record whose header carries none
        using NameResolver = std::function<std::optional<std::string>(persist::Storage&, const std::string& id)>;

        explicit SubKeyRegistry(std::string parent_id) : parent_id_(std::move(parent_id)) {}

        SubKeyRegistry(const SubKeyRegistry&) = delete;
        SubKeyRegistry& operator=(const SubKeyRegistry&) = delete;

        // Events fire only when the set actually changes
        bool register_name(const std::string& name);
        bool unregister_name(const std::string& name);

        std::vector<std::string> instantiated() const;

        // Instantiated names plus persisted direct children, sorted
        std::vector<std::string> list(const std::vector<persist::Storage*>& stores,
                                      const NameResolver& resolve) const;

        /**
         * Remove every record below the parent from the stores, forget the
         * instantiated names and emit Cleared. Blocks until the removals ran;
         * returns the removed ids.
         */
        std::vector<std::string> clear(const std::vector<persist::Storage*>& stores);

        uint64_t subscribe(Listener listener);
        void unsubscribe(uint64_t id);

        const std::string& parent_id() const { return parent_id_; }

    private:
        void emit(SubKeyEvent event, const std::string& name) const;

        const std::string parent_id_;

        mutable std::mutex mu_;
        std::set<std::string> instantiated_;
        std::map<uint64_t, Listener> listeners_;
        uint64_t next_listener_ = 1;
    };

} // namespace keep
