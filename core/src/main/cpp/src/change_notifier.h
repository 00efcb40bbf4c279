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
#include <memory>
#include <mutex>
#include <string>

namespace keep {

    enum class ChangeKind : uint8_t {
        Written,
        Removed,
        Cleared     // wiped by Keep::clear, clear_removable or a sub-key clear
    };

    const char* changeKindToString(ChangeKind kind);

    struct KeyChange {
        std::string physical_id;
        std::string logical_name;
        ChangeKind kind;
    };

    class ChangeNotifier;

    /**
     * Cancels its listener when destroyed or on cancel(). Safe to outlive
     * the notifier.
     */
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { cancel(); }

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void cancel();
        bool active() const { return !state_.expired(); }

    private:
        friend class ChangeNotifier;
        struct State;
        Subscription(std::weak_ptr<State> state, uint64_t id) : state_(std::move(state)), id_(id) {}

        std::weak_ptr<State> state_;
        uint64_t id_ = 0;
    };

    /**
     * Broadcast channel of key changes, filterable by physical id.
     *
     * Listeners run on the publishing thread, outside the notifier lock; a
     * throwing listener is logged and skipped.
     */
    class ChangeNotifier {
    public:
        using Listener = std::function<void(const KeyChange&)>;

        ChangeNotifier();

        Subscription subscribe(Listener listener);
        Subscription subscribe(const std::string& physical_id, Listener listener);

        void publish(const KeyChange& change) const;

        size_t listener_count() const;

    private:
        std::shared_ptr<Subscription::State> state_;
    };

} // namespace keep
