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

#include "change_notifier.h"
#include "util/log.h"

#include <optional>
#include <vector>

namespace keep {

    struct Subscription::State {
        struct Entry {
            std::optional<std::string> physical_id;
            ChangeNotifier::Listener listener;
        };

        std::mutex mu;
        uint64_t next_id = 1;
        std::map<uint64_t, Entry> entries;
    };

    const char* changeKindToString(ChangeKind kind) {
        switch (kind) {
        case ChangeKind::Written: return "written";
        case ChangeKind::Removed: return "removed";
        case ChangeKind::Cleared: return "cleared";
        }
        return "unknown";
    }

    Subscription::Subscription(Subscription&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
        other.state_.reset();
    }

    Subscription& Subscription::operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.state_.reset();
        }
        return *this;
    }

    void Subscription::cancel() {
        if (auto state = state_.lock()) {
            std::lock_guard<std::mutex> lk(state->mu);
            state->entries.erase(id_);
        }
        state_.reset();
    }

    ChangeNotifier::ChangeNotifier() : state_(std::make_shared<Subscription::State>()) {}

    Subscription ChangeNotifier::subscribe(Listener listener) {
        std::lock_guard<std::mutex> lk(state_->mu);
        uint64_t id = state_->next_id++;
        state_->entries[id] = Subscription::State::Entry{std::nullopt, std::move(listener)};
        return Subscription(state_, id);
    }

    Subscription ChangeNotifier::subscribe(const std::string& physical_id, Listener listener) {
        std::lock_guard<std::mutex> lk(state_->mu);
        uint64_t id = state_->next_id++;
        state_->entries[id] = Subscription::State::Entry{physical_id, std::move(listener)};
        return Subscription(state_, id);
    }

    void ChangeNotifier::publish(const KeyChange& change) const {
        std::vector<Listener> targets;
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            for (const auto& kv : state_->entries) {
                const auto& filter = kv.second.physical_id;
                if (!filter || *filter == change.physical_id) {
                    targets.push_back(kv.second.listener);
                }
            }
        }

        for (const auto& listener : targets) {
            try {
                listener(change);
            } catch (const std::exception& e) {
                warning() << "change listener for " << change.physical_id << " threw: " << e.what();
            }
        }
    }

    size_t ChangeNotifier::listener_count() const {
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->entries.size();
    }

} // namespace keep
