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

#include "sub_key_registry.h"
#include "key_descriptor.h"
#include "../util/log.h"

namespace keep {

    bool SubKeyRegistry::register_name(const std::string& name) {
        bool added;
        {
            std::lock_guard<std::mutex> lk(mu_);
            added = instantiated_.insert(name).second;
        }
        if (added) {
            emit(SubKeyEvent::Added, name);
        }
        return added;
    }

    bool SubKeyRegistry::unregister_name(const std::string& name) {
        bool removed;
        {
            std::lock_guard<std::mutex> lk(mu_);
            removed = instantiated_.erase(name) != 0;
        }
        if (removed) {
            emit(SubKeyEvent::Removed, name);
        }
        return removed;
    }

    std::vector<std::string> SubKeyRegistry::instantiated() const {
        std::lock_guard<std::mutex> lk(mu_);
        return std::vector<std::string>(instantiated_.begin(), instantiated_.end());
    }

    std::vector<std::string> SubKeyRegistry::list(const std::vector<persist::Storage*>& stores,
                                                  const NameResolver& resolve) const {
        std::set<std::string> names;
        std::map<std::string, std::string> derived;  // id -> instantiated name
        {
            std::lock_guard<std::mutex> lk(mu_);
            names = instantiated_;
        }
        for (const auto& name : names) {
            derived[sub_key_id(parent_id_, name)] = name;
        }

        for (persist::Storage* store : stores) {
            for (const auto& id : store->known_keys()) {
                if (!is_direct_child(id, parent_id_) || derived.count(id)) {
                    continue;
                }
                std::optional<RecordHeader> h = store->header(id);
                if (h && !h->logical_name.empty()) {
                    names.insert(h->logical_name);
                    continue;
                }
                std::optional<std::string> resolved = resolve ? resolve(*store, id) : std::nullopt;
                if (resolved) {
                    names.insert(*resolved);
                } else {
                    debug() << "sub-key " << id << " of " << parent_id_ << " has no recoverable name";
                }
            }
        }
        return std::vector<std::string>(names.begin(), names.end());
    }

    std::vector<std::string> SubKeyRegistry::clear(const std::vector<persist::Storage*>& stores) {
        const std::string prefix = parent_id_ + KEEP_SEPARATOR;
        std::vector<std::string> removed;
        std::vector<std::future<void>> pending;

        for (persist::Storage* store : stores) {
            for (const auto& id : store->known_keys()) {
                if (id.compare(0, prefix.size(), prefix) == 0) {
                    removed.push_back(id);
                    pending.push_back(store->remove_key(id));
                }
            }
        }
        persist::when_all(std::move(pending)).get();

        {
            std::lock_guard<std::mutex> lk(mu_);
            instantiated_.clear();
        }
        emit(SubKeyEvent::Cleared, std::string());
        return removed;
    }

    uint64_t SubKeyRegistry::subscribe(Listener listener) {
        std::lock_guard<std::mutex> lk(mu_);
        uint64_t id = next_listener_++;
        listeners_[id] = std::move(listener);
        return id;
    }

    void SubKeyRegistry::unsubscribe(uint64_t id) {
        std::lock_guard<std::mutex> lk(mu_);
        listeners_.erase(id);
    }

    void SubKeyRegistry::emit(SubKeyEvent event, const std::string& name) const {
        std::vector<Listener> targets;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (const auto& kv : listeners_) {
                targets.push_back(kv.second);
            }
        }
        for (const auto& listener : targets) {
            try {
                listener(event, name);
            } catch (const std::exception& e) {
                warning() << "sub-key listener of " << parent_id_ << " threw: " << e.what();
            }
        }
    }

} // namespace keep
