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
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "key_core.h"
#include "value_traits.h"

namespace keep {

    /**
     * Typed handle to one stored value.
     *
     * Handles are cheap to copy; every handle of the same physical id shares
     * one KeyCore. Asynchronous operations of one physical id run in call
     * order, whether or not the caller waits on the earlier futures, and
     * wait for the engine to be ready first. Reads never throw: missing,
     * undecodable or unconvertible values read as nullopt (the last two are
     * reported and dropped). Writes throw KeepException through the future.
     * Write, update and remove return deferred futures: get() or wait()
     * settles them once the backend has the change.
     */
    template <class T>
    class Key {
    public:
        Key(std::shared_ptr<KeyCore> core, Converter<T> converter)
            : core_(std::move(core)), converter_(std::move(converter)) {}

        const KeyDescriptor& descriptor() const { return core_->descriptor(); }
        const std::string& name() const { return core_->descriptor().logical_name; }
        const std::string& physical_id() const { return core_->descriptor().physical_id; }
        bool removable() const { return core_->descriptor().removable; }
        bool external() const { return core_->descriptor().external; }
        bool secure() const { return core_->secure(); }

        std::future<std::optional<T>> read() const {
            auto self = *this;
            return core_->async<std::optional<T>>([self]() { return self.convert(self.core_->read_blocking()); });
        }

        // Never waits for init; nullopt until the engine is ready
        std::optional<T> read_sync() const {
            return convert(core_->read_now());
        }

        T read_safe_sync(T fallback) const {
            std::optional<T> v = read_sync();
            return v ? std::move(*v) : std::move(fallback);
        }

        std::future<void> write(T value) const {
            auto self = *this;
            return core_->async_issue([self, value = std::move(value)]() {
                return self.core_->issue_write(self.to_stored(value));
            });
        }

        // Writing nothing removes the record
        std::future<void> write(std::nullopt_t) const {
            return remove();
        }

        /**
         * Read-modify-write in this key's lane. fn sees the current value (or
         * nullopt) and returns the new one; returning nullopt removes it.
         * fn must not wait on another operation of the same key.
         */
        std::future<void> update(std::function<std::optional<T>(std::optional<T>)> fn) const {
            auto self = *this;
            return core_->async_issue([self, fn = std::move(fn)]() {
                std::optional<T> next = fn(self.convert(self.core_->read_blocking()));
                return next ? self.core_->issue_write(self.to_stored(*next)) : self.core_->issue_remove();
            });
        }

        std::future<void> remove() const {
            auto core = core_;
            return core_->async_issue([core]() { return core->issue_remove(); });
        }

        std::future<bool> exists() const {
            auto core = core_;
            return core_->async<bool>([core]() { return core->exists_blocking(); });
        }

        bool exists_sync() const {
            return core_->exists_now();
        }

        // Sub-key named sub, same type, flags and storage as this key
        Key<T> operator()(const std::string& sub) const {
            return Key<T>(core_->child(sub), converter_);
        }

        // Sub identifiers instantiated here or found on disk, direct children only
        std::future<std::vector<std::string>> sub_keys() const {
            auto core = core_;
            return core_->async<std::vector<std::string>>([core]() { return core->list_sub_keys(); });
        }

        // Removes every descendant record of this key
        std::future<void> clear_sub_keys() const {
            auto core = core_;
            return core_->async<void>([core]() { core->clear_sub_keys_blocking(); });
        }

        Subscription subscribe(ChangeNotifier::Listener listener) const {
            return core_->subscribe(std::move(listener));
        }

        uint64_t subscribe_sub_keys(SubKeyRegistry::Listener listener) const {
            return core_->sub_key_registry().subscribe(std::move(listener));
        }

        void unsubscribe_sub_keys(uint64_t id) const {
            core_->sub_key_registry().unsubscribe(id);
        }

        bool operator==(const Key& o) const { return core_ == o.core_; }
        bool operator!=(const Key& o) const { return core_ != o.core_; }

    private:
        Value to_stored(const T& value) const {
            try {
                return converter_.to(value);
            } catch (const KeepException& e) {
                core_->report_error(e);
                throw;
            } catch (const std::exception& e) {
                KeepException err(ErrorCode::Codec, "Value conversion failed", physical_id(), e.what());
                core_->report_error(err);
                throw err;
            }
        }

        std::optional<T> convert(const KeyCore::Snapshot& snapshot) const {
            if (!snapshot.value) {
                return std::nullopt;
            }
            const Value& stored = *snapshot.value;
            std::optional<T> value;
            try {
                value = converter_.from(stored);
            } catch (const std::exception& e) {
                core_->drop_corrupt(KeepException(ErrorCode::Codec, "Value conversion failed", physical_id(), e.what()),
                                    snapshot.generation);
                return std::nullopt;
            }
            if (!value) {
                core_->drop_corrupt(KeepException(ErrorCode::Codec,
                                                  std::string("Stored ") + valueTypeToString(stored.type()) +
                                                  " does not fit this key",
                                                  physical_id()),
                                    snapshot.generation);
            }
            return value;
        }

        std::shared_ptr<KeyCore> core_;
        Converter<T> converter_;
    };

} // namespace keep
