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
#include <mutex>
#include <optional>
#include <string>
#include <cstdint>
#include <typeindex>
#include <variant>
#include <vector>

#include "key_descriptor.h"
#include "sub_key_registry.h"
#include "../change_notifier.h"
#include "../codec/value.h"
#include "../crypto/encryptor.h"
#include "../persistence/storage.h"
#include "../persistence/write_coordinator.h"

namespace keep {

    class Keep;

    /**
     * State shared by every handle of one physical id.
     *
     * KeyCore works on stored Values; typed conversion lives in Key<T>.
     * Plain keys pass values through and cache the last one read. Secure
     * keys wrap the value in {"k": name, "v": value}, encrypt the JSON and
     * store the ciphertext string; they never cache plaintext.
     *
     * Every asynchronous operation of one physical id runs in that id's
     * lane of Keep::key_lanes(), in call order. Writes and removals are
     * issued to the backend inside the lane and settle outside it, so a
     * later read in the lane already sees them. The *_blocking operations
     * and the issue_* ones wait for the engine to be ready; they run in the
     * lane, never on the io pool.
     *
     * The plain-value cache carries a generation bumped by every
     * invalidation. A read only caches what it fetched when no write,
     * removal or clear happened in between.
     */
    class KeyCore : public std::enable_shared_from_this<KeyCore> {
    public:
        struct PlainMode {};
        struct SecureMode {
            std::shared_ptr<Encryptor> encryptor;
        };
        using Mode = std::variant<PlainMode, SecureMode>;

        KeyCore(Keep& engine, KeyDescriptor descriptor, Mode mode,
                std::shared_ptr<persist::Storage> storage, std::type_index type);

        KeyCore(const KeyCore&) = delete;
        KeyCore& operator=(const KeyCore&) = delete;

        const KeyDescriptor& descriptor() const { return desc_; }
        bool secure() const { return std::holds_alternative<SecureMode>(mode_); }
        std::type_index type() const { return type_; }
        const std::shared_ptr<persist::Storage>& storage_override() const { return storage_; }

        // A value together with the cache generation it was read under
        struct Snapshot {
            std::optional<Value> value;
            uint64_t generation = 0;
        };

        Snapshot read_blocking();

        /**
         * Hand a value to the backend and publish the change. Throws
         * KeepException when it cannot be issued; the returned future
         * carries failures of the backend itself. A null value removes.
         */
        std::shared_future<void> issue_write(const Value& value);
        std::shared_future<void> issue_remove();

        bool exists_blocking();

        // No waiting; nullopt / false while the engine is not ready. Never fills the cache.
        Snapshot read_now();
        bool exists_now();

        // Report and forget the cached value; the record is removed in the
        // lane unless it was rewritten after `generation`
        void drop_corrupt(const KeepException& cause, uint64_t generation);

        void invalidate_cache();

        // Forget the cached value and tell subscribers the record was wiped
        void notify_cleared();

        // Log and forward to the engine's error sink
        void report_error(const KeepException& e) const;

        // Runs fn in this key's lane; a closed engine yields a failed future
        template <class R>
        std::future<R> async(std::function<R()> fn) {
            return lanes().run<R>(desc_.physical_id, std::move(fn));
        }

        // Runs issue in this key's lane; the result settles once the backend has the change
        std::future<void> async_issue(std::function<std::shared_future<void>()> issue);

        // Sub-key of this key with the same type and flags
        std::shared_ptr<KeyCore> child(const std::string& sub);

        SubKeyRegistry& sub_key_registry() { return subs_; }
        std::vector<std::string> list_sub_keys();
        void clear_sub_keys_blocking();

        Subscription subscribe(ChangeNotifier::Listener listener);

        Keep& engine() const { return engine_; }

        // Logical name carried inside a secure record, read without a handle
        static std::optional<std::string> recover_secure_name(persist::Storage& store,
                                                              const std::string& physical_id,
                                                              const Encryptor& encryptor);

    private:
        persist::Storage& target() const;
        std::vector<persist::Storage*> discovery_stores() const;

        persist::WriteCoordinator& lanes() const;

        // Remove the record unless something rewrote it after `generation`
        void remove_if_unchanged(uint64_t generation);

        Value to_stored(const Value& value) const;
        // Throws KeepException(Encryption / Codec) for records this key cannot read
        Value from_stored(const Value& stored) const;

        // Shared tail of read_blocking and read_now
        std::optional<Value> accept(std::optional<Value> stored, uint64_t generation, bool cacheable);

        void publish(ChangeKind kind) const;

        Keep& engine_;
        const KeyDescriptor desc_;
        const Mode mode_;
        const std::shared_ptr<persist::Storage> storage_;
        const std::type_index type_;
        SubKeyRegistry subs_;

        std::mutex cache_mu_;
        std::optional<Value> cache_;
        uint64_t generation_ = 0;
    };

} // namespace keep
