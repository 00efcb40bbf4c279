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
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

#include "change_notifier.h"
#include "keep_exception.h"
#include "crypto/encryptor.h"
#include "key/key.h"
#include "persistence/storage.h"
#include "persistence/storage_config.h"
#include "persistence/task_pool.h"
#include "persistence/write_coordinator.h"

namespace keep {

    namespace persist {
        class ConsolidatedStore;
    }

    struct KeepOptions {
        persist::StorageConfig config = persist::StorageConfig::defaults();
        ErrorSink on_error;
        // Defaults to XorEncryptor with a 32-character key
        std::shared_ptr<Encryptor> encryptor;
        // Defaults to RecordStore
        std::shared_ptr<persist::Storage> external_storage;
    };

    struct KeyOptions {
        bool removable = false;
        // Unset: consolidated file for plain keys, per-record files for secure ones
        std::optional<bool> external;
        // Alternate backend for this key alone; implies external. The caller initializes it.
        std::shared_ptr<persist::Storage> storage;
    };

    /**
     * The storage engine: owns both stores, the worker pools, the key
     * registry and the change notifier.
     *
     * Handles can be created before init(); their operations wait until
     * the engine is ready. One handle core exists per physical id, and
     * asking for an id again with another type or other flags throws
     * KeepException(KeyConflict).
     */
    class Keep {
    public:
        enum class State {
            Uninitialized,
            Initializing,
            Ready,
            Failed
        };

        explicit Keep(KeepOptions options = KeepOptions());
        ~Keep();

        Keep(const Keep&) = delete;
        Keep& operator=(const Keep&) = delete;

        /**
         * Create <path>/<folder>, initialize the encryptor and both stores.
         * Throws KeepException(Initialization); a second call throws too.
         */
        void init(const std::string& path);
        void init(const std::string& path, const std::string& folder);

        State state() const;
        bool is_ready() const { return state() == State::Ready; }

        // Blocks until init finished; rethrows its failure
        void wait_ready() const;

        template <class T>
        Key<T> key(const std::string& name, KeyOptions options = KeyOptions(), Converter<T> converter = Converter<T>()) {
            return Key<T>(top_level_core(name, options, false, std::type_index(typeid(T))), std::move(converter));
        }

        template <class T>
        Key<T> secure_key(const std::string& name, KeyOptions options = KeyOptions(), Converter<T> converter = Converter<T>()) {
            return Key<T>(top_level_core(name, options, true, std::type_index(typeid(T))), std::move(converter));
        }

        // Wipe both stores; every registered handle sees Cleared
        std::future<void> clear();
        // Wipe removable records only; only removable handles see Cleared
        std::future<void> clear_removable();

        std::vector<KeyDescriptor> keys() const;
        std::vector<KeyDescriptor> removable_keys() const;

        // Physical ids present in each store
        std::vector<std::string> internal_keys();
        std::vector<std::string> external_keys();

        Subscription subscribe(ChangeNotifier::Listener listener);

        // Drain queued key operations, run every debounced save now and wait for both stores.
        // Deadlocks when called from inside an update function.
        void flush();

        // Flush, stop the workers and dispose the stores. Idempotent.
        void close();

        persist::Storage& internal_storage();
        persist::Storage& external_storage();
        const persist::StorageConfig& config() const { return options_.config; }
        const Encryptor& encryptor() const { return *options_.encryptor; }
        const ErrorSink& error_sink() const { return options_.on_error; }
        ChangeNotifier& notifier() { return notifier_; }
        // One FIFO lane per physical id for key operations
        persist::WriteCoordinator& key_lanes() { return *key_lanes_; }

        // Registered core of a physical id, if any
        std::shared_ptr<KeyCore> find_core(const std::string& physical_id) const;

        // Core of a sub-key of parent; called by KeyCore::child
        std::shared_ptr<KeyCore> child_core(const KeyCore& parent, const std::string& sub);

        // Name rules for plain top-level keys; throws KeepException(InvalidKey)
        static void validate_name(const std::string& name);

    private:
        std::shared_ptr<KeyCore> top_level_core(const std::string& name, const KeyOptions& options,
                                                bool secure, std::type_index type);
        std::shared_ptr<KeyCore> register_core(KeyDescriptor desc, bool secure,
                                               std::shared_ptr<persist::Storage> storage,
                                               std::type_index type);

        void notify_cleared(bool removable_only);

        KeepOptions options_;
        std::shared_ptr<persist::ConsolidatedStore> internal_;
        std::shared_ptr<persist::Storage> external_;
        std::unique_ptr<persist::TaskPool> io_;
        std::unique_ptr<persist::TaskPool> tasks_;
        std::unique_ptr<persist::WriteCoordinator> key_lanes_;
        ChangeNotifier notifier_;

        mutable std::mutex state_mu_;
        State state_ = State::Uninitialized;
        bool closed_ = false;
        std::promise<void> ready_promise_;
        std::shared_future<void> ready_;

        mutable std::mutex registry_mu_;
        std::map<std::string, std::shared_ptr<KeyCore>> registry_;
    };

} // namespace keep
