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

#include "key_core.h"
#include "../keep.h"
#include "../codec/json_value.h"
#include "../util/log.h"

#include <chrono>

namespace keep {

    namespace {

        const char* const ENVELOPE_NAME = "k";
        const char* const ENVELOPE_VALUE = "v";

        // Decrypted JSON of a secure record; throws KeepException(Encryption / Codec)
        Value open_envelope(const Value& stored, const Encryptor& encryptor, const std::string& id) {
            if (!stored.is_string()) {
                throw KeepException(ErrorCode::Encryption, "Secure record is not ciphertext", id,
                                    std::string("stored as ") + valueTypeToString(stored.type()));
            }
            std::string plaintext;
            try {
                plaintext = encryptor.decrypt_sync(stored.as_string());
            } catch (const KeepException&) {
                throw;
            } catch (const std::exception& e) {
                throw KeepException(ErrorCode::Encryption, "Decryption failed", id, e.what());
            }
            std::optional<Value> json = value_from_json(plaintext);
            if (!json) {
                throw KeepException(ErrorCode::Codec, "Decrypted payload is not JSON", id);
            }
            return std::move(*json);
        }

        // Rethrow a refusal the backend reported before accepting the change
        void throw_if_refused(const std::shared_future<void>& f) {
            if (f.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                f.get();
            }
        }

        // {"k": name, "v": value} and nothing else; anything else is a bare legacy value
        bool is_envelope(const Value& json) {
            return json.is_map() && json.as_map().size() == 2 &&
                   json.find(ENVELOPE_NAME) && json.find(ENVELOPE_VALUE);
        }

    } // namespace

    KeyCore::KeyCore(Keep& engine, KeyDescriptor descriptor, Mode mode,
                     std::shared_ptr<persist::Storage> storage, std::type_index type)
        : engine_(engine),
          desc_(std::move(descriptor)),
          mode_(std::move(mode)),
          storage_(std::move(storage)),
          type_(type),
          subs_(desc_.physical_id) {}

    persist::Storage& KeyCore::target() const {
        if (storage_) {
            return *storage_;
        }
        return desc_.external ? engine_.external_storage() : engine_.internal_storage();
    }

    std::vector<persist::Storage*> KeyCore::discovery_stores() const {
        std::vector<persist::Storage*> stores{&engine_.internal_storage(), &engine_.external_storage()};
        if (storage_) {
            stores.push_back(storage_.get());
        }
        return stores;
    }

    persist::WriteCoordinator& KeyCore::lanes() const {
        return engine_.key_lanes();
    }

    std::future<void> KeyCore::async_issue(std::function<std::shared_future<void>()> issue) {
        std::future<std::shared_future<void>> issued = async<std::shared_future<void>>(std::move(issue));
        return std::async(std::launch::deferred, [issued = std::move(issued)]() mutable {
            issued.get().get();
        });
    }

    Value KeyCore::to_stored(const Value& value) const {
        return std::visit([&](const auto& mode) -> Value {
            using M = std::decay_t<decltype(mode)>;
            if constexpr (std::is_same_v<M, PlainMode>) {
                return value;
            } else {
                Value::Map envelope;
                envelope[ENVELOPE_NAME] = Value(desc_.logical_name);
                envelope[ENVELOPE_VALUE] = value;
                const std::string json = value_to_json(Value(std::move(envelope)));
                try {
                    return Value(mode.encryptor->encrypt_sync(json));
                } catch (const KeepException&) {
                    throw;
                } catch (const std::exception& e) {
                    throw KeepException(ErrorCode::Encryption, "Encryption failed", desc_.physical_id, e.what());
                }
            }
        }, mode_);
    }

    Value KeyCore::from_stored(const Value& stored) const {
        return std::visit([&](const auto& mode) -> Value {
            using M = std::decay_t<decltype(mode)>;
            if constexpr (std::is_same_v<M, PlainMode>) {
                return stored;
            } else {
                Value json = open_envelope(stored, *mode.encryptor, desc_.physical_id);
                if (is_envelope(json)) {
                    return *json.find(ENVELOPE_VALUE);
                }
                // Bare values predate the envelope
                return json;
            }
        }, mode_);
    }

    std::optional<Value> KeyCore::accept(std::optional<Value> stored, uint64_t generation, bool cacheable) {
        if (!stored || stored->is_null()) {
            return std::nullopt;
        }
        Value value;
        try {
            value = from_stored(*stored);
        } catch (const KeepException& e) {
            drop_corrupt(e, generation);
            return std::nullopt;
        }
        if (value.is_null()) {
            return std::nullopt;
        }
        if (cacheable && !secure()) {
            std::lock_guard<std::mutex> lk(cache_mu_);
            // Anything invalidated since the fetch began makes this value stale
            if (generation_ == generation) {
                cache_ = value;
            }
        }
        return value;
    }

    KeyCore::Snapshot KeyCore::read_blocking() {
        engine_.wait_ready();
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lk(cache_mu_);
            if (!secure() && cache_) {
                return Snapshot{cache_, generation_};
            }
            generation = generation_;
        }

        std::optional<Value> stored;
        try {
            stored = target().read(desc_).get();
        } catch (const KeepException& e) {
            debug() << "read of " << desc_.physical_id << " failed: " << e.what();
            return Snapshot{std::nullopt, generation};
        }
        return Snapshot{accept(std::move(stored), generation, true), generation};
    }

    KeyCore::Snapshot KeyCore::read_now() {
        if (!engine_.is_ready()) {
            return Snapshot{};
        }
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lk(cache_mu_);
            if (!secure() && cache_) {
                return Snapshot{cache_, generation_};
            }
            generation = generation_;
        }
        // Runs outside the lane and may overtake queued writes: never cached
        return Snapshot{accept(target().read_sync(desc_), generation, false), generation};
    }

    std::shared_future<void> KeyCore::issue_write(const Value& value) {
        engine_.wait_ready();
        if (value.is_null()) {
            return issue_remove();
        }

        Value stored;
        try {
            stored = to_stored(value);
        } catch (const KeepException& e) {
            report(engine_.error_sink(), e);
            throw;
        }

        invalidate_cache();
        std::shared_future<void> done = target().write(desc_, stored).share();
        throw_if_refused(done);
        publish(ChangeKind::Written);
        return done;
    }

    std::shared_future<void> KeyCore::issue_remove() {
        engine_.wait_ready();
        invalidate_cache();
        std::shared_future<void> done = target().remove(desc_).share();
        throw_if_refused(done);

        if (desc_.parent) {
            std::shared_ptr<KeyCore> parent = engine_.find_core(*desc_.parent);
            if (parent) {
                parent->sub_key_registry().unregister_name(desc_.logical_name);
            }
        }
        publish(ChangeKind::Removed);
        return done;
    }

    bool KeyCore::exists_blocking() {
        engine_.wait_ready();
        return target().exists(desc_).get();
    }

    bool KeyCore::exists_now() {
        return engine_.is_ready() && target().exists_sync(desc_);
    }

    void KeyCore::drop_corrupt(const KeepException& cause, uint64_t generation) {
        report(engine_.error_sink(),
               KeepException(cause.code(), "Unreadable value dropped", desc_.physical_id, cause.what()));
        {
            std::lock_guard<std::mutex> lk(cache_mu_);
            cache_.reset();
        }

        std::weak_ptr<KeyCore> weak = weak_from_this();
        // Settles on its own; a closed engine rejects it and the record stays
        std::future<void> queued = async<void>([weak, generation]() {
            if (std::shared_ptr<KeyCore> self = weak.lock()) {
                self->remove_if_unchanged(generation);
            }
        });
    }

    void KeyCore::remove_if_unchanged(uint64_t generation) {
        {
            std::lock_guard<std::mutex> lk(cache_mu_);
            if (generation_ != generation) {
                debug() << desc_.physical_id << " was rewritten, not dropping it";
                return;
            }
        }
        try {
            issue_remove().get();
        } catch (const KeepException& e) {
            warning() << "cannot drop " << desc_.physical_id << ": " << e.what();
        }
    }

    void KeyCore::invalidate_cache() {
        std::lock_guard<std::mutex> lk(cache_mu_);
        cache_.reset();
        ++generation_;
    }

    void KeyCore::notify_cleared() {
        invalidate_cache();
        publish(ChangeKind::Cleared);
    }

    void KeyCore::report_error(const KeepException& e) const {
        report(engine_.error_sink(), e);
    }

    std::shared_ptr<KeyCore> KeyCore::child(const std::string& sub) {
        std::shared_ptr<KeyCore> core = engine_.child_core(*this, sub);
        subs_.register_name(sub);
        return core;
    }

    std::vector<std::string> KeyCore::list_sub_keys() {
        engine_.wait_ready();
        const Encryptor& encryptor = engine_.encryptor();
        return subs_.list(discovery_stores(), [&encryptor](persist::Storage& store, const std::string& id) {
            return recover_secure_name(store, id, encryptor);
        });
    }

    void KeyCore::clear_sub_keys_blocking() {
        engine_.wait_ready();
        std::vector<std::string> removed = subs_.clear(discovery_stores());
        for (const auto& id : removed) {
            std::shared_ptr<KeyCore> core = engine_.find_core(id);
            if (core) {
                core->notify_cleared();
            }
        }
        debug() << "cleared " << removed.size() << " sub-key record(s) of " << desc_.physical_id;
    }

    Subscription KeyCore::subscribe(ChangeNotifier::Listener listener) {
        return engine_.notifier().subscribe(desc_.physical_id, std::move(listener));
    }

    void KeyCore::publish(ChangeKind kind) const {
        engine_.notifier().publish(KeyChange{desc_.physical_id, desc_.logical_name, kind});
    }

    std::optional<std::string> KeyCore::recover_secure_name(persist::Storage& store,
                                                            const std::string& physical_id,
                                                            const Encryptor& encryptor) {
        std::optional<RecordHeader> h = store.header(physical_id);
        if (!h || !h->secure()) {
            return std::nullopt;
        }
        KeyDescriptor desc;
        desc.physical_id = physical_id;
        desc.secure = true;

        std::optional<Value> stored = store.read_sync(desc);
        if (!stored) {
            return std::nullopt;
        }
        try {
            Value json = open_envelope(*stored, encryptor, physical_id);
            const Value* name = json.find(ENVELOPE_NAME);
            if (name && name->is_string()) {
                return name->as_string();
            }
        } catch (const KeepException& e) {
            debug() << "no name recoverable from " << physical_id << ": " << e.what();
        }
        return std::nullopt;
    }

} // namespace keep
