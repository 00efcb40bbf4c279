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

#include "keep.h"
#include "crypto/xor_encryptor.h"
#include "persistence/consolidated_store.h"
#include "persistence/platform_fs.h"
#include "persistence/record_store.h"
#include "persistence/task_pool.h"
#include "util/log.h"

#include <filesystem>

namespace keep {

    using persist::PlatformFS;

    namespace {
        const std::string DEFAULT_ENCRYPTION_KEY(32, '0');
    }

    Keep::Keep(KeepOptions options)
        : options_(std::move(options)),
          internal_(std::make_shared<persist::ConsolidatedStore>()),
          ready_(ready_promise_.get_future().share()) {
        initLoggingFromEnv();
        if (!options_.encryptor) {
            options_.encryptor = std::make_shared<XorEncryptor>(DEFAULT_ENCRYPTION_KEY);
        }
        external_ = options_.external_storage ? options_.external_storage
                                              : std::make_shared<persist::RecordStore>();
        if (!options_.config.validate()) {
            throw KeepException(ErrorCode::Initialization, "Invalid storage configuration");
        }
        io_ = std::make_unique<persist::TaskPool>(options_.config.io_threads, "keep-io");
        tasks_ = std::make_unique<persist::TaskPool>(options_.config.task_threads, "keep-task");
        // Failures surface through the key futures; the stores already reported them
        key_lanes_ = std::make_unique<persist::WriteCoordinator>(*tasks_, ErrorSink(), "keys");
    }

    Keep::~Keep() {
        try {
            close();
        } catch (const KeepException& e) {
            error() << "keep: close during destruction failed: " << e.what();
        }
    }

    void Keep::init(const std::string& path) {
        init(path, options_.config.folder_name);
    }

    void Keep::init(const std::string& path, const std::string& folder) {
        {
            std::lock_guard<std::mutex> lk(state_mu_);
            if (closed_) {
                throw KeepException(ErrorCode::NotInitialized, "Storage is closed");
            }
            if (state_ != State::Uninitialized) {
                throw KeepException(ErrorCode::Initialization, "init() called more than once");
            }
            state_ = State::Initializing;
        }

        std::string root;
        try {
            if (path.empty() || folder.empty() || folder.find('/') != std::string::npos) {
                throw KeepException(ErrorCode::Initialization, "Invalid storage location '" + path + "', '" + folder + "'");
            }
            root = (std::filesystem::path(path) / folder).string();

            persist::FSResult r = PlatformFS::ensure_directory(root);
            if (!r.ok) {
                throw KeepException(ErrorCode::Initialization, "Cannot create " + root, "", errnoWithDescription(r.err));
            }

            try {
                options_.encryptor->init();
            } catch (const std::exception& e) {
                throw KeepException(ErrorCode::Initialization, "Encryptor init failed", "", e.what());
            }

            const persist::StorageContext ctx{root, options_.config, options_.on_error, io_.get()};
            auto internal = std::async(std::launch::async, [this, &ctx]() { internal_->init(ctx); });
            auto external = std::async(std::launch::async, [this, &ctx]() { external_->init(ctx); });
            internal.wait();
            external.wait();
            internal.get();
            external.get();
        } catch (const KeepException& e) {
            report(options_.on_error, e);
            {
                std::lock_guard<std::mutex> lk(state_mu_);
                state_ = State::Failed;
            }
            ready_promise_.set_exception(std::current_exception());
            throw;
        } catch (const std::exception& e) {
            KeepException wrapped(ErrorCode::Initialization, "Storage init failed", "", e.what());
            report(options_.on_error, wrapped);
            {
                std::lock_guard<std::mutex> lk(state_mu_);
                state_ = State::Failed;
            }
            ready_promise_.set_exception(std::make_exception_ptr(wrapped));
            throw wrapped;
        }

        {
            std::lock_guard<std::mutex> lk(state_mu_);
            state_ = State::Ready;
        }
        ready_promise_.set_value();
        info() << "keep: ready at " << root;
    }

    Keep::State Keep::state() const {
        std::lock_guard<std::mutex> lk(state_mu_);
        return state_;
    }

    void Keep::wait_ready() const {
        ready_.get();
    }

    void Keep::validate_name(const std::string& name) {
        if (name.empty()) {
            throw KeepException(ErrorCode::InvalidKey, "Key name is empty");
        }
        if (name.size() > KEEP_MAX_NAME_BYTES) {
            throw KeepException(ErrorCode::InvalidKey, "Key name longer than 255 bytes", name.substr(0, 32));
        }
        if (name.find(KEEP_SEPARATOR) != std::string::npos || name.find('/') != std::string::npos) {
            throw KeepException(ErrorCode::InvalidKey, "Key name contains '$' or '/'", name);
        }
        // Record files are named after the key; these would collide with the directory or a temp file
        if (name == "." || name == "..") {
            throw KeepException(ErrorCode::InvalidKey, "Key name is a relative path", name);
        }
        const std::string tmp = persist::TMP_SUFFIX;
        if (name.size() >= tmp.size() && name.compare(name.size() - tmp.size(), tmp.size(), tmp) == 0) {
            throw KeepException(ErrorCode::InvalidKey, "Key name ends with " + tmp, name);
        }
    }

    std::shared_ptr<KeyCore> Keep::top_level_core(const std::string& name, const KeyOptions& options,
                                                  bool secure, std::type_index type) {
        KeyDescriptor desc;
        try {
            if (secure) {
                if (name.empty()) {
                    throw KeepException(ErrorCode::InvalidKey, "Key name is empty");
                }
            } else {
                validate_name(name);
            }
        } catch (const KeepException& e) {
            report(options_.on_error, e);
            throw;
        }
        desc.logical_name = name;
        desc.physical_id = secure ? hash_name(name) : name;
        desc.removable = options.removable;
        desc.secure = secure;
        desc.external = options.storage ? true : options.external.value_or(secure);
        return register_core(std::move(desc), secure, options.storage, type);
    }

    std::shared_ptr<KeyCore> Keep::child_core(const KeyCore& parent, const std::string& sub) {
        const KeyDescriptor& p = parent.descriptor();
        if (sub.empty()) {
            KeepException e(ErrorCode::InvalidKey, "Sub-key identifier is empty", p.physical_id);
            report(options_.on_error, e);
            throw e;
        }

        KeyDescriptor desc = p;
        desc.logical_name = sub;
        desc.physical_id = sub_key_id(p.physical_id, sub);
        desc.parent = p.physical_id;
        if (desc.physical_id.size() > KEEP_MAX_NAME_BYTES) {
            KeepException e(ErrorCode::InvalidKey, "Sub-key nested too deep", p.physical_id);
            report(options_.on_error, e);
            throw e;
        }
        return register_core(std::move(desc), parent.secure(), parent.storage_override(), parent.type());
    }

    std::shared_ptr<KeyCore> Keep::register_core(KeyDescriptor desc, bool secure,
                                                 std::shared_ptr<persist::Storage> storage,
                                                 std::type_index type) {
        std::lock_guard<std::mutex> lk(registry_mu_);
        auto it = registry_.find(desc.physical_id);
        if (it != registry_.end()) {
            const std::shared_ptr<KeyCore>& existing = it->second;
            if (existing->descriptor() == desc && existing->secure() == secure &&
                existing->type() == type && existing->storage_override() == storage) {
                return existing;
            }
            KeepException e(ErrorCode::KeyConflict,
                            "Key '" + desc.logical_name + "' already registered with another type or flags",
                            desc.physical_id);
            report(options_.on_error, e);
            throw e;
        }

        KeyCore::Mode mode = KeyCore::PlainMode{};
        if (secure) {
            mode = KeyCore::SecureMode{options_.encryptor};
        }
        auto core = std::make_shared<KeyCore>(*this, desc, std::move(mode), std::move(storage), type);
        registry_.emplace(desc.physical_id, core);
        trace() << "keep: registered key " << desc.physical_id;
        return core;
    }

    std::shared_ptr<KeyCore> Keep::find_core(const std::string& physical_id) const {
        std::lock_guard<std::mutex> lk(registry_mu_);
        auto it = registry_.find(physical_id);
        return it == registry_.end() ? nullptr : it->second;
    }

    void Keep::notify_cleared(bool removable_only) {
        std::vector<std::shared_ptr<KeyCore>> cores;
        {
            std::lock_guard<std::mutex> lk(registry_mu_);
            for (const auto& kv : registry_) {
                if (!removable_only || kv.second->descriptor().removable) {
                    cores.push_back(kv.second);
                }
            }
        }
        for (const auto& core : cores) {
            core->notify_cleared();
        }
    }

    std::future<void> Keep::clear() {
        try {
            return tasks_->async([this]() {
                wait_ready();
                std::vector<std::future<void>> pending;
                pending.push_back(external_->clear());
                pending.push_back(internal_->clear());
                persist::when_all(std::move(pending)).get();
                notify_cleared(false);
                info() << "keep: cleared all records";
            });
        } catch (const KeepException& e) {
            return persist::failed_future<void>(KeepException(ErrorCode::NotInitialized, "Storage is closed", "", e.what()));
        }
    }

    std::future<void> Keep::clear_removable() {
        try {
            return tasks_->async([this]() {
                wait_ready();
                std::vector<std::future<void>> pending;
                pending.push_back(external_->clear_removable());
                pending.push_back(internal_->clear_removable());
                persist::when_all(std::move(pending)).get();
                notify_cleared(true);
                info() << "keep: cleared removable records";
            });
        } catch (const KeepException& e) {
            return persist::failed_future<void>(KeepException(ErrorCode::NotInitialized, "Storage is closed", "", e.what()));
        }
    }

    std::vector<KeyDescriptor> Keep::keys() const {
        std::lock_guard<std::mutex> lk(registry_mu_);
        std::vector<KeyDescriptor> out;
        out.reserve(registry_.size());
        for (const auto& kv : registry_) {
            out.push_back(kv.second->descriptor());
        }
        return out;
    }

    std::vector<KeyDescriptor> Keep::removable_keys() const {
        std::vector<KeyDescriptor> out;
        for (auto& d : keys()) {
            if (d.removable) out.push_back(std::move(d));
        }
        return out;
    }

    std::vector<std::string> Keep::internal_keys() {
        wait_ready();
        return internal_->get_keys();
    }

    std::vector<std::string> Keep::external_keys() {
        wait_ready();
        return external_->get_keys();
    }

    Subscription Keep::subscribe(ChangeNotifier::Listener listener) {
        return notifier_.subscribe(std::move(listener));
    }

    persist::Storage& Keep::internal_storage() {
        return *internal_;
    }

    persist::Storage& Keep::external_storage() {
        return *external_;
    }

    void Keep::flush() {
        if (!is_ready()) {
            return;
        }
        key_lanes_->flush();
        internal_->flush();
        external_->flush();
    }

    void Keep::close() {
        bool was_ready;
        {
            std::lock_guard<std::mutex> lk(state_mu_);
            if (closed_) {
                return;
            }
            if (tasks_->on_worker() || io_->on_worker()) {
                throw KeepException(ErrorCode::Internal, "close() called from a storage worker");
            }
            closed_ = true;
            was_ready = state_ == State::Ready;
            if (state_ == State::Uninitialized) {
                state_ = State::Failed;
                ready_promise_.set_exception(std::make_exception_ptr(
                    KeepException(ErrorCode::NotInitialized, "Storage closed before init")));
            }
        }

        if (was_ready) {
            flush();
        }
        // Queued key operations finish against live stores
        key_lanes_->dispose();
        tasks_->stop();
        internal_->dispose();
        external_->dispose();
        io_->stop();
        if (was_ready) {
            info() << "keep: closed";
        }
    }

} // namespace keep
