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

#include "consolidated_store.h"
#include "platform_fs.h"
#include "../util/log.h"

#include <cerrno>
#include <filesystem>

namespace keep::persist {

static const char* SAVE_ID = "main";

ConsolidatedStore::~ConsolidatedStore() {
  dispose();
}

void ConsolidatedStore::init(const StorageContext& ctx) {
  if (!ctx.io_pool) {
    throw KeepException(ErrorCode::Initialization, "Consolidated store needs an io pool");
  }
  config_ = ctx.config;
  on_error_ = ctx.on_error;
  path_ = (std::filesystem::path(ctx.root) / config_.main_file_name).string();
  writer_ = std::make_unique<WriteCoordinator>(*ctx.io_pool, on_error_, "main");

  auto [sz, size] = PlatformFS::file_size(path_);
  if (!sz.ok) {
    if (sz.err != ENOENT) {
      throw KeepException(ErrorCode::Initialization, "Cannot stat consolidated file " + path_, "",
                          errnoWithDescription(sz.err));
    }
    FSResult r = PlatformFS::write_file_atomic(path_, ByteBuffer(), config_.sync_writes);
    if (!r.ok) {
      throw KeepException(ErrorCode::Initialization, "Cannot create consolidated file " + path_, "",
                          errnoWithDescription(r.err));
    }
    info() << "created empty consolidated file " << path_;
    return;
  }

  auto [rr, bytes] = PlatformFS::read_file(path_);
  if (!rr.ok) {
    throw KeepException(ErrorCode::Initialization, "Cannot read consolidated file " + path_, "",
                        errnoWithDescription(rr.err));
  }

  try {
    RecordMap loaded = decode_all(bytes);
    std::lock_guard<std::mutex> lk(mu_);
    memory_ = std::move(loaded);
    debug() << "loaded " << memory_.size() << " record(s) from " << path_;
  } catch (const KeepException& e) {
    // Availability over the corrupt file: drop it and start empty
    report(on_error_, KeepException(ErrorCode::Initialization,
                                    "Failed to initialize internal storage", "", e.what()));
    FSResult r = PlatformFS::remove_file(path_);
    if (!r.ok) {
      warning() << "could not delete corrupt " << path_ << ": " << errnoWithDescription(r.err);
    }
    std::lock_guard<std::mutex> lk(mu_);
    memory_.clear();
  }
}

std::future<void> ConsolidatedStore::schedule_save_locked() {
  auto snapshot = std::make_shared<const RecordMap>(memory_);
  std::string path = path_;
  bool sync = config_.sync_writes;

  return writer_->run<void>(SAVE_ID, [snapshot, path, sync]() {
    ByteBuffer bytes = encode_all(*snapshot);
    FSResult r = PlatformFS::write_file_atomic(path, bytes, sync);
    if (!r.ok) {
      throw KeepException(ErrorCode::IO, "Failed to save " + path, "", errnoWithDescription(r.err));
    }
    trace() << "saved " << snapshot->size() << " record(s), " << bytes.size() << " bytes";
  }, config_.save_debounce);
}

std::future<std::optional<Value>> ConsolidatedStore::read(const KeyDescriptor& key) {
  return ready_future(read_sync(key));
}

std::optional<Value> ConsolidatedStore::read_sync(const KeyDescriptor& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = memory_.find(key.physical_id);
  if (it == memory_.end()) {
    return std::nullopt;
  }
  return it->second.value;
}

std::future<void> ConsolidatedStore::write(const KeyDescriptor& key, const Value& value) {
  if (value.is_null()) {
    return remove(key);
  }

  StoredRecord rec;
  rec.header.version = Codec::current().version();
  rec.header.flags = key.flags();
  rec.header.type = value.type();
  rec.header.physical_id = key.physical_id;
  rec.header.logical_name = key.stored_name();
  rec.value = value;

  // Fail fast on records the codec would refuse at save time
  try {
    Codec::current().encode(rec.header.physical_id, rec.header.logical_name, rec.value, rec.header.flags);
  } catch (const KeepException& e) {
    report(on_error_, e);
    return failed_future<void>(e);
  }

  std::lock_guard<std::mutex> lk(mu_);
  memory_[key.physical_id] = std::move(rec);
  return schedule_save_locked();
}

std::future<void> ConsolidatedStore::remove(const KeyDescriptor& key) {
  return remove_key(key.physical_id);
}

std::future<bool> ConsolidatedStore::exists(const KeyDescriptor& key) {
  return ready_future(exists_sync(key));
}

bool ConsolidatedStore::exists_sync(const KeyDescriptor& key) {
  std::lock_guard<std::mutex> lk(mu_);
  return memory_.count(key.physical_id) != 0;
}

std::vector<std::string> ConsolidatedStore::get_keys() {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> ids;
  ids.reserve(memory_.size());
  for (const auto& kv : memory_) {
    ids.push_back(kv.first);
  }
  return ids;
}

std::future<void> ConsolidatedStore::remove_key(const std::string& physical_id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (memory_.erase(physical_id) == 0) {
    return ready_future();
  }
  return schedule_save_locked();
}

std::future<void> ConsolidatedStore::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  memory_.clear();
  return schedule_save_locked();
}

std::future<void> ConsolidatedStore::clear_removable() {
  std::lock_guard<std::mutex> lk(mu_);
  size_t removed = 0;
  for (auto it = memory_.begin(); it != memory_.end();) {
    if (it->second.header.removable()) {
      it = memory_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed == 0) {
    return ready_future();
  }
  debug() << "cleared " << removed << " removable record(s) from " << path_;
  return schedule_save_locked();
}

std::optional<RecordHeader> ConsolidatedStore::header(const std::string& physical_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = memory_.find(physical_id);
  if (it == memory_.end()) {
    return std::nullopt;
  }
  return it->second.header;
}

void ConsolidatedStore::flush() {
  if (writer_) writer_->flush();
}

void ConsolidatedStore::dispose() {
  // Pending saves still reach the disk before the coordinator goes away
  if (writer_) {
    writer_->flush();
    writer_->dispose();
  }
}

} // namespace keep::persist
