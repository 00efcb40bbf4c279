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

#include "record_store.h"
#include "platform_fs.h"
#include "../util/log.h"

#include <cerrno>
#include <filesystem>

namespace keep::persist {

static bool is_temp_name(const std::string& name) {
  const std::string suffix = TMP_SUFFIX;
  return name.size() >= suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

RecordStore::~RecordStore() {
  dispose();
}

std::string RecordStore::path_for(const std::string& physical_id) const {
  return (std::filesystem::path(dir_) / physical_id).string();
}

void RecordStore::init(const StorageContext& ctx) {
  if (!ctx.io_pool) {
    throw KeepException(ErrorCode::Initialization, "Record store needs an io pool");
  }
  config_ = ctx.config;
  on_error_ = ctx.on_error;
  dir_ = (std::filesystem::path(ctx.root) / config_.external_dir_name).string();
  writer_ = std::make_unique<WriteCoordinator>(*ctx.io_pool, on_error_, "external");

  FSResult r = PlatformFS::ensure_directory(dir_);
  if (!r.ok) {
    throw KeepException(ErrorCode::Initialization, "Cannot create " + dir_, "",
                        errnoWithDescription(r.err));
  }

  auto [lr, names] = PlatformFS::list_files(dir_);
  if (!lr.ok) {
    throw KeepException(ErrorCode::Initialization, "Cannot list " + dir_, "",
                        errnoWithDescription(lr.err));
  }

  size_t loaded = 0;
  for (const auto& name : names) {
    if (is_temp_name(name)) {
      // Left behind by a write interrupted before its rename
      FSResult rm = PlatformFS::remove_file(path_for(name));
      if (rm.ok) {
        info() << "removed orphaned temp file " << name;
      } else {
        warning() << "cannot remove orphaned temp file " << name << ": " << errnoWithDescription(rm.err);
      }
      continue;
    }
    if (read_header_from_disk(name)) {
      ++loaded;
    } else {
      warning() << "unreadable record header in " << path_for(name);
    }
  }
  debug() << "indexed " << loaded << " record header(s) in " << dir_;
}

std::optional<RecordHeader> RecordStore::read_header_from_disk(const std::string& physical_id) {
  auto [r, prefix] = PlatformFS::read_prefix(path_for(physical_id), config_.header_prefix_bytes);
  if (!r.ok || prefix.empty()) {
    return std::nullopt;
  }
  std::optional<RecordHeader> h = parse_header(prefix.data(), prefix.size());
  if (h) {
    std::lock_guard<std::mutex> lk(cache_mu_);
    headers_[physical_id] = *h;
  }
  return h;
}

std::optional<Value> RecordStore::load(const std::string& physical_id) {
  const std::string path = path_for(physical_id);
  auto [r, bytes] = PlatformFS::read_file(path);
  if (!r.ok) {
    if (r.err == ENOENT) {
      return std::nullopt;
    }
    throw KeepException(ErrorCode::IO, "Failed to read " + path, physical_id, errnoWithDescription(r.err));
  }

  std::optional<StoredRecord> rec = decode_record(bytes);
  if (rec) {
    return std::move(rec->value);
  }

  report(on_error_, KeepException(ErrorCode::Codec, "Corrupt record dropped", physical_id,
                                  std::to_string(bytes.size()) + " bytes undecodable"));
  FSResult rm = PlatformFS::remove_file(path);
  if (!rm.ok) {
    warning() << "cannot remove corrupt record " << path << ": " << errnoWithDescription(rm.err);
  }
  std::lock_guard<std::mutex> lk(cache_mu_);
  headers_.erase(physical_id);
  return std::nullopt;
}

std::future<std::optional<Value>> RecordStore::read(const KeyDescriptor& key) {
  const std::string id = key.physical_id;
  return writer_->run<std::optional<Value>>(id, [this, id]() { return load(id); });
}

std::optional<Value> RecordStore::read_sync(const KeyDescriptor& key) {
  try {
    return load(key.physical_id);
  } catch (const KeepException& e) {
    report(on_error_, e);
    return std::nullopt;
  }
}

std::future<void> RecordStore::write(const KeyDescriptor& key, const Value& value) {
  if (value.is_null()) {
    return remove(key);
  }

  const std::string id = key.physical_id;
  ByteBuffer bytes;
  try {
    bytes = Codec::current().encode(id, key.stored_name(), value, key.flags());
  } catch (const KeepException& e) {
    report(on_error_, e);
    return failed_future<void>(e);
  }

  RecordHeader h;
  h.version = Codec::current().version();
  h.flags = key.flags();
  h.type = value.type();
  h.physical_id = id;
  h.logical_name = key.stored_name();

  auto payload = std::make_shared<const ByteBuffer>(std::move(bytes));
  return writer_->run<void>(id, [this, id, payload, h]() {
    const std::string path = path_for(id);
    FSResult r = PlatformFS::write_file_atomic(path, *payload, config_.sync_writes);
    if (!r.ok) {
      throw KeepException(ErrorCode::IO, "Failed to write " + path, id, errnoWithDescription(r.err));
    }
    std::lock_guard<std::mutex> lk(cache_mu_);
    headers_[id] = h;
  });
}

std::future<void> RecordStore::remove(const KeyDescriptor& key) {
  return remove_key(key.physical_id);
}

std::future<void> RecordStore::remove_key(const std::string& physical_id) {
  const std::string id = physical_id;
  return writer_->run<void>(id, [this, id]() {
    const std::string path = path_for(id);
    FSResult r = PlatformFS::remove_file(path);
    if (!r.ok) {
      throw KeepException(ErrorCode::IO, "Failed to delete " + path, id, errnoWithDescription(r.err));
    }
    std::lock_guard<std::mutex> lk(cache_mu_);
    headers_.erase(id);
  });
}

std::future<bool> RecordStore::exists(const KeyDescriptor& key) {
  return ready_future(exists_sync(key));
}

bool RecordStore::exists_sync(const KeyDescriptor& key) {
  std::lock_guard<std::mutex> lk(cache_mu_);
  return headers_.count(key.physical_id) != 0;
}

std::vector<std::string> RecordStore::get_keys() {
  std::vector<std::string> ids;
  auto [r, names] = PlatformFS::list_files(dir_);
  if (!r.ok) {
    report(on_error_, KeepException(ErrorCode::IO, "Cannot list " + dir_, "", errnoWithDescription(r.err)));
    return ids;
  }
  for (auto& name : names) {
    if (!is_temp_name(name)) {
      ids.push_back(std::move(name));
    }
  }
  return ids;
}

std::vector<std::string> RecordStore::known_keys() {
  std::lock_guard<std::mutex> lk(cache_mu_);
  std::vector<std::string> ids;
  ids.reserve(headers_.size());
  for (const auto& kv : headers_) {
    ids.push_back(kv.first);
  }
  return ids;
}

std::future<void> RecordStore::clear() {
  std::vector<std::future<void>> pending;
  for (const auto& id : get_keys()) {
    pending.push_back(remove_key(id));
  }
  return when_all(std::move(pending));
}

std::future<void> RecordStore::clear_removable() {
  std::vector<std::string> removable;
  {
    std::lock_guard<std::mutex> lk(cache_mu_);
    for (const auto& kv : headers_) {
      if (kv.second.removable()) {
        removable.push_back(kv.first);
      }
    }
  }

  std::vector<std::future<void>> pending;
  for (const auto& id : removable) {
    pending.push_back(remove_key(id));
  }
  if (!removable.empty()) {
    debug() << "clearing " << removable.size() << " removable record file(s)";
  }
  return when_all(std::move(pending));
}

std::optional<RecordHeader> RecordStore::header(const std::string& physical_id) {
  {
    std::lock_guard<std::mutex> lk(cache_mu_);
    auto it = headers_.find(physical_id);
    if (it != headers_.end()) {
      return it->second;
    }
  }
  return read_header_from_disk(physical_id);
}

void RecordStore::flush() {
  if (writer_) writer_->flush();
}

void RecordStore::dispose() {
  if (writer_) {
    writer_->flush();
    writer_->dispose();
  }
}

} // namespace keep::persist
