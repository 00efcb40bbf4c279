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
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "storage.h"
#include "write_coordinator.h"

namespace keep::persist {

/**
 * All small records held in memory and mirrored to one file.
 *
 * Reads never touch the disk. Every mutation updates the map at once and
 * schedules a debounced save under the single id "main"; the save encodes
 * a snapshot of the map taken when it was scheduled and replaces the file
 * atomically.
 */
class ConsolidatedStore : public Storage {
public:
  ConsolidatedStore() = default;
  ~ConsolidatedStore() override;

  void init(const StorageContext& ctx) override;

  std::future<std::optional<Value>> read(const KeyDescriptor& key) override;
  std::optional<Value> read_sync(const KeyDescriptor& key) override;

  std::future<void> write(const KeyDescriptor& key, const Value& value) override;
  std::future<void> remove(const KeyDescriptor& key) override;

  std::future<bool> exists(const KeyDescriptor& key) override;
  bool exists_sync(const KeyDescriptor& key) override;

  std::vector<std::string> get_keys() override;
  std::future<void> remove_key(const std::string& physical_id) override;

  std::future<void> clear() override;
  std::future<void> clear_removable() override;

  std::optional<RecordHeader> header(const std::string& physical_id) override;

  void flush() override;
  void dispose() override;

  const std::string& path() const { return path_; }

private:
  using RecordMap = std::map<std::string, StoredRecord>;

  // Caller holds mu_
  std::future<void> schedule_save_locked();

  std::string path_;
  StorageConfig config_;
  ErrorSink on_error_;
  std::unique_ptr<WriteCoordinator> writer_;

  std::mutex mu_;
  RecordMap memory_;
};

} // namespace keep::persist
