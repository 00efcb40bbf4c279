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
 * One file per record under <root>/<external_dir_name>/<physical id>.
 *
 * read/write/remove of an id go through the write coordinator lane of that
 * id, so no reader sees a half-written file and writers never race. A
 * header cache filled at init from bounded prefix reads answers exists()
 * and sub-key discovery without touching payloads.
 */
class RecordStore : public Storage {
public:
  RecordStore() = default;
  ~RecordStore() override;

  void init(const StorageContext& ctx) override;

  std::future<std::optional<Value>> read(const KeyDescriptor& key) override;

  // Blocking file read outside the coordinator; safe because writes are renames
  std::optional<Value> read_sync(const KeyDescriptor& key) override;

  std::future<void> write(const KeyDescriptor& key, const Value& value) override;
  std::future<void> remove(const KeyDescriptor& key) override;

  std::future<bool> exists(const KeyDescriptor& key) override;
  bool exists_sync(const KeyDescriptor& key) override;

  // File names in the directory, temp files excluded
  std::vector<std::string> get_keys() override;
  std::future<void> remove_key(const std::string& physical_id) override;

  std::future<void> clear() override;
  std::future<void> clear_removable() override;

  std::optional<RecordHeader> header(const std::string& physical_id) override;

  void flush() override;
  void dispose() override;

  const std::string& directory() const { return dir_; }

  // Ids currently in the header cache
  std::vector<std::string> known_keys() override;

private:
  std::string path_for(const std::string& physical_id) const;

  // Shared by read() and read_sync(); drops undecodable files
  std::optional<Value> load(const std::string& physical_id);

  std::optional<RecordHeader> read_header_from_disk(const std::string& physical_id);

  std::string dir_;
  StorageConfig config_;
  ErrorSink on_error_;
  std::unique_ptr<WriteCoordinator> writer_;

  mutable std::mutex cache_mu_;
  std::map<std::string, RecordHeader> headers_;
};

} // namespace keep::persist
