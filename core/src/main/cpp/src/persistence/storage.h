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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage_config.h"
#include "../codec/codec.h"
#include "../key/key_descriptor.h"
#include "../keep_exception.h"

namespace keep::persist {

class TaskPool;

// What the engine hands every backend at init
struct StorageContext {
  std::string root;           // <path>/<folder_name>
  StorageConfig config;
  ErrorSink on_error;
  TaskPool* io_pool = nullptr;
};

/**
 * Pluggable record backend.
 *
 * Records are addressed by KeyDescriptor::physical_id. Writing a null Value
 * removes the record. Futures carry KeepException on failure; read failures
 * caused by corrupt bytes resolve to nullopt instead and the record is
 * dropped.
 */
class Storage {
public:
  virtual ~Storage() = default;

  // Throws KeepException(Initialization)
  virtual void init(const StorageContext& ctx) = 0;

  virtual std::future<std::optional<Value>> read(const KeyDescriptor& key) = 0;
  virtual std::optional<Value> read_sync(const KeyDescriptor& key) = 0;

  virtual std::future<void> write(const KeyDescriptor& key, const Value& value) = 0;
  virtual std::future<void> remove(const KeyDescriptor& key) = 0;

  virtual std::future<bool> exists(const KeyDescriptor& key) = 0;
  virtual bool exists_sync(const KeyDescriptor& key) = 0;

  // Physical ids currently stored
  virtual std::vector<std::string> get_keys() = 0;

  // Physical ids known without touching the backing medium
  virtual std::vector<std::string> known_keys() { return get_keys(); }
  virtual std::future<void> remove_key(const std::string& physical_id) = 0;

  virtual std::future<void> clear() = 0;
  virtual std::future<void> clear_removable() = 0;

  virtual std::optional<RecordHeader> header(const std::string& physical_id) = 0;

  // Run pending persistence now and wait for it
  virtual void flush() {}

  // Resolve everything pending; no operation is valid afterwards
  virtual void dispose() {}
};

template <class T>
std::future<T> ready_future(T value) {
  std::promise<T> p;
  p.set_value(std::move(value));
  return p.get_future();
}

inline std::future<void> ready_future() {
  std::promise<void> p;
  p.set_value();
  return p.get_future();
}

template <class T>
std::future<T> failed_future(const KeepException& e) {
  std::promise<T> p;
  p.set_exception(std::make_exception_ptr(e));
  return p.get_future();
}

/**
 * Deferred future that waits for all of them and rethrows the first
 * failure. The underlying operations are already scheduled.
 */
inline std::future<void> when_all(std::vector<std::future<void>> futures) {
  auto shared = std::make_shared<std::vector<std::future<void>>>(std::move(futures));
  return std::async(std::launch::deferred, [shared]() {
    std::exception_ptr first;
    for (auto& f : *shared) {
      try {
        f.get();
      } catch (const KeepException&) {
        if (!first) first = std::current_exception();
      }
    }
    if (first) std::rethrow_exception(first);
  });
}

} // namespace keep::persist
