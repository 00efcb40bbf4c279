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
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>

#include "task_pool.h"
#include "../keep_exception.h"

namespace keep::persist {

// How a result type resolves when its operation is replaced before it ran
template <class T>
struct SupersededResult {
  static void resolve(std::promise<T>& p, const std::string& id) {
    p.set_exception(std::make_exception_ptr(
        KeepException(ErrorCode::Superseded, "Operation replaced by a newer one", id)));
  }
};

template <>
struct SupersededResult<void> {
  static void resolve(std::promise<void>& p, const std::string&) { p.set_value(); }
};

template <class U>
struct SupersededResult<std::optional<U>> {
  static void resolve(std::promise<std::optional<U>>& p, const std::string&) { p.set_value(std::nullopt); }
};

/**
 * Per-id debounce plus strictly sequential execution.
 *
 * run(id, action, delay) parks the action for `delay`. Another run() for the
 * same id while it is still parked replaces it; the replaced caller's future
 * resolves through SupersededResult. Once due, the action joins the FIFO
 * lane of its id: at most one action per id executes at a time, distinct
 * ids run in parallel on the task pool.
 *
 * Action errors are wrapped into KeepException, reported to the sink and
 * set on the caller's future. An action already executing always runs to
 * completion.
 */
class WriteCoordinator {
public:
  using clock = std::chrono::steady_clock;

  WriteCoordinator(TaskPool& pool, ErrorSink sink, std::string name);
  ~WriteCoordinator();

  WriteCoordinator(const WriteCoordinator&) = delete;
  WriteCoordinator& operator=(const WriteCoordinator&) = delete;

  template <class T>
  std::future<T> run(const std::string& id, std::function<T()> action,
                     std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> fut = promise->get_future();

    auto op = std::make_shared<Op>();
    op->execute = [this, id, promise, action = std::move(action)]() {
      try {
        if constexpr (std::is_void_v<T>) {
          action();
          promise->set_value();
        } else {
          promise->set_value(action());
        }
      } catch (const KeepException& e) {
        fail(*promise, e);
      } catch (const std::exception& e) {
        fail(*promise, KeepException(ErrorCode::Internal, "Storage action failed", id, e.what()));
      }
    };
    op->supersede = [promise, id]() { SupersededResult<T>::resolve(*promise, id); };
    op->reject = [promise, id, name = name_]() {
      promise->set_exception(std::make_exception_ptr(
          KeepException(ErrorCode::NotInitialized, "Write coordinator " + name + " is disposed", id)));
    };

    schedule(id, std::move(op), delay);
    return fut;
  }

  /**
   * Make every parked operation due now and wait until all lanes are idle.
   * Must not be called from inside an action.
   */
  void flush();

  /**
   * Supersede every parked operation, let queued ones finish, stop the
   * timer thread. Later run() calls fail with NotInitialized.
   */
  void dispose();

  // Parked plus queued plus executing
  size_t pending() const;

  uint64_t executed_count() const { return executed_.load(std::memory_order_relaxed); }
  uint64_t superseded_count() const { return superseded_.load(std::memory_order_relaxed); }

private:
  struct Op {
    std::function<void()> execute;
    std::function<void()> supersede;
    std::function<void()> reject;
    clock::time_point due;
  };

  struct Lane {
    std::deque<std::shared_ptr<Op>> ready;
    bool active = false;
  };

  template <class T>
  void fail(std::promise<T>& p, const KeepException& e) {
    report(sink_, e);
    p.set_exception(std::make_exception_ptr(e));
  }

  void schedule(const std::string& id, std::shared_ptr<Op> op, std::chrono::milliseconds delay);
  void enqueue_locked(const std::string& id, std::shared_ptr<Op> op);
  void run_next(const std::string& id);
  void timer_loop();

  TaskPool& pool_;
  ErrorSink sink_;
  std::string name_;

  mutable std::mutex mu_;
  std::condition_variable timer_cv_;
  std::condition_variable idle_cv_;
  std::map<std::string, std::shared_ptr<Op>> parked_;
  std::map<std::string, Lane> lanes_;
  size_t in_lanes_ = 0;
  bool disposed_ = false;

  std::atomic<uint64_t> executed_{0};
  std::atomic<uint64_t> superseded_{0};

  std::thread timer_;
};

} // namespace keep::persist
