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

#include "task_pool.h"
#include "../keep_exception.h"
#include "../util/log.h"

#include <algorithm>

namespace keep::persist {

TaskPool::TaskPool(size_t threads, std::string name_prefix)
  : name_prefix_(std::move(name_prefix)) {
  threads = std::max<size_t>(threads, 1);
  threads_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    threads_.emplace_back([this, i]{ worker(i); });
  }
}

TaskPool::~TaskPool() {
  try {
    stop();
  } catch (const KeepException& e) {
    severe() << e.what();
  }
}

void TaskPool::submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) {
      throw KeepException(ErrorCode::Internal, "Task pool " + name_prefix_ + " is stopped");
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void TaskPool::stop() {
  if (on_worker()) {
    throw KeepException(ErrorCode::Internal, "Task pool " + name_prefix_ + " stopped from its own worker");
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) return;
    stopping_ = true;
  }
  cv_.notify_all();

  for (auto& th : threads_) {
    if (th.joinable()) th.join();
  }
}

bool TaskPool::on_worker() const {
  const std::thread::id self = std::this_thread::get_id();
  for (const auto& th : threads_) {
    if (th.get_id() == self) return true;
  }
  return false;
}

void TaskPool::worker(size_t index) {
  Logger::get().setThreadName(name_prefix_ + "-" + std::to_string(index));

  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&]{ return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return;  // stopping and drained
      task = std::move(queue_.front());
      queue_.pop_front();
    }

    try {
      task();
    } catch (const std::exception& e) {
      severe() << "uncaught exception in " << name_prefix_ << " task: " << e.what();
    }
  }
}

} // namespace keep::persist
