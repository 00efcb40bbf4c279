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

#include "write_coordinator.h"
#include "../util/log.h"

#include <vector>

namespace keep::persist {

WriteCoordinator::WriteCoordinator(TaskPool& pool, ErrorSink sink, std::string name)
  : pool_(pool), sink_(std::move(sink)), name_(std::move(name)) {
  timer_ = std::thread([this]{ timer_loop(); });
}

WriteCoordinator::~WriteCoordinator() {
  dispose();
}

void WriteCoordinator::schedule(const std::string& id, std::shared_ptr<Op> op,
                                std::chrono::milliseconds delay) {
  std::shared_ptr<Op> replaced;
  {
    std::unique_lock<std::mutex> lk(mu_);
    if (disposed_) {
      lk.unlock();
      op->reject();
      return;
    }

    auto it = parked_.find(id);
    if (it != parked_.end()) {
      replaced = std::move(it->second);
      parked_.erase(it);
    }

    if (delay.count() <= 0) {
      enqueue_locked(id, std::move(op));
    } else {
      op->due = clock::now() + delay;
      parked_[id] = std::move(op);
    }
  }

  if (replaced) {
    superseded_.fetch_add(1, std::memory_order_relaxed);
    trace() << name_ << ": superseded parked operation for " << id;
    replaced->supersede();
  }
  timer_cv_.notify_one();
  idle_cv_.notify_all();
}

void WriteCoordinator::enqueue_locked(const std::string& id, std::shared_ptr<Op> op) {
  Lane& lane = lanes_[id];
  lane.ready.push_back(std::move(op));
  ++in_lanes_;
  if (lane.active) {
    return;
  }

  lane.active = true;
  try {
    pool_.submit([this, id]{ run_next(id); });
  } catch (const KeepException& e) {
    // Pool already stopped: nothing will drain this lane
    error() << name_ << ": " << e.what();
    for (auto& pending : lane.ready) {
      pending->reject();
    }
    in_lanes_ -= lane.ready.size();
    lanes_.erase(id);
  }
}

void WriteCoordinator::run_next(const std::string& id) {
  std::shared_ptr<Op> op;
  {
    std::lock_guard<std::mutex> lk(mu_);
    Lane& lane = lanes_[id];
    op = std::move(lane.ready.front());
    lane.ready.pop_front();
  }

  op->execute();
  executed_.fetch_add(1, std::memory_order_relaxed);

  {
    std::lock_guard<std::mutex> lk(mu_);
    --in_lanes_;
    auto it = lanes_.find(id);
    if (it->second.ready.empty()) {
      lanes_.erase(it);
    } else {
      try {
        pool_.submit([this, id]{ run_next(id); });
      } catch (const KeepException& e) {
        error() << name_ << ": " << e.what();
        for (auto& pending : it->second.ready) {
          pending->reject();
        }
        in_lanes_ -= it->second.ready.size();
        lanes_.erase(it);
      }
    }
    // Under the lock: dispose() may return, and the owner destroy us, once it sees the lanes idle
    idle_cv_.notify_all();
  }
}

void WriteCoordinator::timer_loop() {
  Logger::get().setThreadName("keep-timer-" + name_);

  std::unique_lock<std::mutex> lk(mu_);
  while (!disposed_) {
    if (parked_.empty()) {
      timer_cv_.wait(lk);
      continue;
    }

    const auto now = clock::now();
    auto earliest = clock::time_point::max();
    for (auto it = parked_.begin(); it != parked_.end();) {
      if (it->second->due <= now) {
        enqueue_locked(it->first, std::move(it->second));
        it = parked_.erase(it);
      } else {
        earliest = std::min(earliest, it->second->due);
        ++it;
      }
    }

    if (!parked_.empty()) {
      timer_cv_.wait_until(lk, earliest);
    }
  }
}

void WriteCoordinator::flush() {
  std::unique_lock<std::mutex> lk(mu_);
  for (;;) {
    for (auto& kv : parked_) {
      enqueue_locked(kv.first, std::move(kv.second));
    }
    parked_.clear();
    if (in_lanes_ == 0) {
      break;
    }
    idle_cv_.wait(lk);
  }
}

void WriteCoordinator::dispose() {
  std::vector<std::shared_ptr<Op>> replaced;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!disposed_) {
      disposed_ = true;
      for (auto& kv : parked_) {
        replaced.push_back(std::move(kv.second));
      }
      parked_.clear();
    }
  }
  timer_cv_.notify_all();

  for (auto& op : replaced) {
    superseded_.fetch_add(1, std::memory_order_relaxed);
    op->supersede();
  }
  if (!replaced.empty()) {
    debug() << name_ << ": disposed with " << replaced.size() << " parked operation(s)";
  }

  {
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [&]{ return in_lanes_ == 0; });
  }

  if (timer_.joinable()) {
    timer_.join();
  }
}

size_t WriteCoordinator::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return parked_.size() + in_lanes_;
}

} // namespace keep::persist
