// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_set>

#include <npbind/common.hpp>
#include <npbind/export.hpp>
#include <npbind/impl/handle_table.hpp>

namespace npbind::impl {

struct CollectionSignal {
  Handle handle;
};

/**
 * @brief Tells the foreign side which exposed objects only it keeps alive.
 *
 * Every newly exposed handle is watched. A collection cycle checks whether
 * the handle table holds the last strong reference and, if so, queues one
 * CollectionSignal and drops the watch. Draining a signal releases the
 * handle, which finalizes the object.
 */
class NPBIND_API LifecycleMonitor
{
  HandleTable& table_;
  const std::size_t capacity_;
  const OverflowPolicy policy_;

  // taken after queue_mut_ when both are held
  mutable std::mutex watch_mut_;
  std::unordered_set<Handle> watched_;

  mutable std::mutex queue_mut_;
  std::condition_variable queue_cv_;
  std::deque<CollectionSignal> queue_;
  bool stopped_ = false;

  std::atomic<std::uint64_t> dropped_{0};

  // how often a waiting drain re-runs the collection cycle
  static constexpr std::chrono::milliseconds poll_interval{10};

  enum class EmitResult { Queued, Full };
  EmitResult emit(Handle h);
  bool pop(CollectionSignal& sig);

public:
  LifecycleMonitor(HandleTable& table,
                   std::size_t capacity,
                   OverflowPolicy policy);

  void on_exposed(Handle h, const ObjectRef& obj);

  // The foreign side released the handle explicitly
  void on_released(Handle h) noexcept;

  // One collection cycle, returns the number of signals emitted
  std::size_t collect();

  // Runs collection cycles and releases the handles of drained signals
  // until `max` signals were drained or `timeout` expired. A zero timeout
  // polls once.
  std::size_t drain_signals(std::size_t max,
                            std::chrono::milliseconds timeout);

  // Wakes every waiter, later drains return immediately
  void shutdown() noexcept;

  std::size_t watched() const;
  std::size_t pending() const;
  std::uint64_t dropped() const noexcept
  {
    return dropped_.load(std::memory_order_relaxed);
  }
};

} // namespace npbind::impl
