// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <vector>

#include <npbind/impl/lifecycle_monitor.hpp>

#include "logging.hpp"

namespace npbind::impl {

LifecycleMonitor::LifecycleMonitor(HandleTable& table,
                                   std::size_t capacity,
                                   OverflowPolicy policy)
    : table_{table}
    , capacity_{capacity}
    , policy_{policy}
{
  if (capacity_ == 0)
    throw Exception("signal queue capacity must be greater than zero");
}

void LifecycleMonitor::on_exposed(Handle h, const ObjectRef& obj)
{
  NPBIND_LOG_TRACE("watching handle {} ({})", h.value(),
                   static_cast<const void*>(obj.get()));
  std::lock_guard<std::mutex> lk(watch_mut_);
  watched_.insert(h);
}

void LifecycleMonitor::on_released(Handle h) noexcept
{
  std::lock_guard<std::mutex> lk(watch_mut_);
  watched_.erase(h);
}

LifecycleMonitor::EmitResult LifecycleMonitor::emit(Handle h)
{
  std::lock_guard<std::mutex> lk(queue_mut_);
  if (queue_.size() >= capacity_) {
    if (policy_ == OverflowPolicy::Backpressure)
      return EmitResult::Full;
    auto oldest = queue_.front();
    queue_.pop_front();
    dropped_.fetch_add(1, std::memory_order_relaxed);
    NPBIND_LOG_WARN("signal queue is full, dropped signal for handle {}",
                    oldest.handle.value());
    // watched again, a later cycle signals it anew
    std::lock_guard<std::mutex> watch_lk(watch_mut_);
    watched_.insert(oldest.handle);
  }
  queue_.push_back(CollectionSignal{h});
  return EmitResult::Queued;
}

std::size_t LifecycleMonitor::collect()
{
  std::vector<Handle> candidates;
  {
    std::lock_guard<std::mutex> lk(watch_mut_);
    candidates.assign(watched_.begin(), watched_.end());
  }

  std::size_t emitted = 0;
  bool backpressure = false;

  for (auto h : candidates) {
    if (!table_.is_sole_owner(h)) {
      if (!table_.resolve(h)) {
        std::lock_guard<std::mutex> lk(watch_mut_);
        watched_.erase(h);
      }
      continue;
    }

    // whoever erases the watch owns the signal
    {
      std::lock_guard<std::mutex> lk(watch_mut_);
      if (watched_.erase(h) == 0)
        continue;
    }

    if (emit(h) == EmitResult::Full) {
      std::lock_guard<std::mutex> lk(watch_mut_);
      watched_.insert(h);
      backpressure = true;
      break;
    }
    ++emitted;
  }

  if (emitted > 0)
    queue_cv_.notify_all();

  if (backpressure)
    NPBIND_LOG_DEBUG("signal queue is full, collection postponed");
  else if (emitted > 0)
    NPBIND_LOG_DEBUG("collection cycle emitted {} signals", emitted);

  return emitted;
}

bool LifecycleMonitor::pop(CollectionSignal& sig)
{
  std::lock_guard<std::mutex> lk(queue_mut_);
  if (queue_.empty())
    return false;
  sig = queue_.front();
  queue_.pop_front();
  return true;
}

std::size_t LifecycleMonitor::drain_signals(std::size_t max,
                                            std::chrono::milliseconds timeout)
{
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t drained = 0;

  for (;;) {
    CollectionSignal sig;
    while (drained < max && pop(sig)) {
      // finalizes the object unless host code still references it
      if (table_.release(sig.handle) == ReleaseResult::StaleHandle) {
        NPBIND_LOG_DEBUG("drained signal for already released handle {}",
                         sig.handle.value());
      }
      ++drained;
    }

    if (drained >= max)
      break;

    // objects may have become unreachable since the last cycle
    if (collect() > 0)
      continue;

    auto const now = std::chrono::steady_clock::now();
    if (now >= deadline)
      break;

    std::unique_lock<std::mutex> lk(queue_mut_);
    if (stopped_)
      break;
    queue_cv_.wait_until(lk, std::min(deadline, now + poll_interval), [this] {
      return !queue_.empty() || stopped_;
    });
  }

  return drained;
}

void LifecycleMonitor::shutdown() noexcept
{
  {
    std::lock_guard<std::mutex> lk(queue_mut_);
    stopped_ = true;
  }
  queue_cv_.notify_all();
}

std::size_t LifecycleMonitor::watched() const
{
  std::lock_guard<std::mutex> lk(watch_mut_);
  return watched_.size();
}

std::size_t LifecycleMonitor::pending() const
{
  std::lock_guard<std::mutex> lk(queue_mut_);
  return queue_.size();
}

} // namespace npbind::impl
