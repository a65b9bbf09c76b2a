// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <npbind/bridge.hpp>
#include <npbind/impl/bridge_impl.hpp>
#include <npbind/impl/thread_registry.hpp>

#include "logging.hpp"

namespace npbind::impl {

namespace {
// Per-thread attachment state. Destroyed when the thread exits.
struct ThreadState {
  std::weak_ptr<ThreadRegistry> registry;

  ~ThreadState()
  {
    if (auto r = registry.lock())
      r->on_thread_exit(std::this_thread::get_id());
  }
};

thread_local ThreadState tls_state;
} // namespace

ThreadRegistry::ThreadRegistry(std::function<void()> on_attach,
                               std::function<void()> on_detach)
    : on_attach_{std::move(on_attach)}
    , on_detach_{std::move(on_detach)}
{
}

void ThreadRegistry::add_current()
{
  std::lock_guard<std::mutex> lk(mut_);
  threads_.insert(std::this_thread::get_id());
}

bool ThreadRegistry::ensure_attached()
{
  // fast path, every call after the first one
  if (is_attached())
    return false;

  if (on_attach_)
    on_attach_();

  add_current();
  tls_state.registry = weak_from_this();

  NPBIND_LOG_DEBUG("thread attached");
  return true;
}

bool ThreadRegistry::is_attached() const noexcept
{
  return tls_state.registry.lock().get() == this;
}

void ThreadRegistry::detach_current() noexcept
{
  if (!is_attached())
    return;
  tls_state.registry.reset();
  on_thread_exit(std::this_thread::get_id());
}

void ThreadRegistry::on_thread_exit(std::thread::id id) noexcept
{
  {
    std::lock_guard<std::mutex> lk(mut_);
    if (threads_.erase(id) == 0)
      return;
  }

  if (on_detach_) {
    try {
      on_detach_();
    } catch (std::exception& ex) {
      NPBIND_LOG_ERROR("thread detach hook failed: {}", ex.what());
    }
  }

  NPBIND_LOG_DEBUG("thread detached");
}

std::size_t ThreadRegistry::attached_count() const
{
  std::lock_guard<std::mutex> lk(mut_);
  return threads_.size();
}

} // namespace npbind::impl

namespace npbind {

ThreadAttachment::ThreadAttachment(Bridge& bridge)
    : registry_{static_cast<impl::BridgeImpl&>(bridge).thread_registry()}
{
  owns_ = registry_->ensure_attached();
}

ThreadAttachment::~ThreadAttachment()
{
  if (owns_)
    registry_->detach_current();
}

} // namespace npbind
