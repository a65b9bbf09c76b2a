// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include <npbind/capability.hpp>
#include <npbind/common.hpp>
#include <npbind/export.hpp>
#include <npbind/flat_buffer.hpp>
#include <npbind/handle.hpp>
#include <npbind/object.hpp>
#include <npbind/transport.hpp>
#include <npbind/value.hpp>

namespace npbind {

namespace impl {
class ThreadRegistry;

struct BuildConfig {
  LogLevel log_level = LogLevel::info;
  std::uint32_t max_handles = default_max_handles;
  std::size_t signal_queue_capacity = default_signal_queue_capacity;
  OverflowPolicy overflow_policy = OverflowPolicy::Backpressure;
  std::chrono::milliseconds collection_interval{0};
  std::size_t worker_threads = 1;
  std::shared_ptr<ForeignTransport> transport;
  std::function<void()> on_thread_attach;
  std::function<void()> on_thread_detach;
};
} // namespace impl

/**
 * @brief Process-scoped bridge between host objects and the foreign runtime.
 *
 * Created by BridgeBuilder::build() and torn down by destroy(). Every
 * operation is thread-safe.
 */
class NPBIND_API Bridge
{
public:
  // Registers the object in the handle table. An empty set records the
  // capabilities the object reports. Exposing an already exposed object
  // returns its live handle.
  virtual Handle expose_to_foreign(const ObjectRef& obj,
                                   CapabilitySet caps = {}) = 0;

  // Registers a handle owned by host code: never deduplicated and not
  // watched by the lifecycle monitor. Dropped with release().
  virtual Handle pin(const ObjectRef& obj) = 0;

  // Consumes one foreign reference to `foreign_handle`
  virtual std::shared_ptr<ForeignProxy>
  wrap_foreign_as_proxy(handle_t foreign_handle, const Capability& cap) = 0;

  template <typename T>
  std::shared_ptr<T> wrap_foreign(handle_t foreign_handle,
                                  const Capability& cap)
  {
    return narrow<T>(wrap_foreign_as_proxy(foreign_handle, cap));
  }

  // Blocks until the foreign side replies or the timeout expires
  virtual Args
  invoke_foreign(handle_t foreign_handle,
                 const Capability& cap,
                 std::string_view method,
                 Args args,
                 std::optional<std::chrono::milliseconds> timeout = {}) = 0;

  // Entry points for foreign-originated calls. Never throw: every failure is
  // reported in `reply`.
  virtual void invoke_host(handle_t handle,
                           selector_t selector,
                           const flat_buffer& args,
                           flat_buffer& reply) noexcept = 0;
  virtual void invoke_host(handle_t handle,
                           std::string_view selector,
                           const flat_buffer& args,
                           flat_buffer& reply) noexcept = 0;

  // Host-side lookup, throws ExceptionStaleHandle
  virtual ObjectRef resolve(handle_t handle) const = 0;

  // Foreign side drops its reference to a host handle
  virtual ReleaseResult release(handle_t handle) noexcept = 0;

  virtual std::size_t collect() = 0;
  virtual std::size_t drain_signals(std::size_t max,
                                    std::chrono::milliseconds timeout) = 0;

  virtual BridgeStats stats() const = 0;

  virtual void destroy() = 0;

protected:
  virtual ~Bridge() = default;
};

// nullptr when the bridge is not initialized
NPBIND_API Bridge* get_bridge() noexcept;

class NPBIND_API BridgeBuilder
{
  impl::BuildConfig cfg_;

public:
  BridgeBuilder& set_log_level(LogLevel level) noexcept
  {
    cfg_.log_level = level;
    return *this;
  }

  BridgeBuilder& set_max_handles(std::uint32_t max_handles) noexcept
  {
    cfg_.max_handles = max_handles;
    return *this;
  }

  BridgeBuilder& set_signal_queue_capacity(std::size_t capacity) noexcept
  {
    cfg_.signal_queue_capacity = capacity;
    return *this;
  }

  BridgeBuilder& set_overflow_policy(OverflowPolicy policy) noexcept
  {
    cfg_.overflow_policy = policy;
    return *this;
  }

  BridgeBuilder& set_collection_interval(std::chrono::milliseconds interval)
  {
    cfg_.collection_interval = interval;
    return *this;
  }

  BridgeBuilder& set_worker_threads(std::size_t n) noexcept
  {
    cfg_.worker_threads = n;
    return *this;
  }

  BridgeBuilder& set_transport(std::shared_ptr<ForeignTransport> transport)
  {
    cfg_.transport = std::move(transport);
    return *this;
  }

  BridgeBuilder& set_thread_hooks(std::function<void()> on_attach,
                                  std::function<void()> on_detach)
  {
    cfg_.on_thread_attach = std::move(on_attach);
    cfg_.on_thread_detach = std::move(on_detach);
    return *this;
  }

  // Throws Exception on invalid settings or when a bridge already exists
  Bridge* build();
};

/**
 * @brief Keeps the current thread attached to the bridge while alive.
 *
 * Threads that enter through invoke_host() are attached automatically and
 * stay attached until they exit. A scoped attachment detaches on destruction
 * only if it was the one that attached the thread.
 */
class NPBIND_API ThreadAttachment
{
  std::shared_ptr<impl::ThreadRegistry> registry_;
  bool owns_ = false;

public:
  explicit ThreadAttachment(Bridge& bridge);
  ~ThreadAttachment();

  bool owns() const noexcept { return owns_; }

  ThreadAttachment(const ThreadAttachment&) = delete;
  ThreadAttachment& operator=(const ThreadAttachment&) = delete;
};

} // namespace npbind
