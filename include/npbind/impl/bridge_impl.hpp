// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <memory>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <npbind/bridge.hpp>
#include <npbind/impl/callback_dispatcher.hpp>
#include <npbind/impl/handle_table.hpp>
#include <npbind/impl/lifecycle_monitor.hpp>
#include <npbind/impl/reference_bridge.hpp>
#include <npbind/impl/thread_registry.hpp>

namespace npbind::impl {

class NPBIND_API BridgeImpl : public Bridge,
                              public std::enable_shared_from_this<BridgeImpl>
{
  const BuildConfig cfg_;

  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  std::unique_ptr<boost::asio::thread_pool> pool_;
  boost::asio::steady_timer collect_timer_;

  std::shared_ptr<ThreadRegistry> threads_;
  HandleTable table_;
  LifecycleMonitor monitor_;
  ReferenceBridge refs_;
  CallbackDispatcher dispatcher_;

  std::atomic<bool> destroyed_{false};

  void schedule_collection();
  void stop_executor() noexcept;

public:
  explicit BridgeImpl(BuildConfig cfg);
  ~BridgeImpl() override;

  // Must be called once the object is owned by a shared_ptr
  void start();

  Handle expose_to_foreign(const ObjectRef& obj, CapabilitySet caps) override;
  Handle pin(const ObjectRef& obj) override;

  std::shared_ptr<ForeignProxy>
  wrap_foreign_as_proxy(handle_t foreign_handle,
                        const Capability& cap) override;

  Args invoke_foreign(handle_t foreign_handle,
                      const Capability& cap,
                      std::string_view method,
                      Args args,
                      std::optional<std::chrono::milliseconds> timeout) override;

  void invoke_host(handle_t handle,
                   selector_t selector,
                   const flat_buffer& args,
                   flat_buffer& reply) noexcept override;
  void invoke_host(handle_t handle,
                   std::string_view selector,
                   const flat_buffer& args,
                   flat_buffer& reply) noexcept override;

  ObjectRef resolve(handle_t handle) const override;
  ReleaseResult release(handle_t handle) noexcept override;

  std::size_t collect() override;
  std::size_t drain_signals(std::size_t max,
                            std::chrono::milliseconds timeout) override;

  BridgeStats stats() const override;

  void destroy() override;

  const BuildConfig& config() const noexcept { return cfg_; }
  boost::asio::io_context& ioc() noexcept { return ioc_; }
  HandleTable& table() noexcept { return table_; }
  LifecycleMonitor& monitor() noexcept { return monitor_; }
  ReferenceBridge& references() noexcept { return refs_; }
  CallbackDispatcher& dispatcher() noexcept { return dispatcher_; }
  std::shared_ptr<ThreadRegistry> thread_registry() const { return threads_; }
};

// Keeps the bridge alive for the duration of a foreign call.
// nullptr when not initialized.
NPBIND_API std::shared_ptr<BridgeImpl> current_bridge() noexcept;

} // namespace npbind::impl
