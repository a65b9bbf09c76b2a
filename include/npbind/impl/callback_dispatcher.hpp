// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

#include <npbind/capability.hpp>
#include <npbind/export.hpp>
#include <npbind/flat_buffer.hpp>
#include <npbind/impl/handle_table.hpp>
#include <npbind/impl/pending_call.hpp>
#include <npbind/impl/reference_bridge.hpp>
#include <npbind/impl/thread_registry.hpp>
#include <npbind/transport.hpp>

namespace npbind::impl {

class NPBIND_API CallbackDispatcher
{
  HandleTable& table_;
  ReferenceBridge& refs_;
  ThreadRegistry& threads_;
  std::shared_ptr<ForeignTransport> transport_;

  std::atomic<std::uint32_t> next_request_id_{1};
  std::atomic<std::size_t> in_flight_{0};

  void call(const HandleTable::Entry& entry,
            const Capability& cap,
            const MethodInfo& method,
            WireReader& reader,
            std::uint32_t request_id,
            flat_buffer& tx);

  template <typename Lookup>
  void invoke_host_impl(handle_t handle,
                        const flat_buffer& rx,
                        flat_buffer& tx,
                        Lookup&& lookup) noexcept;

public:
  CallbackDispatcher(HandleTable& table,
                     ReferenceBridge& refs,
                     ThreadRegistry& threads,
                     std::shared_ptr<ForeignTransport> transport);

  // Blocks the calling thread until the reply arrives or the timeout expires
  Args invoke_foreign(handle_t foreign_handle,
                      const Capability& cap,
                      const MethodInfo& method,
                      const Args& args,
                      std::optional<std::chrono::milliseconds> timeout);

  void invoke_host(handle_t handle,
                   selector_t selector,
                   const flat_buffer& rx,
                   flat_buffer& tx) noexcept;

  // selector is "Capability.Method"
  void invoke_host(handle_t handle,
                   std::string_view selector,
                   const flat_buffer& rx,
                   flat_buffer& tx) noexcept;

  std::size_t in_flight() const noexcept
  {
    return in_flight_.load(std::memory_order_relaxed);
  }
};

} // namespace npbind::impl
