// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <functional>

#include <npbind/capability.hpp>
#include <npbind/flat_buffer.hpp>
#include <npbind/handle.hpp>

namespace npbind {

/**
 * @brief Channel to the foreign runtime, supplied by the embedder.
 *
 * send_async() may execute the call on any thread and complete it at any
 * later time. The bridge layers synchronous call semantics on top of it.
 */
class ForeignTransport
{
public:
  using CompletionHandler = std::function<void(flat_buffer&& reply)>;

  virtual ~ForeignTransport() = default;

  // `args` holds a FunctionCall message. The handler must be invoked at most
  // once with an Answer message; it may be invoked after the caller has
  // stopped waiting.
  virtual void send_async(handle_t foreign_handle,
                          selector_t selector,
                          flat_buffer&& args,
                          CompletionHandler&& handler) = 0;

  // The host dropped one reference to the foreign handle
  virtual void release(handle_t foreign_handle) noexcept = 0;
};

} // namespace npbind
