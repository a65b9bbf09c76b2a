// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

#include <npbind/capability.hpp>
#include <npbind/flat_buffer.hpp>
#include <npbind/handle.hpp>

namespace npbind::impl {

// In-flight host to foreign call. Shared between the waiting host thread
// and the transport completion, which may outlive the wait.
struct PendingCall {
  enum class State : std::uint8_t { Created, Sent, Completed, Failed };

  const handle_t target;
  const selector_t selector;
  const std::uint32_t request_id;
  flat_buffer args;

  std::mutex mut;
  std::condition_variable cv;
  State state = State::Created;
  // the waiter gave up, a late reply is dropped
  bool abandoned = false;
  flat_buffer reply;
  std::string failure;

  PendingCall(handle_t target_, selector_t selector_, std::uint32_t id)
      : target{target_}
      , selector{selector_}
      , request_id{id}
  {
  }

  void mark_sent() noexcept
  {
    std::lock_guard<std::mutex> lk(mut);
    state = State::Sent;
  }

  // Returns false if the reply was not delivered to a waiter
  bool complete(flat_buffer&& rx) noexcept;
  void fail(std::string what) noexcept;

  // Returns false on timeout and marks the call abandoned
  bool wait(std::optional<std::chrono::milliseconds> timeout);

  bool is_done() const noexcept
  {
    return state == State::Completed || state == State::Failed;
  }
};

} // namespace npbind::impl
