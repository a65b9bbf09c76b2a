// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace npbind {

enum class LogLevel : std::uint32_t {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6
};

// What the lifecycle monitor does when the signal queue is full
enum class OverflowPolicy : std::uint8_t {
  // Signals stay pending as watches until the foreign side drains the queue
  Backpressure,
  // The oldest queued signal is discarded and counted as dropped. Its handle
  // is watched again and signaled by a later cycle.
  DropOldest,
};

// Handles are 32-bit indices; 0xFFFF'FFFF is reserved for the null sentinel
static constexpr std::uint32_t max_handles_limit = 0xFFFF'FFFEu;

static constexpr std::uint32_t default_max_handles = 65536;
static constexpr std::size_t default_signal_queue_capacity = 1024;

struct BridgeStats {
  std::uint32_t live_handles = 0;
  std::size_t watched = 0;
  std::size_t pending_signals = 0;
  std::uint64_t dropped_signals = 0;
  std::size_t live_proxies = 0;
  std::size_t attached_threads = 0;
};

} // namespace npbind
