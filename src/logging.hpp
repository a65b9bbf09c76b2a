// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

// Internal logging header - do not expose in public API

#include <array>
#include <atomic>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include <npbind/common.hpp>
#include <npbind/export.hpp>

namespace npbind::impl {

/**
 * @brief Bridge logger, writes one line per record to stderr.
 *
 * Records are tagged with a small per-thread number so that calls crossing
 * between host threads and attached foreign threads can be followed. Color
 * is used only when stderr is a terminal.
 */
class BridgeLogger
{
  struct LevelInfo {
    std::string_view name;
    std::string_view color;
  };

  static constexpr std::array<LevelInfo, 6> levels_{{
      {"trace", "\033[37m"},
      {"debug", "\033[36m"},
      {"info ", "\033[32m"},
      {"warn ", "\033[33m"},
      {"error", "\033[31m"},
      {"crit ", "\033[1;31m"},
  }};

  const std::string name_;
  std::atomic<LogLevel> level_;
  const bool colored_;
  std::mutex write_mut_;

  static unsigned thread_tag() noexcept;
  static std::string timestamp();

  void write(LogLevel lvl, std::string_view msg);

public:
  explicit BridgeLogger(std::string name, LogLevel level = LogLevel::info);

  void set_level(LogLevel level) noexcept
  {
    level_.store(level, std::memory_order_relaxed);
  }

  LogLevel level() const noexcept
  {
    return level_.load(std::memory_order_relaxed);
  }

  bool should_log(LogLevel lvl) const noexcept
  {
    return lvl != LogLevel::off && lvl >= level();
  }

  // Arguments are formatted only when the record passes the level check.
  // Logging never throws.
  template <typename... Args>
  void log(LogLevel lvl,
           fmt::format_string<Args...> fmt,
           Args&&... args) noexcept
  {
    if (!should_log(lvl))
      return;
    try {
      write(lvl, fmt::format(fmt, std::forward<Args>(args)...));
    } catch (std::exception& ex) {
      std::fprintf(stderr, "[%s] logging failed: %s\n", name_.c_str(),
                   ex.what());
    }
  }
};

NPBIND_API std::shared_ptr<BridgeLogger>& get_logger();

} // namespace npbind::impl

#define NPBIND_LOG_(lvl, ...) \
  npbind::impl::get_logger()->log(npbind::LogLevel::lvl, __VA_ARGS__)

#define NPBIND_LOG_TRACE(...) NPBIND_LOG_(trace, __VA_ARGS__)
#define NPBIND_LOG_DEBUG(...) NPBIND_LOG_(debug, __VA_ARGS__)
#define NPBIND_LOG_INFO(...) NPBIND_LOG_(info, __VA_ARGS__)
#define NPBIND_LOG_WARN(...) NPBIND_LOG_(warn, __VA_ARGS__)
#define NPBIND_LOG_ERROR(...) NPBIND_LOG_(error, __VA_ARGS__)
#define NPBIND_LOG_CRITICAL(...) NPBIND_LOG_(critical, __VA_ARGS__)
