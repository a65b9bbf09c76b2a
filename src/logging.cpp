// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <chrono>
#include <ctime>

#include <unistd.h>

#include "logging.hpp"

namespace npbind::impl {

BridgeLogger::BridgeLogger(std::string name, LogLevel level)
    : name_{std::move(name)}
    , level_{level}
    , colored_{::isatty(STDERR_FILENO) != 0}
{
}

unsigned BridgeLogger::thread_tag() noexcept
{
  static std::atomic<unsigned> next{1};
  thread_local unsigned tag = next.fetch_add(1, std::memory_order_relaxed);
  return tag;
}

std::string BridgeLogger::timestamp()
{
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm;
  localtime_r(&secs, &tm);

  return fmt::format("{:02}:{:02}:{:02}.{:03}", tm.tm_hour, tm.tm_min,
                     tm.tm_sec, static_cast<int>(ms.count()));
}

void BridgeLogger::write(LogLevel lvl, std::string_view msg)
{
  auto& info = levels_[static_cast<std::size_t>(lvl)];

  // [15:30:45.123] [npbind #3] warn  message
  auto line = colored_
                  ? fmt::format("[{}] [{} #{}] {}{}\033[0m {}\n", timestamp(),
                                name_, thread_tag(), info.color, info.name, msg)
                  : fmt::format("[{}] [{} #{}] {} {}\n", timestamp(), name_,
                                thread_tag(), info.name, msg);

  std::lock_guard<std::mutex> lk(write_mut_);
  std::fwrite(line.data(), 1, line.size(), stderr);
}

NPBIND_API std::shared_ptr<BridgeLogger>& get_logger()
{
  static std::shared_ptr<BridgeLogger> logger =
      std::make_shared<BridgeLogger>("npbind", LogLevel::info);
  return logger;
}

} // namespace npbind::impl
