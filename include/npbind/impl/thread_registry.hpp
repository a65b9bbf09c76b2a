// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>

#include <npbind/export.hpp>

namespace npbind::impl {

/**
 * @brief Threads allowed to run host code on behalf of the foreign side.
 *
 * A thread is attached on its first call and stays attached until it exits
 * or is detached explicitly. The attach hook runs on the attaching thread
 * before any host code; the detach hook runs on the detaching thread.
 */
class NPBIND_API ThreadRegistry
    : public std::enable_shared_from_this<ThreadRegistry>
{
  std::function<void()> on_attach_;
  std::function<void()> on_detach_;

  mutable std::mutex mut_;
  std::unordered_set<std::thread::id> threads_;

  void add_current();

public:
  ThreadRegistry(std::function<void()> on_attach,
                 std::function<void()> on_detach);

  // Attaches the calling thread until it exits. Returns true if this call
  // performed the attachment.
  bool ensure_attached();

  bool is_attached() const noexcept;

  void detach_current() noexcept;

  // Called from the exit path of an attached thread
  void on_thread_exit(std::thread::id id) noexcept;

  std::size_t attached_count() const;
};

} // namespace npbind::impl
