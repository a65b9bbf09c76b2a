// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <npbind/capability.hpp>
#include <npbind/export.hpp>
#include <npbind/handle.hpp>
#include <npbind/value.hpp>

namespace npbind::impl {

/**
 * @brief Generation-stamped handle to object mapping.
 *
 * A handle packs the slot index in its low 32 bits and the slot generation
 * in its high 32 bits. Releasing a slot bumps its generation, so handles to
 * previous occupants never resolve again. A slot whose generation would
 * wrap is retired instead of being reused.
 *
 * Slots live in fixed-size segments allocated on demand up to max_handles.
 * Each segment has its own mutex; the free list has another one.
 */
class NPBIND_API HandleTable
{
public:
  struct Entry {
    ObjectRef object;
    std::shared_ptr<const CapabilitySet> capabilities;
  };

  static constexpr std::uint32_t segment_bits = 10;
  static constexpr std::uint32_t segment_size = 1u << segment_bits;

private:
  static constexpr std::uint32_t invalid_index = 0xFFFF'FFFFu;
  static constexpr std::uint32_t last_generation = 0xFFFF'FFFFu;

  struct Slot {
    ObjectRef object;
    std::shared_ptr<const CapabilitySet> capabilities;
    std::uint32_t generation = 0;
    std::uint32_t next_free = invalid_index;
    bool occupied = false;
  };

  struct Segment {
    std::mutex mut;
    std::array<Slot, segment_size> slots;
  };

  const std::uint32_t max_size_;
  const std::uint32_t max_segments_;
  std::unique_ptr<std::atomic<Segment*>[]> segments_;

  std::mutex free_mut_;
  std::uint32_t free_head_ = invalid_index;
  // number of slots ever handed out, the next fresh index
  std::uint32_t high_water_ = 0;

  std::atomic<std::uint32_t> live_{0};
  std::atomic<std::uint32_t> retired_{0};

  constexpr static std::uint32_t segment_index(std::uint32_t ix) noexcept
  {
    return ix >> segment_bits;
  }

  constexpr static std::uint32_t slot_index(std::uint32_t ix) noexcept
  {
    return ix & (segment_size - 1);
  }

  Segment* segment(std::uint32_t ix) const noexcept;

  std::uint32_t acquire_index();
  void return_index(std::uint32_t ix) noexcept;

public:
  explicit HandleTable(std::uint32_t max_size);
  ~HandleTable();

  // Throws ExceptionResourceExhausted when every slot is occupied
  Handle register_object(ObjectRef object,
                         std::shared_ptr<const CapabilitySet> capabilities);

  std::optional<Entry> resolve(Handle h) const;

  ObjectRef resolve_object(Handle h) const;

  // The object is destroyed outside of any table lock
  ReleaseResult release(Handle h) noexcept;

  // True when the table holds the only strong reference to the object
  bool is_sole_owner(Handle h) const noexcept;

  // Releases every live entry; returns the number of released handles
  std::size_t clear() noexcept;

  std::uint32_t size() const noexcept
  {
    return live_.load(std::memory_order_relaxed);
  }

  std::uint32_t max_size() const noexcept { return max_size_; }

  std::uint32_t retired() const noexcept
  {
    return retired_.load(std::memory_order_relaxed);
  }

  HandleTable(const HandleTable&) = delete;
  HandleTable& operator=(const HandleTable&) = delete;
};

} // namespace npbind::impl
