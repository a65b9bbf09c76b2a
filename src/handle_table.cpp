// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <npbind/impl/handle_table.hpp>

#include "logging.hpp"

namespace npbind::impl {

HandleTable::HandleTable(std::uint32_t max_size)
    : max_size_{max_size}
    , max_segments_{(max_size + segment_size - 1) / segment_size}
    , segments_{new std::atomic<Segment*>[max_segments_]}
{
  if (max_size_ == 0 || max_size_ > max_handles_limit)
    throw Exception("invalid handle table size: " + std::to_string(max_size));
  for (std::uint32_t i = 0; i < max_segments_; ++i)
    segments_[i].store(nullptr, std::memory_order_relaxed);
}

HandleTable::~HandleTable()
{
  clear();
  for (std::uint32_t i = 0; i < max_segments_; ++i)
    delete segments_[i].load(std::memory_order_relaxed);
}

HandleTable::Segment* HandleTable::segment(std::uint32_t ix) const noexcept
{
  if (ix >= max_size_)
    return nullptr;
  return segments_[segment_index(ix)].load(std::memory_order_acquire);
}

std::uint32_t HandleTable::acquire_index()
{
  std::lock_guard<std::mutex> lk(free_mut_);

  if (free_head_ != invalid_index) {
    auto ix = free_head_;
    auto& slot = segment(ix)->slots[slot_index(ix)];
    free_head_ = slot.next_free;
    slot.next_free = invalid_index;
    return ix;
  }

  if (high_water_ == max_size_) {
    NPBIND_LOG_ERROR("handle table exhausted: {} live, {} retired",
                     size(), retired());
    throw ExceptionResourceExhausted("handle table is full (" +
                                     std::to_string(max_size_) + " slots)");
  }

  auto ix = high_water_;
  if (slot_index(ix) == 0) {
    // first slot of a segment that does not exist yet
    segments_[segment_index(ix)].store(new Segment,
                                       std::memory_order_release);
    NPBIND_LOG_DEBUG("handle table grown to {} segments",
                     segment_index(ix) + 1);
  }
  ++high_water_;
  return ix;
}

void HandleTable::return_index(std::uint32_t ix) noexcept
{
  std::lock_guard<std::mutex> lk(free_mut_);
  segment(ix)->slots[slot_index(ix)].next_free = free_head_;
  free_head_ = ix;
}

Handle HandleTable::register_object(
    ObjectRef object, std::shared_ptr<const CapabilitySet> capabilities)
{
  if (!object)
    throw Exception("cannot register a null object");

  auto ix = acquire_index();
  auto seg = segment(ix);

  std::lock_guard<std::mutex> lk(seg->mut);
  auto& slot = seg->slots[slot_index(ix)];
  slot.object = std::move(object);
  slot.capabilities = std::move(capabilities);
  slot.occupied = true;
  live_.fetch_add(1, std::memory_order_relaxed);

  return Handle{ix, slot.generation};
}

std::optional<HandleTable::Entry> HandleTable::resolve(Handle h) const
{
  if (h.is_null())
    return std::nullopt;

  auto seg = segment(h.index);
  if (!seg)
    return std::nullopt;

  std::lock_guard<std::mutex> lk(seg->mut);
  auto& slot = seg->slots[slot_index(h.index)];
  if (!slot.occupied || slot.generation != h.generation)
    return std::nullopt;

  return Entry{slot.object, slot.capabilities};
}

ObjectRef HandleTable::resolve_object(Handle h) const
{
  auto entry = resolve(h);
  if (!entry)
    throw ExceptionStaleHandle(h.value());
  return std::move(entry->object);
}

ReleaseResult HandleTable::release(Handle h) noexcept
{
  if (h.is_null())
    return ReleaseResult::StaleHandle;

  auto seg = segment(h.index);
  if (!seg)
    return ReleaseResult::StaleHandle;

  // destroyed after the segment lock is released
  ObjectRef object;
  std::shared_ptr<const CapabilitySet> capabilities;
  bool reusable;

  {
    std::lock_guard<std::mutex> lk(seg->mut);
    auto& slot = seg->slots[slot_index(h.index)];
    if (!slot.occupied || slot.generation != h.generation)
      return ReleaseResult::StaleHandle;

    object = std::move(slot.object);
    capabilities = std::move(slot.capabilities);
    slot.occupied = false;

    reusable = slot.generation != last_generation;
    if (reusable)
      ++slot.generation;
  }

  live_.fetch_sub(1, std::memory_order_relaxed);

  if (reusable) {
    return_index(h.index);
  } else {
    retired_.fetch_add(1, std::memory_order_relaxed);
    NPBIND_LOG_WARN("handle slot {} retired: generation exhausted", h.index);
  }

  return ReleaseResult::Released;
}

bool HandleTable::is_sole_owner(Handle h) const noexcept
{
  auto seg = segment(h.index);
  if (!seg || h.is_null())
    return false;

  std::lock_guard<std::mutex> lk(seg->mut);
  auto& slot = seg->slots[slot_index(h.index)];
  return slot.occupied && slot.generation == h.generation &&
         slot.object.use_count() == 1;
}

std::size_t HandleTable::clear() noexcept
{
  std::vector<Handle> live;
  for (std::uint32_t s = 0; s < max_segments_; ++s) {
    auto seg = segments_[s].load(std::memory_order_acquire);
    if (!seg)
      break;
    std::lock_guard<std::mutex> lk(seg->mut);
    for (std::uint32_t i = 0; i < segment_size; ++i) {
      auto& slot = seg->slots[i];
      if (slot.occupied)
        live.push_back(Handle{s * segment_size + i, slot.generation});
    }
  }

  std::size_t n = 0;
  for (auto h : live) {
    if (release(h) == ReleaseResult::Released)
      ++n;
  }
  return n;
}

} // namespace npbind::impl
