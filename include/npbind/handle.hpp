// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <functional>

namespace npbind {

using handle_t = std::uint64_t;

// Never produced by the handle table: index 0xFFFF'FFFF is out of range
static constexpr handle_t null_handle = 0xFFFF'FFFF'FFFF'FFFFull;

struct Handle {
  std::uint32_t index = 0xFFFF'FFFF;
  std::uint32_t generation = 0xFFFF'FFFF;

  constexpr handle_t value() const noexcept
  {
    return (static_cast<handle_t>(generation) << 32) | index;
  }

  static constexpr Handle from_value(handle_t v) noexcept
  {
    return Handle{static_cast<std::uint32_t>(v & 0xFFFF'FFFFull),
                  static_cast<std::uint32_t>((v >> 32) & 0xFFFF'FFFFull)};
  }

  constexpr bool is_null() const noexcept { return value() == null_handle; }

  friend constexpr bool operator==(const Handle&, const Handle&) = default;
};

enum class RefKind : std::uint8_t {
  Null = 0,
  Host = 1,    // handle issued by the host handle table
  Foreign = 2, // handle issued by the foreign runtime
};

// An object reference as it crosses the boundary
struct WireRef {
  RefKind kind = RefKind::Null;
  handle_t value = null_handle;

  constexpr bool is_null() const noexcept { return kind == RefKind::Null; }

  static constexpr WireRef host(handle_t h) noexcept
  {
    return WireRef{RefKind::Host, h};
  }

  static constexpr WireRef foreign(handle_t h) noexcept
  {
    return WireRef{RefKind::Foreign, h};
  }

  friend constexpr bool operator==(const WireRef&, const WireRef&) = default;
};

enum class ReleaseResult : std::uint8_t { Released, StaleHandle };

} // namespace npbind

template <> struct std::hash<npbind::Handle> {
  std::size_t operator()(const npbind::Handle& h) const noexcept
  {
    return std::hash<npbind::handle_t>{}(h.value());
  }
};
