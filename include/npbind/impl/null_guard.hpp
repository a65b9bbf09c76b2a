// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <utility>

#include <npbind/exception.hpp>
#include <npbind/handle.hpp>
#include <npbind/value.hpp>

// "No object" has exactly one wire form, the null sentinel. It is handled
// here and never reaches the delegate (the handle table or the foreign side).
namespace npbind::impl::null_guard {

template <typename Delegate>
WireRef encode(const ObjectRef& obj, Delegate&& delegate)
{
  if (!obj)
    return WireRef{};
  return std::forward<Delegate>(delegate)(obj);
}

template <typename Delegate> ObjectRef decode(WireRef ref, Delegate&& delegate)
{
  if (ref.kind == RefKind::Null) {
    if (ref.value != null_handle)
      throw ExceptionBadInput("null reference with a non-null value");
    return nullptr;
  }
  if (ref.value == null_handle)
    throw ExceptionBadInput("live reference carrying the null sentinel");
  return std::forward<Delegate>(delegate)(ref);
}

} // namespace npbind::impl::null_guard
