// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <npbind/error.hpp>
#include <npbind/exception.hpp>
#include <npbind/export.hpp>

namespace npbind {

class HostObject;

using Bytes = std::vector<std::uint8_t>;
using ObjectRef = std::shared_ptr<HostObject>;

enum class ValueType : std::uint8_t {
  Void = 0,
  Bool = 1,
  Int32 = 2,
  Int64 = 3,
  Float64 = 4,
  String = 5,
  Bytes = 6,
  Object = 7,
  Error = 8,
};

// Index order matches ValueType
using Value = std::variant<std::monostate,
                           bool,
                           std::int32_t,
                           std::int64_t,
                           double,
                           std::string,
                           Bytes,
                           ObjectRef,
                           Error>;

using Args = std::vector<Value>;

inline ValueType type_of(const Value& v) noexcept
{
  return static_cast<ValueType>(v.index());
}

NPBIND_API std::string_view to_string(ValueType type) noexcept;

// Typed accessor used by proxies and servants. Throws ExceptionBadInput on a
// type mismatch or a missing value.
template <typename T> T& value_as(Args& args, std::size_t ix)
{
  if (ix >= args.size())
    throw ExceptionBadInput("missing value #" + std::to_string(ix));
  auto* v = std::get_if<T>(&args[ix]);
  if (!v)
    throw ExceptionBadInput(
        "value #" + std::to_string(ix) + " has type " +
        std::string(to_string(type_of(args[ix]))));
  return *v;
}

template <typename T> const T& value_as(const Args& args, std::size_t ix)
{
  return value_as<T>(const_cast<Args&>(args), ix);
}

} // namespace npbind
