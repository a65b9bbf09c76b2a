// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <npbind/value.hpp>

namespace npbind {

NPBIND_API std::string_view to_string(ValueType type) noexcept
{
  switch (type) {
  case ValueType::Void:
    return "void";
  case ValueType::Bool:
    return "bool";
  case ValueType::Int32:
    return "int32";
  case ValueType::Int64:
    return "int64";
  case ValueType::Float64:
    return "float64";
  case ValueType::String:
    return "string";
  case ValueType::Bytes:
    return "bytes";
  case ValueType::Object:
    return "object";
  case ValueType::Error:
    return "error";
  default:
    return "unknown";
  }
}

} // namespace npbind
