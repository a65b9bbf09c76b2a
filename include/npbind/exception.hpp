// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <npbind/error.hpp>

namespace npbind {
class Exception : public std::runtime_error
{
public:
  explicit Exception(char const* const msg) noexcept : std::runtime_error(msg)
  {
  }

  explicit Exception(std::string const& msg) noexcept : std::runtime_error(msg)
  {
  }
};

// Handle no longer refers to a live object (released, reused or never issued)
class ExceptionStaleHandle : public Exception
{
  std::uint64_t handle_;

public:
  explicit ExceptionStaleHandle(std::uint64_t handle)
      : Exception("stale handle: " + std::to_string(handle))
      , handle_{handle}
  {
  }

  std::uint64_t handle() const noexcept { return handle_; }
};

// Selector does not name a method of any capability recorded for the target
class ExceptionNoSuchMethod : public Exception
{
public:
  explicit ExceptionNoSuchMethod(std::string const& what)
      : Exception("no such method: " + what)
  {
  }
};

class ExceptionResourceExhausted : public Exception
{
public:
  explicit ExceptionResourceExhausted(std::string const& what) : Exception(what)
  {
  }
};

// The bounded wait expired. The call itself may still complete later.
class ExceptionTimeout : public Exception
{
public:
  explicit ExceptionTimeout(std::string const& what) : Exception(what) {}
};

class ExceptionBadInput : public Exception
{
public:
  ExceptionBadInput() : Exception("bad input") {}
  explicit ExceptionBadInput(std::string const& what)
      : Exception("bad input: " + what)
  {
  }
};

class ExceptionAssetNotFound : public Exception
{
public:
  explicit ExceptionAssetNotFound(std::string const& name)
      : Exception("asset not found: " + name)
  {
  }
};

// The foreign side failed to execute a host-originated call
class ForeignException : public Exception
{
  Error error_;

public:
  explicit ForeignException(Error error)
      : Exception("foreign error: " + error.message())
      , error_{std::move(error)}
  {
  }

  const Error& error() const noexcept { return error_; }
};
} // namespace npbind
