// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include <npbind/export.hpp>

namespace npbind {

namespace impl {
class ErrorTokens;
}

/**
 * @brief Host-side error value.
 *
 * A default constructed Error means "no error". Any Error constructed from a
 * message, including an empty one, is an error. Copies share state, so
 * same() tells whether two values originate from the same construction.
 */
class Error
{
  friend class impl::ErrorTokens;

  std::shared_ptr<const std::string> msg_;

  explicit Error(std::shared_ptr<const std::string> state) noexcept
      : msg_{std::move(state)}
  {
  }

public:
  Error() noexcept = default;

  explicit Error(std::string message)
      : msg_{std::make_shared<const std::string>(std::move(message))}
  {
  }

  bool is_error() const noexcept { return msg_ != nullptr; }
  explicit operator bool() const noexcept { return is_error(); }

  const std::string& message() const noexcept
  {
    static const std::string empty;
    return msg_ ? *msg_ : empty;
  }

  bool same(const Error& other) const noexcept { return msg_ == other.msg_; }

  // Value equality: both absent, or both present with the same message
  friend bool operator==(const Error& a, const Error& b) noexcept
  {
    if (a.is_error() != b.is_error())
      return false;
    return !a.is_error() || a.message() == b.message();
  }
};

/**
 * @brief Foreign-consumable representation of an error value.
 *
 * A host error leaving through to_foreign() carries a token naming its
 * origin. Handing the same ForeignError back yields the original Error
 * (same() holds) for as long as the host still has a copy of it. Errors
 * created on the foreign side carry token 0.
 */
struct ForeignError {
  bool present = false;
  std::string message;
  std::uint64_t token = 0;

  // the token is not part of the value
  friend bool operator==(const ForeignError& a, const ForeignError& b) noexcept
  {
    return a.present == b.present && a.message == b.message;
  }
};

namespace error_marshaller {

NPBIND_API ForeignError to_foreign(const Error& error);
NPBIND_API Error to_host(const ForeignError& error);

// Converts a fault caught at the dispatch boundary into a HostError.
// Always returns a present error.
NPBIND_API Error from_exception(std::exception_ptr ex) noexcept;

} // namespace error_marshaller

} // namespace npbind
