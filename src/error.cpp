// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <mutex>
#include <new>
#include <unordered_map>

#include <npbind/error.hpp>

namespace npbind::impl {

// Host errors that crossed to the foreign side, by token
class ErrorTokens
{
  struct Origin {
    std::weak_ptr<const std::string> state;
    const std::string* key;
  };

  std::mutex mut_;
  std::uint64_t next_token_ = 1;
  std::unordered_map<const std::string*, std::uint64_t> tokens_;
  std::unordered_map<std::uint64_t, Origin> origins_;
  std::size_t sweep_at_ = 64;

  // drops errors the host no longer holds
  void sweep()
  {
    for (auto it = origins_.begin(); it != origins_.end();) {
      if (!it->second.state.expired()) {
        ++it;
        continue;
      }
      auto t = tokens_.find(it->second.key);
      if (t != tokens_.end() && t->second == it->first)
        tokens_.erase(t);
      it = origins_.erase(it);
    }
    sweep_at_ = std::max<std::size_t>(64, origins_.size() * 2);
  }

public:
  static ErrorTokens& instance()
  {
    static ErrorTokens tokens;
    return tokens;
  }

  std::uint64_t token_of(const Error& error)
  {
    auto key = error.msg_.get();
    std::lock_guard<std::mutex> lk(mut_);

    if (auto it = tokens_.find(key); it != tokens_.end()) {
      // the address may belong to a newer error by now
      auto origin = origins_.find(it->second);
      if (origin != origins_.end() && origin->second.state.lock() == error.msg_)
        return it->second;
    }

    if (origins_.size() >= sweep_at_)
      sweep();

    auto token = next_token_++;
    tokens_[key] = token;
    origins_.emplace(token, Origin{error.msg_, key});
    return token;
  }

  Error find(std::uint64_t token, const std::string& message)
  {
    std::lock_guard<std::mutex> lk(mut_);
    auto it = origins_.find(token);
    if (it != origins_.end()) {
      auto state = it->second.state.lock();
      if (state && *state == message)
        return Error(std::move(state));
    }
    return Error(message);
  }
};

} // namespace npbind::impl

namespace npbind::error_marshaller {

namespace {
// allocated up front, from_exception must not fail
const Error unknown_fault("unknown host fault");
const Error out_of_memory("out of memory");
} // namespace

NPBIND_API ForeignError to_foreign(const Error& error)
{
  if (!error)
    return ForeignError{};
  return ForeignError{true, error.message(),
                      impl::ErrorTokens::instance().token_of(error)};
}

NPBIND_API Error to_host(const ForeignError& error)
{
  if (!error.present)
    return Error{};
  if (error.token == 0)
    return Error(error.message);
  return impl::ErrorTokens::instance().find(error.token, error.message);
}

NPBIND_API Error from_exception(std::exception_ptr ex) noexcept
{
  if (!ex)
    return unknown_fault;
  try {
    try {
      std::rethrow_exception(ex);
    } catch (std::bad_alloc&) {
      return out_of_memory;
    } catch (std::exception& e) {
      return Error(e.what());
    } catch (...) {
      return unknown_fault;
    }
  } catch (std::bad_alloc&) {
    // no memory for the message
    return out_of_memory;
  }
}

} // namespace npbind::error_marshaller
