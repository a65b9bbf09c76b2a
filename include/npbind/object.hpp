// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include <npbind/capability.hpp>
#include <npbind/export.hpp>
#include <npbind/handle.hpp>
#include <npbind/value.hpp>

namespace npbind {

namespace impl {
class BridgeImpl;
class ReferenceBridge;
class CallbackDispatcher;
} // namespace impl

enum class DispatchPolicy : std::uint8_t {
  // Calls may run on any number of threads at once
  Concurrent,
  // Calls are mutually exclusive (reentrant on the same thread)
  Serialized,
};

/**
 * @brief Base class of every host object that can cross the boundary.
 *
 * Host objects are always owned by std::shared_ptr. When exposed, the handle
 * table holds one of the strong references; the object is finalized (its
 * destructor runs) only after the table has released it and host code has
 * dropped all of its own references.
 */
class NPBIND_API HostObject : public std::enable_shared_from_this<HostObject>
{
  friend class impl::ReferenceBridge;
  friend class impl::CallbackDispatcher;

  // handle of the current exposure, null_handle if never exposed
  std::atomic<handle_t> exported_handle_{null_handle};
  const DispatchPolicy policy_;
  std::recursive_mutex dispatch_mut_;

public:
  explicit HostObject(DispatchPolicy policy = DispatchPolicy::Concurrent) noexcept
      : policy_{policy}
  {
  }

  virtual ~HostObject() = default;

  virtual CapabilitySet capabilities() const = 0;

  // Arguments are type-checked against method.params before the call.
  // results must be filled according to method.results.
  virtual void dispatch(const Capability& cap,
                        const MethodInfo& method,
                        Args& args,
                        Args& results) = 0;

  bool implements(const Capability& cap) const;

  DispatchPolicy dispatch_policy() const noexcept { return policy_; }

  handle_t exported_handle() const noexcept
  {
    return exported_handle_.load(std::memory_order_acquire);
  }

  HostObject(const HostObject&) = delete;
  HostObject& operator=(const HostObject&) = delete;
};

struct ProxyInit {
  std::weak_ptr<impl::BridgeImpl> bridge;
  handle_t foreign_handle;
  const Capability* capability;
};

/**
 * @brief Host-side stand-in for a foreign object.
 *
 * Every method call is forwarded to the foreign handle. The proxy does not
 * manage foreign memory: its destructor only notifies the foreign side that
 * the host no longer references the handle.
 */
class NPBIND_API ForeignProxy : public HostObject
{
  std::weak_ptr<impl::BridgeImpl> bridge_;
  const handle_t foreign_handle_;
  const Capability& capability_;
  std::optional<std::chrono::milliseconds> timeout_;

public:
  explicit ForeignProxy(ProxyInit&& init);
  ~ForeignProxy() override;

  handle_t foreign_handle() const noexcept { return foreign_handle_; }
  const Capability& capability() const noexcept { return capability_; }

  // Bounded wait for every call made through this proxy
  void set_timeout(std::chrono::milliseconds timeout) noexcept
  {
    timeout_ = timeout;
  }

  CapabilitySet capabilities() const override { return {&capability_}; }

  void dispatch(const Capability& cap,
                const MethodInfo& method,
                Args& args,
                Args& results) override;

  Args invoke(const MethodInfo& method, Args args);
  Args invoke(std::string_view method_name, Args args);
};

// Downcast to a typed interface, nullptr on mismatch
template <typename T> std::shared_ptr<T> narrow(const ObjectRef& obj) noexcept
{
  return std::dynamic_pointer_cast<T>(obj);
}

// Host objects implementing an interface T are passed around as
// std::shared_ptr<T>; this turns them back into bridge references.
template <typename T> ObjectRef as_object(const std::shared_ptr<T>& obj)
{
  if (!obj)
    return nullptr;
  auto ref = std::dynamic_pointer_cast<HostObject>(obj);
  if (!ref)
    throw ExceptionBadInput("value is not a host object");
  return ref;
}

} // namespace npbind
