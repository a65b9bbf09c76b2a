// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <npbind/capability.hpp>
#include <npbind/export.hpp>
#include <npbind/impl/handle_table.hpp>
#include <npbind/impl/lifecycle_monitor.hpp>
#include <npbind/object.hpp>
#include <npbind/transport.hpp>
#include <npbind/wire.hpp>

namespace npbind::impl {

class BridgeImpl;

/**
 * @brief Maps object references in both directions.
 *
 * Host objects leave as handles issued by the handle table; foreign
 * references arrive as ForeignProxy instances. Every foreign reference the
 * host receives is released exactly once: when its proxy is destroyed, or
 * immediately if an identity-preserving proxy for it already exists.
 */
class NPBIND_API ReferenceBridge
{
  using ProxyKey = std::pair<handle_t, capability_id_t>;

  HandleTable& table_;
  LifecycleMonitor& monitor_;
  std::shared_ptr<ForeignTransport> transport_;
  std::weak_ptr<BridgeImpl> owner_;

  mutable std::mutex proxies_mut_;
  std::map<ProxyKey, std::weak_ptr<ForeignProxy>> proxies_;

  std::shared_ptr<ForeignProxy> make_proxy(handle_t foreign_handle,
                                           const Capability& cap);
  void release_foreign(handle_t foreign_handle) noexcept;
  void release_unread(WireReader& r, std::uint32_t count) noexcept;

public:
  ReferenceBridge(HandleTable& table,
                  LifecycleMonitor& monitor,
                  std::shared_ptr<ForeignTransport> transport);

  void set_owner(std::weak_ptr<BridgeImpl> owner) noexcept
  {
    owner_ = std::move(owner);
  }

  Handle expose_to_foreign(const ObjectRef& obj, const CapabilitySet& caps);
  Handle pin(const ObjectRef& obj);

  std::shared_ptr<ForeignProxy> wrap_foreign_as_proxy(handle_t foreign_handle,
                                                      const Capability& cap);

  // The foreign side dropped its reference to a host handle
  ReleaseResult release(Handle h) noexcept;

  void on_proxy_destroyed(const ForeignProxy& proxy) noexcept;

  WireRef encode(const ObjectRef& obj);
  ObjectRef decode(WireRef ref, const Param& param);

  // Throws ExceptionBadInput when values do not match the declared types
  void marshal(WireWriter& w,
               const Args& values,
               const std::vector<Param>& types);
  // On failure the foreign references not yet decoded are released
  Args unmarshal(WireReader& r, const std::vector<Param>& types);

  // Releases the foreign references of a value list that is not going to be
  // unmarshaled
  void discard(WireReader& r) noexcept;

  std::size_t proxy_count() const;
};

// Throws ExceptionBadInput when values do not match the declared types
NPBIND_API void check_values(const Args& values,
                             const std::vector<Param>& types);

} // namespace npbind::impl
