// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <npbind/export.hpp>
#include <npbind/handle.hpp>
#include <npbind/value.hpp>

namespace npbind {

class ForeignProxy;
struct ProxyInit;

using capability_id_t = std::uint16_t;
using selector_t = std::uint32_t;

// 0 means "any capability" in object parameters
static constexpr capability_id_t any_capability = 0;

constexpr selector_t make_selector(capability_id_t cap,
                                   std::uint16_t method_index) noexcept
{
  return (static_cast<selector_t>(cap) << 16) | method_index;
}

constexpr capability_id_t selector_capability(selector_t s) noexcept
{
  return static_cast<capability_id_t>(s >> 16);
}

constexpr std::uint16_t selector_method(selector_t s) noexcept
{
  return static_cast<std::uint16_t>(s & 0xFFFF);
}

struct Param {
  ValueType type = ValueType::Void;
  capability_id_t capability = any_capability;

  Param(ValueType t) noexcept : type{t} {}
  Param(ValueType t, capability_id_t cap) noexcept : type{t}, capability{cap} {}

  static Param object(capability_id_t cap = any_capability) noexcept
  {
    return Param{ValueType::Object, cap};
  }
};

struct MethodInfo {
  std::string name;
  std::vector<Param> params;
  std::vector<Param> results;
  std::uint16_t index = 0;
  selector_t selector = 0;
};

using ProxyFactory = std::shared_ptr<ForeignProxy> (*)(ProxyInit&& init);

/**
 * @brief A named set of methods an object may implement.
 *
 * Capabilities are declared in code and registered once in the Catalogue.
 * Method selectors are derived from the capability id and the declaration
 * order of its methods.
 */
class NPBIND_API Capability
{
  capability_id_t id_;
  std::string name_;
  bool identity_preserving_ = false;
  ProxyFactory proxy_factory_ = nullptr;
  std::vector<MethodInfo> methods_;

public:
  Capability(capability_id_t id, std::string name);

  Capability& method(std::string name,
                     std::vector<Param> params,
                     std::vector<Param> results = {});

  // Repeated wrapping of the same foreign handle yields the same proxy
  Capability& identity_preserving(bool v = true) noexcept
  {
    identity_preserving_ = v;
    return *this;
  }

  Capability& proxy_factory(ProxyFactory f) noexcept
  {
    proxy_factory_ = f;
    return *this;
  }

  capability_id_t id() const noexcept { return id_; }
  const std::string& name() const noexcept { return name_; }
  bool is_identity_preserving() const noexcept { return identity_preserving_; }
  ProxyFactory get_proxy_factory() const noexcept { return proxy_factory_; }
  const std::vector<MethodInfo>& methods() const noexcept { return methods_; }

  const MethodInfo* find(selector_t selector) const noexcept;
  const MethodInfo* find(std::string_view method_name) const noexcept;

  // Throws ExceptionNoSuchMethod
  const MethodInfo& get(std::string_view method_name) const;
};

using CapabilitySet = std::vector<const Capability*>;

// Process-wide static table of capabilities
class NPBIND_API Catalogue
{
  mutable std::mutex mut_;
  std::map<capability_id_t, std::unique_ptr<Capability>> by_id_;

  Catalogue() = default;

public:
  static Catalogue& instance();

  // Throws Exception on a duplicate id or name, or when id is 0
  const Capability& add(Capability cap);

  const Capability* find(capability_id_t id) const noexcept;
  const Capability* find(std::string_view name) const noexcept;

  Catalogue(const Catalogue&) = delete;
  Catalogue& operator=(const Catalogue&) = delete;
};

} // namespace npbind
