// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>

#include <npbind/capability.hpp>
#include <npbind/exception.hpp>

#include "logging.hpp"

namespace npbind {

Capability::Capability(capability_id_t id, std::string name)
    : id_{id}
    , name_{std::move(name)}
{
}

Capability& Capability::method(std::string name,
                               std::vector<Param> params,
                               std::vector<Param> results)
{
  if (methods_.size() == 0xFFFF)
    throw Exception("too many methods in " + name_);
  if (find(name))
    throw Exception("duplicate method " + name_ + "." + name);

  MethodInfo m;
  m.name = std::move(name);
  m.params = std::move(params);
  m.results = std::move(results);
  m.index = static_cast<std::uint16_t>(methods_.size());
  m.selector = make_selector(id_, m.index);
  methods_.push_back(std::move(m));
  return *this;
}

const MethodInfo* Capability::find(selector_t selector) const noexcept
{
  if (selector_capability(selector) != id_)
    return nullptr;
  auto ix = selector_method(selector);
  return ix < methods_.size() ? &methods_[ix] : nullptr;
}

const MethodInfo* Capability::find(std::string_view method_name) const noexcept
{
  auto it = std::find_if(
      methods_.begin(), methods_.end(),
      [method_name](const MethodInfo& m) { return m.name == method_name; });
  return it != methods_.end() ? &*it : nullptr;
}

const MethodInfo& Capability::get(std::string_view method_name) const
{
  auto m = find(method_name);
  if (!m)
    throw ExceptionNoSuchMethod(name_ + "." + std::string(method_name));
  return *m;
}

Catalogue& Catalogue::instance()
{
  static Catalogue catalogue;
  return catalogue;
}

const Capability& Catalogue::add(Capability cap)
{
  if (cap.id() == any_capability)
    throw Exception("capability id 0 is reserved: " + cap.name());

  std::lock_guard<std::mutex> lk(mut_);
  if (by_id_.count(cap.id()))
    throw Exception("duplicate capability id " + std::to_string(cap.id()));
  for (auto& [id, c] : by_id_) {
    if (c->name() == cap.name())
      throw Exception("duplicate capability name " + cap.name());
  }

  auto id = cap.id();
  auto& slot = by_id_[id];
  slot = std::make_unique<Capability>(std::move(cap));
  NPBIND_LOG_DEBUG("capability {} registered as {}", slot->name(), id);
  return *slot;
}

const Capability* Catalogue::find(capability_id_t id) const noexcept
{
  std::lock_guard<std::mutex> lk(mut_);
  auto it = by_id_.find(id);
  return it != by_id_.end() ? it->second.get() : nullptr;
}

const Capability* Catalogue::find(std::string_view name) const noexcept
{
  std::lock_guard<std::mutex> lk(mut_);
  for (auto& [id, c] : by_id_) {
    if (c->name() == name)
      return c.get();
  }
  return nullptr;
}

} // namespace npbind
