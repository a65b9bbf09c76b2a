// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>

#include <npbind/impl/bridge_impl.hpp>
#include <npbind/object.hpp>

#include "logging.hpp"

namespace npbind {

bool HostObject::implements(const Capability& cap) const
{
  auto caps = capabilities();
  return std::any_of(caps.begin(), caps.end(), [&cap](const Capability* c) {
    return c->id() == cap.id();
  });
}

ForeignProxy::ForeignProxy(ProxyInit&& init)
    : bridge_{std::move(init.bridge)}
    , foreign_handle_{init.foreign_handle}
    , capability_{*init.capability}
{
}

ForeignProxy::~ForeignProxy()
{
  auto bridge = bridge_.lock();
  if (!bridge)
    return;

  try {
    bridge->references().on_proxy_destroyed(*this);
  } catch (std::exception& ex) {
    NPBIND_LOG_ERROR("failed to release foreign handle {}: {}",
                     foreign_handle_, ex.what());
  }
}

void ForeignProxy::dispatch(const Capability& cap,
                            const MethodInfo& method,
                            Args& args,
                            Args& results)
{
  if (cap.id() != capability_.id())
    throw ExceptionNoSuchMethod(cap.name() + "." + method.name);
  results = invoke(method, std::move(args));
}

Args ForeignProxy::invoke(const MethodInfo& method, Args args)
{
  auto bridge = bridge_.lock();
  if (!bridge)
    throw Exception("npbind is not initialized");
  return bridge->dispatcher().invoke_foreign(foreign_handle_, capability_,
                                             method, args, timeout_);
}

Args ForeignProxy::invoke(std::string_view method_name, Args args)
{
  return invoke(capability_.get(method_name), std::move(args));
}

} // namespace npbind
