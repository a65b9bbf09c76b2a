// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>

#include <npbind/impl/null_guard.hpp>
#include <npbind/impl/reference_bridge.hpp>

#include "logging.hpp"

namespace npbind::impl {

namespace {
bool has_capability(const CapabilitySet& caps, capability_id_t id) noexcept
{
  return std::any_of(caps.begin(), caps.end(),
                     [id](const Capability* c) { return c->id() == id; });
}

std::string capability_name(capability_id_t id)
{
  if (auto cap = Catalogue::instance().find(id))
    return cap->name();
  return "#" + std::to_string(id);
}
} // namespace

void check_values(const Args& values, const std::vector<Param>& types)
{
  if (values.size() != types.size()) {
    throw ExceptionBadInput("expected " + std::to_string(types.size()) +
                            " values, got " + std::to_string(values.size()));
  }

  for (std::size_t i = 0; i < values.size(); ++i) {
    auto t = type_of(values[i]);
    if (t != types[i].type) {
      throw ExceptionBadInput("value #" + std::to_string(i) + ": expected " +
                              std::string(to_string(types[i].type)) + ", got " +
                              std::string(to_string(t)));
    }
    if (t == ValueType::Object && types[i].capability != any_capability) {
      auto& obj = std::get<ObjectRef>(values[i]);
      if (obj && !has_capability(obj->capabilities(), types[i].capability)) {
        throw ExceptionBadInput("value #" + std::to_string(i) +
                                " does not implement " +
                                capability_name(types[i].capability));
      }
    }
  }
}

ReferenceBridge::ReferenceBridge(HandleTable& table,
                                 LifecycleMonitor& monitor,
                                 std::shared_ptr<ForeignTransport> transport)
    : table_{table}
    , monitor_{monitor}
    , transport_{std::move(transport)}
{
}

Handle ReferenceBridge::expose_to_foreign(const ObjectRef& obj,
                                          const CapabilitySet& caps)
{
  if (!obj)
    throw Exception("cannot expose a null object");

  auto reported = obj->capabilities();
  for (auto cap : caps) {
    if (!cap || !has_capability(reported, cap->id()))
      throw Exception("object does not implement " +
                      (cap ? cap->name() : std::string("(null)")));
  }

  auto recorded = std::make_shared<const CapabilitySet>(
      caps.empty() ? std::move(reported) : caps);

  for (;;) {
    auto current = obj->exported_handle_.load(std::memory_order_acquire);
    if (current != null_handle) {
      auto h = Handle::from_value(current);
      if (auto entry = table_.resolve(h); entry && entry->object == obj)
        return h;
    }

    auto h = table_.register_object(obj, recorded);
    if (obj->exported_handle_.compare_exchange_strong(
            current, h.value(), std::memory_order_acq_rel)) {
      monitor_.on_exposed(h, obj);
      NPBIND_LOG_TRACE("exposed object as handle {}", h.value());
      return h;
    }

    // exposed concurrently by another thread, use its handle
    table_.release(h);
  }
}

Handle ReferenceBridge::pin(const ObjectRef& obj)
{
  if (!obj)
    throw Exception("cannot pin a null object");
  return table_.register_object(
      obj, std::make_shared<const CapabilitySet>(obj->capabilities()));
}

std::shared_ptr<ForeignProxy>
ReferenceBridge::make_proxy(handle_t foreign_handle, const Capability& cap)
{
  ProxyInit init{owner_, foreign_handle, &cap};
  if (auto factory = cap.get_proxy_factory())
    return factory(std::move(init));
  return std::make_shared<ForeignProxy>(std::move(init));
}

std::shared_ptr<ForeignProxy>
ReferenceBridge::wrap_foreign_as_proxy(handle_t foreign_handle,
                                       const Capability& cap)
{
  if (foreign_handle == null_handle)
    return nullptr;

  if (!cap.is_identity_preserving())
    return make_proxy(foreign_handle, cap);

  std::unique_lock<std::mutex> lk(proxies_mut_);
  auto& slot = proxies_[ProxyKey{foreign_handle, cap.id()}];
  if (auto existing = slot.lock()) {
    lk.unlock();
    // the existing proxy already holds a reference
    release_foreign(foreign_handle);
    return existing;
  }

  auto proxy = make_proxy(foreign_handle, cap);
  slot = proxy;
  return proxy;
}

void ReferenceBridge::release_foreign(handle_t foreign_handle) noexcept
{
  if (!transport_) {
    NPBIND_LOG_WARN("no transport to release foreign handle {}",
                    foreign_handle);
    return;
  }
  transport_->release(foreign_handle);
}

void ReferenceBridge::on_proxy_destroyed(const ForeignProxy& proxy) noexcept
{
  if (proxy.capability().is_identity_preserving()) {
    std::lock_guard<std::mutex> lk(proxies_mut_);
    auto it = proxies_.find(
        ProxyKey{proxy.foreign_handle(), proxy.capability().id()});
    // the slot may already hold a newer proxy for the same handle
    if (it != proxies_.end() && it->second.expired())
      proxies_.erase(it);
  }
  release_foreign(proxy.foreign_handle());
}

ReleaseResult ReferenceBridge::release(Handle h) noexcept
{
  auto result = table_.release(h);
  if (result == ReleaseResult::Released)
    monitor_.on_released(h);
  else
    NPBIND_LOG_DEBUG("release of stale handle {}", h.value());
  return result;
}

WireRef ReferenceBridge::encode(const ObjectRef& obj)
{
  return null_guard::encode(obj, [this](const ObjectRef& o) {
    if (auto proxy = std::dynamic_pointer_cast<ForeignProxy>(o))
      return WireRef::foreign(proxy->foreign_handle());
    return WireRef::host(expose_to_foreign(o, {}).value());
  });
}

ObjectRef ReferenceBridge::decode(WireRef ref, const Param& param)
{
  return null_guard::decode(ref, [&](WireRef r) -> ObjectRef {
    if (r.kind == RefKind::Host) {
      auto entry = table_.resolve(Handle::from_value(r.value));
      if (!entry)
        throw ExceptionStaleHandle(r.value);
      if (param.capability != any_capability &&
          !has_capability(*entry->capabilities, param.capability)) {
        throw ExceptionBadInput("handle " + std::to_string(r.value) +
                                " does not implement " +
                                capability_name(param.capability));
      }
      return std::move(entry->object);
    }

    if (param.capability == any_capability) {
      // nothing to build a proxy from, drop the reference right away
      release_foreign(r.value);
      throw ExceptionBadInput("foreign reference for an untyped parameter");
    }

    auto cap = Catalogue::instance().find(param.capability);
    if (!cap) {
      release_foreign(r.value);
      throw ExceptionBadInput("unknown capability " +
                              std::to_string(param.capability));
    }
    return wrap_foreign_as_proxy(r.value, *cap);
  });
}

void ReferenceBridge::marshal(WireWriter& w,
                              const Args& values,
                              const std::vector<Param>& types)
{
  check_values(values, types);

  for (auto& v : values) {
    switch (type_of(v)) {
    case ValueType::Void:
      w.write_void();
      break;
    case ValueType::Bool:
      w.write_bool(std::get<bool>(v));
      break;
    case ValueType::Int32:
      w.write_int32(std::get<std::int32_t>(v));
      break;
    case ValueType::Int64:
      w.write_int64(std::get<std::int64_t>(v));
      break;
    case ValueType::Float64:
      w.write_float64(std::get<double>(v));
      break;
    case ValueType::String:
      w.write_string(std::get<std::string>(v));
      break;
    case ValueType::Bytes:
      w.write_bytes(std::get<Bytes>(v));
      break;
    case ValueType::Object:
      w.write_ref(encode(std::get<ObjectRef>(v)));
      break;
    case ValueType::Error:
      w.write_error(error_marshaller::to_foreign(std::get<Error>(v)));
      break;
    }
  }
}

Args ReferenceBridge::unmarshal(WireReader& r, const std::vector<Param>& types)
{
  auto n = r.read_count();
  if (n != types.size()) {
    release_unread(r, n);
    throw ExceptionBadInput("expected " + std::to_string(types.size()) +
                            " values, got " + std::to_string(n));
  }

  Args values;
  values.reserve(n);

  // values before `resume` are owned by `values`
  std::uint32_t done = 0;
  auto resume = r.position();

  try {
    for (auto& p : types) {
      switch (p.type) {
      case ValueType::Void:
        r.read_void();
        values.emplace_back(std::monostate{});
        break;
      case ValueType::Bool:
        values.emplace_back(r.read_bool());
        break;
      case ValueType::Int32:
        values.emplace_back(r.read_int32());
        break;
      case ValueType::Int64:
        values.emplace_back(r.read_int64());
        break;
      case ValueType::Float64:
        values.emplace_back(r.read_float64());
        break;
      case ValueType::String:
        values.emplace_back(r.read_string());
        break;
      case ValueType::Bytes:
        values.emplace_back(r.read_bytes());
        break;
      case ValueType::Object: {
        auto ref = r.read_ref();
        // decode takes over the reference, even when it throws
        ++done;
        resume = r.position();
        values.emplace_back(decode(ref, p));
        continue;
      }
      case ValueType::Error:
        values.emplace_back(error_marshaller::to_host(r.read_error()));
        break;
      }
      ++done;
      resume = r.position();
    }

    if (!r.at_end())
      throw ExceptionBadInput("trailing bytes after the last value");
  } catch (...) {
    r.seek(resume);
    release_unread(r, n - done);
    throw;
  }

  return values;
}

void ReferenceBridge::release_unread(WireReader& r,
                                     std::uint32_t count) noexcept
{
  WireRef ref;
  for (std::uint32_t i = 0; i < count && r.skip_value(ref); ++i) {
    if (ref.kind == RefKind::Foreign && ref.value != null_handle) {
      NPBIND_LOG_DEBUG("releasing undelivered foreign handle {}", ref.value);
      release_foreign(ref.value);
    }
  }
}

void ReferenceBridge::discard(WireReader& r) noexcept
{
  std::uint32_t n;
  if (r.try_read_count(n))
    release_unread(r, n);
}

std::size_t ReferenceBridge::proxy_count() const
{
  std::lock_guard<std::mutex> lk(proxies_mut_);
  return std::count_if(proxies_.begin(), proxies_.end(),
                       [](auto& kv) { return !kv.second.expired(); });
}

} // namespace npbind::impl
