// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <optional>
#include <tuple>

#include <npbind/impl/callback_dispatcher.hpp>
#include <npbind/wire.hpp>

#include "logging.hpp"

namespace npbind::impl {

bool PendingCall::complete(flat_buffer&& rx) noexcept
{
  bool late;
  {
    std::lock_guard<std::mutex> lk(mut);
    if (is_done()) {
      NPBIND_LOG_ERROR("request {} completed twice", request_id);
      return false;
    }
    state = State::Completed;
    late = abandoned;
    if (!late)
      reply = std::move(rx);
  }

  if (late) {
    NPBIND_LOG_DEBUG("discarding late reply for request {}", request_id);
    return false;
  }

  cv.notify_all();
  return true;
}

void PendingCall::fail(std::string what) noexcept
{
  {
    std::lock_guard<std::mutex> lk(mut);
    if (is_done())
      return;
    state = State::Failed;
    failure = std::move(what);
  }
  cv.notify_all();
}

bool PendingCall::wait(std::optional<std::chrono::milliseconds> timeout)
{
  std::unique_lock<std::mutex> lk(mut);
  auto done = [this] { return is_done(); };

  if (!timeout) {
    cv.wait(lk, done);
    return true;
  }

  if (cv.wait_for(lk, *timeout, done))
    return true;

  abandoned = true;
  return false;
}

CallbackDispatcher::CallbackDispatcher(
    HandleTable& table,
    ReferenceBridge& refs,
    ThreadRegistry& threads,
    std::shared_ptr<ForeignTransport> transport)
    : table_{table}
    , refs_{refs}
    , threads_{threads}
    , transport_{std::move(transport)}
{
}

Args CallbackDispatcher::invoke_foreign(
    handle_t foreign_handle,
    const Capability& cap,
    const MethodInfo& method,
    const Args& args,
    std::optional<std::chrono::milliseconds> timeout)
{
  if (!transport_)
    throw Exception("no foreign transport configured");
  if (foreign_handle == null_handle)
    throw ExceptionBadInput("call through a null foreign reference");

  auto call = std::make_shared<PendingCall>(
      foreign_handle, method.selector,
      next_request_id_.fetch_add(1, std::memory_order_relaxed));

  {
    WireWriter w(call->args, MessageId::FunctionCall, MessageType::Request,
                 call->request_id);
    w.begin_values();
    refs_.marshal(w, args, method.params);
    w.finish();
  }

  struct InFlight {
    std::atomic<std::size_t>& n;
    explicit InFlight(std::atomic<std::size_t>& n_) : n{n_} { ++n; }
    ~InFlight() { --n; }
  } in_flight{in_flight_};

  call->mark_sent();
  try {
    transport_->send_async(
        foreign_handle, method.selector, std::move(call->args),
        [call](flat_buffer&& reply) { call->complete(std::move(reply)); });
  } catch (std::exception& ex) {
    call->fail(ex.what());
    NPBIND_LOG_ERROR("failed to send {}.{} to foreign handle {}: {}",
                     cap.name(), method.name, foreign_handle, ex.what());
    throw;
  }

  if (!call->wait(timeout)) {
    NPBIND_LOG_WARN("{}.{} on foreign handle {} timed out after {} ms",
                    cap.name(), method.name, foreign_handle, timeout->count());
    throw ExceptionTimeout("call to " + cap.name() + "." + method.name +
                           " timed out");
  }

  if (call->state == PendingCall::State::Failed)
    throw Exception("call to " + cap.name() + "." + method.name +
                    " failed: " + call->failure);

  // completed: the reply is no longer touched by the transport
  WireReader reader(call->reply);
  auto header = reader.read_header();
  if (header.request_id != call->request_id)
    throw ExceptionBadInput("reply does not match the request");

  handle_standard_reply(reader, header, foreign_handle);
  return refs_.unmarshal(reader, method.results);
}

void CallbackDispatcher::call(const HandleTable::Entry& entry,
                              const Capability& cap,
                              const MethodInfo& method,
                              WireReader& reader,
                              std::uint32_t request_id,
                              flat_buffer& tx)
{
  auto args = refs_.unmarshal(reader, method.params);

  Args results;
  try {
    auto& obj = *entry.object;
    std::unique_lock<std::recursive_mutex> lk(obj.dispatch_mut_,
                                              std::defer_lock);
    if (obj.dispatch_policy() == DispatchPolicy::Serialized)
      lk.lock();
    obj.dispatch(cap, method, args, results);
    check_values(results, method.results);
  } catch (...) {
    // nothing thrown by host code reaches the foreign side
    auto err = error_marshaller::from_exception(std::current_exception());
    NPBIND_LOG_WARN("host fault in {}.{}: {}", cap.name(), method.name,
                    err.message());
    make_simple_answer(tx, MessageId::Exception, request_id, err.message());
    return;
  }

  tx.clear();
  WireWriter w(tx, MessageId::Success, MessageType::Answer, request_id);
  w.begin_values();
  refs_.marshal(w, results, method.results);
  w.finish();
}

template <typename Lookup>
void CallbackDispatcher::invoke_host_impl(handle_t handle,
                                          const flat_buffer& rx,
                                          flat_buffer& tx,
                                          Lookup&& lookup) noexcept
{
  std::uint32_t request_id = 0;

  try {
    WireReader reader(rx);
    auto header = reader.read_header();
    request_id = header.request_id;
    if (header.msg_id != MessageId::FunctionCall ||
        header.msg_type != MessageType::Request) {
      throw ExceptionBadInput("message is not a function call");
    }

    std::optional<HandleTable::Entry> entry;
    const Capability* cap = nullptr;
    const MethodInfo* method = nullptr;
    try {
      threads_.ensure_attached();

      entry = table_.resolve(Handle::from_value(handle));
      if (!entry)
        throw ExceptionStaleHandle(handle);

      std::tie(cap, method) = lookup(*entry->capabilities);
    } catch (...) {
      // the arguments are never unmarshaled
      refs_.discard(reader);
      throw;
    }

    call(*entry, *cap, *method, reader, request_id, tx);
  } catch (ExceptionStaleHandle& ex) {
    NPBIND_LOG_DEBUG("invoke_host: {}", ex.what());
    make_simple_answer(tx, MessageId::Error_StaleHandle, request_id,
                       ex.what());
  } catch (ExceptionNoSuchMethod& ex) {
    NPBIND_LOG_WARN("invoke_host: {}", ex.what());
    make_simple_answer(tx, MessageId::Error_NoSuchMethod, request_id,
                       ex.what());
  } catch (ExceptionBadInput& ex) {
    NPBIND_LOG_WARN("invoke_host: {}", ex.what());
    make_simple_answer(tx, MessageId::Error_BadInput, request_id, ex.what());
  } catch (ExceptionResourceExhausted& ex) {
    NPBIND_LOG_ERROR("invoke_host: {}", ex.what());
    make_simple_answer(tx, MessageId::Error_ResourceExhausted, request_id,
                       ex.what());
  } catch (...) {
    auto err = error_marshaller::from_exception(std::current_exception());
    NPBIND_LOG_ERROR("invoke_host: {}", err.message());
    make_simple_answer(tx, MessageId::Exception, request_id, err.message());
  }
}

void CallbackDispatcher::invoke_host(handle_t handle,
                                     selector_t selector,
                                     const flat_buffer& rx,
                                     flat_buffer& tx) noexcept
{
  invoke_host_impl(handle, rx, tx, [selector](const CapabilitySet& caps) {
    auto id = selector_capability(selector);
    auto it = std::find_if(caps.begin(), caps.end(),
                           [id](const Capability* c) { return c->id() == id; });
    if (it == caps.end())
      throw ExceptionNoSuchMethod("selector " + std::to_string(selector));
    auto method = (*it)->find(selector);
    if (!method)
      throw ExceptionNoSuchMethod((*it)->name() + " #" +
                                  std::to_string(selector_method(selector)));
    return std::make_pair(*it, method);
  });
}

void CallbackDispatcher::invoke_host(handle_t handle,
                                     std::string_view selector,
                                     const flat_buffer& rx,
                                     flat_buffer& tx) noexcept
{
  invoke_host_impl(handle, rx, tx, [selector](const CapabilitySet& caps) {
    // capability names may contain dots, the method name never does
    auto dot = selector.rfind('.');
    if (dot == std::string_view::npos)
      throw ExceptionNoSuchMethod(std::string(selector));
    auto cap_name = selector.substr(0, dot);
    auto method_name = selector.substr(dot + 1);

    auto it = std::find_if(
        caps.begin(), caps.end(),
        [cap_name](const Capability* c) { return c->name() == cap_name; });
    if (it == caps.end())
      throw ExceptionNoSuchMethod(std::string(selector));
    auto method = (*it)->find(method_name);
    if (!method)
      throw ExceptionNoSuchMethod(std::string(selector));
    return std::make_pair(*it, method);
  });
}

} // namespace npbind::impl
