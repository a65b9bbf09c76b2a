// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

// C entry points for the foreign runtime. Nothing thrown inside the library
// crosses these functions.

#include <cstdlib>
#include <cstring>
#include <new>

#include <npbind/c_api.h>
#include <npbind/impl/bridge_impl.hpp>
#include <npbind/wire.hpp>

#include "logging.hpp"

namespace {

int copy_reply(const npbind::flat_buffer& tx, npbind_reply* reply) noexcept
{
  auto data = static_cast<std::uint8_t*>(std::malloc(tx.size()));
  if (!data)
    return NPBIND_E_NO_MEMORY;
  std::memcpy(data, tx.data_ptr(), tx.size());
  reply->data = data;
  reply->size = tx.size();
  return NPBIND_OK;
}

template <typename Invoke>
int invoke(const std::uint8_t* args,
           std::size_t args_size,
           npbind_reply* reply,
           Invoke&& fn) noexcept
{
  if (!reply || (!args && args_size > 0))
    return NPBIND_E_INVALID_ARGUMENT;

  reply->data = nullptr;
  reply->size = 0;

  try {
    npbind::flat_buffer tx;
    auto bridge = npbind::impl::current_bridge();
    if (!bridge) {
      npbind::make_simple_answer(tx, npbind::MessageId::Error_NotInitialized,
                                 0, "npbind is not initialized");
      // the reply is informational, the return code is what matters
      if (copy_reply(tx, reply) != NPBIND_OK)
        return NPBIND_E_NO_MEMORY;
      return NPBIND_E_NOT_INITIALIZED;
    }

    npbind::flat_buffer rx;
    rx.append(args, args_size);
    fn(*bridge, rx, tx);
    return copy_reply(tx, reply);
  } catch (std::bad_alloc&) {
    return NPBIND_E_NO_MEMORY;
  }
}

} // namespace

NPBIND_EXTERN_C NPBIND_API int npbind_invoke_host(uint64_t handle,
                                                  uint32_t selector,
                                                  const uint8_t* args,
                                                  size_t args_size,
                                                  npbind_reply* reply)
{
  return invoke(args, args_size, reply,
                [handle, selector](npbind::impl::BridgeImpl& bridge,
                                   const npbind::flat_buffer& rx,
                                   npbind::flat_buffer& tx) {
                  bridge.invoke_host(handle, selector, rx, tx);
                });
}

NPBIND_EXTERN_C NPBIND_API int npbind_invoke_host_by_name(uint64_t handle,
                                                          const char* selector,
                                                          const uint8_t* args,
                                                          size_t args_size,
                                                          npbind_reply* reply)
{
  if (!selector)
    return NPBIND_E_INVALID_ARGUMENT;

  std::string_view name(selector);
  return invoke(args, args_size, reply,
                [handle, name](npbind::impl::BridgeImpl& bridge,
                               const npbind::flat_buffer& rx,
                               npbind::flat_buffer& tx) {
                  bridge.invoke_host(handle, name, rx, tx);
                });
}

NPBIND_EXTERN_C NPBIND_API int npbind_release(uint64_t handle)
{
  auto bridge = npbind::impl::current_bridge();
  if (!bridge)
    return NPBIND_E_NOT_INITIALIZED;
  return bridge->release(handle) == npbind::ReleaseResult::Released
             ? NPBIND_OK
             : NPBIND_STALE_HANDLE;
}

NPBIND_EXTERN_C NPBIND_API void npbind_reply_free(npbind_reply* reply)
{
  if (!reply)
    return;
  std::free(reply->data);
  reply->data = nullptr;
  reply->size = 0;
}
