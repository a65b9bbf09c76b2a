/* Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com> */
/* SPDX-License-Identifier: MIT */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <npbind/export.hpp>

/* Reply buffer owned by the library, free with npbind_reply_free() */
typedef struct npbind_reply {
  uint8_t* data;
  size_t size;
} npbind_reply;

/* Return codes */
#define NPBIND_OK 0
#define NPBIND_E_NOT_INITIALIZED (-1)
#define NPBIND_E_INVALID_ARGUMENT (-2)
#define NPBIND_E_NO_MEMORY (-3)
#define NPBIND_STALE_HANDLE 1

/* On NPBIND_OK the outcome of the call is the message id of the reply. */
NPBIND_EXTERN_C NPBIND_API int npbind_invoke_host(uint64_t handle,
                                                  uint32_t selector,
                                                  const uint8_t* args,
                                                  size_t args_size,
                                                  npbind_reply* reply);

/* selector is a NUL-terminated "Capability.Method" */
NPBIND_EXTERN_C NPBIND_API int npbind_invoke_host_by_name(uint64_t handle,
                                                          const char* selector,
                                                          const uint8_t* args,
                                                          size_t args_size,
                                                          npbind_reply* reply);

/* NPBIND_OK when released, NPBIND_STALE_HANDLE when already stale */
NPBIND_EXTERN_C NPBIND_API int npbind_release(uint64_t handle);

NPBIND_EXTERN_C NPBIND_API void npbind_reply_free(npbind_reply* reply);
