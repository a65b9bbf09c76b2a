// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#ifdef _MSC_VER
#ifdef NPBIND_EXPORTS
#define NPBIND_API __declspec(dllexport)
#else
#define NPBIND_API __declspec(dllimport)
#endif
#else
#if defined(__GNUC__) || defined(__clang__)
#define NPBIND_API __attribute__((visibility("default")))
#else
#define NPBIND_API
#endif
#endif

// Symbols of the foreign call entry points keep C linkage
#ifdef __cplusplus
#define NPBIND_EXTERN_C extern "C"
#else
#define NPBIND_EXTERN_C
#endif
