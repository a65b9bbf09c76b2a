// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <npbind/asset.hpp>
#include <npbind/bridge.hpp>
#include <npbind/capability.hpp>
#include <npbind/error.hpp>
#include <npbind/exception.hpp>
#include <npbind/handle.hpp>
#include <npbind/object.hpp>
#include <npbind/transport.hpp>
#include <npbind/value.hpp>
#include <npbind/wire.hpp>
