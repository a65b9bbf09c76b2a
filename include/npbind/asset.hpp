// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <string_view>

#include <npbind/export.hpp>
#include <npbind/value.hpp>

namespace npbind {

// Synchronous read-only access to named assets
class AssetSource
{
public:
  virtual ~AssetSource() = default;

  // Throws ExceptionAssetNotFound
  virtual Bytes open(std::string_view name) = 0;
};

class NPBIND_API FileAssetSource : public AssetSource
{
  std::filesystem::path root_;

public:
  explicit FileAssetSource(std::filesystem::path root);

  const std::filesystem::path& root() const noexcept { return root_; }

  // Names are relative to the root; absolute names and ".." are rejected
  Bytes open(std::string_view name) override;
};

namespace font {

// Noto Sans, falling back to Droid Sans
NPBIND_API Bytes default_font(AssetSource& fonts);
NPBIND_API Bytes default_font();

// Noto Mono, falling back to Droid Sans Mono
NPBIND_API Bytes monospace_font(AssetSource& fonts);
NPBIND_API Bytes monospace_font();

} // namespace font

} // namespace npbind
