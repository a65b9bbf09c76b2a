// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <fstream>
#include <iterator>

#include <npbind/asset.hpp>

#include "logging.hpp"

namespace npbind {

namespace {
constexpr const char* system_font_dir = "/usr/share/fonts/truetype";

Bytes read_with_fallback(AssetSource& fonts,
                         std::string_view preferred,
                         std::string_view fallback)
{
  try {
    return fonts.open(preferred);
  } catch (ExceptionAssetNotFound& preferred_error) {
    try {
      return fonts.open(fallback);
    } catch (ExceptionAssetNotFound&) {
      // report why the preferred font is missing
      throw preferred_error;
    }
  }
}
} // namespace

FileAssetSource::FileAssetSource(std::filesystem::path root)
    : root_{std::move(root)}
{
}

Bytes FileAssetSource::open(std::string_view name)
{
  std::filesystem::path rel(name);
  if (name.empty() || rel.is_absolute())
    throw ExceptionAssetNotFound(std::string(name));
  for (auto& part : rel) {
    if (part == "..")
      throw ExceptionAssetNotFound(std::string(name));
  }

  auto path = root_ / rel;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
    throw ExceptionAssetNotFound(path.string());

  std::ifstream is(path, std::ios_base::in | std::ios_base::binary);
  if (!is)
    throw ExceptionAssetNotFound(path.string());

  Bytes data((std::istreambuf_iterator<char>(is)),
             std::istreambuf_iterator<char>());
  NPBIND_LOG_TRACE("asset {} loaded, {} bytes", path.string(), data.size());
  return data;
}

namespace font {

NPBIND_API Bytes default_font(AssetSource& fonts)
{
  return read_with_fallback(fonts, "noto/NotoSans-Regular.ttf",
                            "droid/DroidSans.ttf");
}

NPBIND_API Bytes default_font()
{
  FileAssetSource fonts(system_font_dir);
  return default_font(fonts);
}

NPBIND_API Bytes monospace_font(AssetSource& fonts)
{
  return read_with_fallback(fonts, "noto/NotoMono-Regular.ttf",
                            "droid/DroidSansMono.ttf");
}

NPBIND_API Bytes monospace_font()
{
  FileAssetSource fonts(system_font_dir);
  return monospace_font(fonts);
}

} // namespace font

} // namespace npbind
