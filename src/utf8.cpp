// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <nvbind/codec.hpp>

namespace nvbind {

NVBIND_API bool is_valid_utf8(std::string_view s) noexcept
{
  auto p = reinterpret_cast<const unsigned char*>(s.data());
  auto const end = p + s.size();

  while (p < end) {
    unsigned char const c = *p;
    if (c < 0x80) {
      ++p;
      continue;
    }

    std::size_t len;
    std::uint32_t cp;
    if ((c & 0xe0) == 0xc0) {
      len = 2;
      cp = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      len = 3;
      cp = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (static_cast<std::size_t>(end - p) < len)
      return false;

    for (std::size_t i = 1; i < len; ++i) {
      if ((p[i] & 0xc0) != 0x80)
        return false;
      cp = (cp << 6) | (p[i] & 0x3f);
    }

    // overlong forms
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000))
      return false;
    if (cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff))
      return false;

    p += len;
  }
  return true;
}

} // namespace nvbind
