// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <cstdio>

#include <nvbind/exception.hpp>
#include <nvbind/marker.hpp>

namespace nvbind {

NVBIND_API std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
  case ValueKind::Nil:
    return "Nil";
  case ValueKind::Boolean:
    return "Boolean";
  case ValueKind::Integer:
    return "Integer";
  case ValueKind::Float:
    return "Float";
  case ValueKind::String:
    return "String";
  case ValueKind::Array:
    return "Array";
  case ValueKind::Dictionary:
    return "Dictionary";
  case ValueKind::Handle:
    return "Handle";
  }
  return "Unknown";
}

namespace {

const char* marker_name(std::uint8_t m) noexcept
{
  using namespace marker;
  switch (m) {
  case nil:
    return "nil";
  case never_used:
    return "never used";
  case false_:
    return "false";
  case true_:
    return "true";
  case bin8:
    return "bin8";
  case bin16:
    return "bin16";
  case bin32:
    return "bin32";
  case ext8:
    return "ext8";
  case ext16:
    return "ext16";
  case ext32:
    return "ext32";
  case float32:
    return "float32";
  case float64:
    return "float64";
  case uint8:
    return "uint8";
  case uint16:
    return "uint16";
  case uint32:
    return "uint32";
  case uint64:
    return "uint64";
  case int8:
    return "int8";
  case int16:
    return "int16";
  case int32:
    return "int32";
  case int64:
    return "int64";
  case fixext1:
    return "fixext1";
  case fixext2:
    return "fixext2";
  case fixext4:
    return "fixext4";
  case fixext8:
    return "fixext8";
  case fixext16:
    return "fixext16";
  case str8:
    return "str8";
  case str16:
    return "str16";
  case str32:
    return "str32";
  case array16:
    return "array16";
  case array32:
    return "array32";
  case map16:
    return "map16";
  case map32:
    return "map32";
  }
  return nullptr;
}

} // namespace

NVBIND_API std::string describe_marker(std::uint8_t m)
{
  char buf[48];
  if (marker::is_positive_fixint(m)) {
    std::snprintf(buf, sizeof(buf), "0x%02x (positive fixint, %d)", m, m);
  } else if (marker::is_negative_fixint(m)) {
    std::snprintf(buf, sizeof(buf), "0x%02x (negative fixint, %d)", m,
                  static_cast<int>(static_cast<std::int8_t>(m)));
  } else if (marker::is_fixmap(m)) {
    std::snprintf(buf, sizeof(buf), "0x%02x (fixmap, %d)", m, m & 0x0f);
  } else if (marker::is_fixarray(m)) {
    std::snprintf(buf, sizeof(buf), "0x%02x (fixarray, %d)", m, m & 0x0f);
  } else if (marker::is_fixstr(m)) {
    std::snprintf(buf, sizeof(buf), "0x%02x (fixstr, %d)", m, m & 0x1f);
  } else {
    std::snprintf(buf, sizeof(buf), "0x%02x (%s)", m, marker_name(m));
  }
  return buf;
}

NVBIND_API MarkerMismatch::MarkerMismatch(ValueKind expected, std::uint8_t actual)
    : Exception("expected " + std::string(to_string(expected)) +
                ", got marker " + describe_marker(actual))
    , expected_(expected)
    , actual_(actual)
{
}

NVBIND_API MarkerMismatch::MarkerMismatch(ValueKind expected,
                                          std::uint8_t actual,
                                          std::string const& detail)
    : Exception("expected " + std::string(to_string(expected)) +
                ", got marker " + describe_marker(actual) + ": " + detail)
    , expected_(expected)
    , actual_(actual)
{
}

} // namespace nvbind
