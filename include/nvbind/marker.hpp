// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nvbind/export.hpp>

namespace nvbind {

// Categories of the value model. Also used to report what a decoder expected
// when the wire disagreed.
enum class ValueKind : std::uint8_t {
  Nil,
  Boolean,
  Integer,
  Float,
  String,
  Array,
  Dictionary,
  Handle,
};

NVBIND_API std::string_view to_string(ValueKind kind) noexcept;

// MessagePack marker bytes. Fix families occupy a range; the constant names the
// first byte of the range and the payload (length or value) lives in the low
// bits.
namespace marker {
constexpr std::uint8_t positive_fixint = 0x00;
constexpr std::uint8_t positive_fixint_last = 0x7f;
constexpr std::uint8_t fixmap = 0x80;
constexpr std::uint8_t fixmap_last = 0x8f;
constexpr std::uint8_t fixarray = 0x90;
constexpr std::uint8_t fixarray_last = 0x9f;
constexpr std::uint8_t fixstr = 0xa0;
constexpr std::uint8_t fixstr_last = 0xbf;
constexpr std::uint8_t nil = 0xc0;
constexpr std::uint8_t never_used = 0xc1;
constexpr std::uint8_t false_ = 0xc2;
constexpr std::uint8_t true_ = 0xc3;
constexpr std::uint8_t bin8 = 0xc4;
constexpr std::uint8_t bin16 = 0xc5;
constexpr std::uint8_t bin32 = 0xc6;
constexpr std::uint8_t ext8 = 0xc7;
constexpr std::uint8_t ext16 = 0xc8;
constexpr std::uint8_t ext32 = 0xc9;
constexpr std::uint8_t float32 = 0xca;
constexpr std::uint8_t float64 = 0xcb;
constexpr std::uint8_t uint8 = 0xcc;
constexpr std::uint8_t uint16 = 0xcd;
constexpr std::uint8_t uint32 = 0xce;
constexpr std::uint8_t uint64 = 0xcf;
constexpr std::uint8_t int8 = 0xd0;
constexpr std::uint8_t int16 = 0xd1;
constexpr std::uint8_t int32 = 0xd2;
constexpr std::uint8_t int64 = 0xd3;
constexpr std::uint8_t fixext1 = 0xd4;
constexpr std::uint8_t fixext2 = 0xd5;
constexpr std::uint8_t fixext4 = 0xd6;
constexpr std::uint8_t fixext8 = 0xd7;
constexpr std::uint8_t fixext16 = 0xd8;
constexpr std::uint8_t str8 = 0xd9;
constexpr std::uint8_t str16 = 0xda;
constexpr std::uint8_t str32 = 0xdb;
constexpr std::uint8_t array16 = 0xdc;
constexpr std::uint8_t array32 = 0xdd;
constexpr std::uint8_t map16 = 0xde;
constexpr std::uint8_t map32 = 0xdf;
constexpr std::uint8_t negative_fixint = 0xe0;

constexpr bool is_positive_fixint(std::uint8_t m) noexcept { return m <= positive_fixint_last; }
constexpr bool is_negative_fixint(std::uint8_t m) noexcept { return m >= negative_fixint; }
constexpr bool is_fixmap(std::uint8_t m) noexcept { return m >= fixmap && m <= fixmap_last; }
constexpr bool is_fixarray(std::uint8_t m) noexcept { return m >= fixarray && m <= fixarray_last; }
constexpr bool is_fixstr(std::uint8_t m) noexcept { return m >= fixstr && m <= fixstr_last; }
} // namespace marker

/**
 * @brief Human readable form of a marker byte, e.g. "0xcd (uint16)" or
 * "0x93 (fixarray, 3)". Used in mismatch diagnostics.
 */
NVBIND_API std::string describe_marker(std::uint8_t m);

} // namespace nvbind
