// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <cmath>
#include <cstring>

#include <boost/endian/conversion.hpp>

#include <nvbind/codec.hpp>

namespace nvbind {

void Writer::put_u16(std::uint16_t v)
{
  std::uint8_t b[2];
  boost::endian::store_big_u16(b, v);
  buf_->append(b, sizeof(b));
}

void Writer::put_u32(std::uint32_t v)
{
  std::uint8_t b[4];
  boost::endian::store_big_u32(b, v);
  buf_->append(b, sizeof(b));
}

void Writer::put_u64(std::uint64_t v)
{
  std::uint8_t b[8];
  boost::endian::store_big_u64(b, v);
  buf_->append(b, sizeof(b));
}

// m8 == 0 means the family has no 8-bit length form (arrays, maps).
void Writer::write_length(std::size_t n,
                          std::uint8_t fix_marker,
                          std::size_t fix_limit,
                          std::uint8_t m8,
                          std::uint8_t m16,
                          std::uint8_t m32)
{
  if (n <= fix_limit) {
    put_u8(static_cast<std::uint8_t>(fix_marker | n));
  } else if (m8 != 0 && n <= 0xff) {
    put_u8(m8);
    put_u8(static_cast<std::uint8_t>(n));
  } else if (n <= 0xffff) {
    put_u8(m16);
    put_u16(static_cast<std::uint16_t>(n));
  } else if (n <= 0xffffffff) {
    put_u8(m32);
    put_u32(static_cast<std::uint32_t>(n));
  } else {
    throw EncodingError("length " + std::to_string(n) +
                        " does not fit in 32 bits");
  }
}

NVBIND_API void Writer::write_nil() { put_u8(marker::nil); }

NVBIND_API void Writer::write_boolean(bool v)
{
  put_u8(v ? marker::true_ : marker::false_);
}

NVBIND_API void Writer::write_unsigned(std::uint64_t v)
{
  if (v <= marker::positive_fixint_last) {
    put_u8(static_cast<std::uint8_t>(v));
  } else if (v <= 0xff) {
    put_u8(marker::uint8);
    put_u8(static_cast<std::uint8_t>(v));
  } else if (v <= 0xffff) {
    put_u8(marker::uint16);
    put_u16(static_cast<std::uint16_t>(v));
  } else if (v <= 0xffffffff) {
    put_u8(marker::uint32);
    put_u32(static_cast<std::uint32_t>(v));
  } else {
    put_u8(marker::uint64);
    put_u64(v);
  }
}

NVBIND_API void Writer::write_integer(std::int64_t v)
{
  if (v >= 0) {
    write_unsigned(static_cast<std::uint64_t>(v));
  } else if (v >= -32) {
    put_u8(static_cast<std::uint8_t>(v));
  } else if (v >= std::numeric_limits<std::int8_t>::min()) {
    put_u8(marker::int8);
    put_u8(static_cast<std::uint8_t>(v));
  } else if (v >= std::numeric_limits<std::int16_t>::min()) {
    put_u8(marker::int16);
    put_u16(static_cast<std::uint16_t>(v));
  } else if (v >= std::numeric_limits<std::int32_t>::min()) {
    put_u8(marker::int32);
    put_u32(static_cast<std::uint32_t>(v));
  } else {
    put_u8(marker::int64);
    put_u64(static_cast<std::uint64_t>(v));
  }
}

NVBIND_API void Writer::write_float(double v)
{
  bool const fits_float =
      !std::isfinite(v) || std::fabs(v) <= std::numeric_limits<float>::max();

  if (fits_float) {
    auto const f = static_cast<float>(v);
    if (static_cast<double>(f) == v) {
      std::uint32_t bits;
      std::memcpy(&bits, &f, sizeof(bits));
      put_u8(marker::float32);
      put_u32(bits);
      return;
    }
  }

  std::uint64_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  put_u8(marker::float64);
  put_u64(bits);
}

NVBIND_API void Writer::write_string(std::string_view s)
{
  if (!is_valid_utf8(s))
    throw EncodingError("refusing to encode a string that is not valid UTF-8");
  write_length(s.size(), marker::fixstr, 31, marker::str8, marker::str16,
               marker::str32);
  buf_->append(s.data(), s.size());
}

NVBIND_API void Writer::write_array_header(std::size_t n)
{
  write_length(n, marker::fixarray, 15, 0, marker::array16, marker::array32);
}

NVBIND_API void Writer::write_map_header(std::size_t n)
{
  write_length(n, marker::fixmap, 15, 0, marker::map16, marker::map32);
}

void Writer::write_handle_tagged(std::int8_t type_id, std::int64_t value)
{
  put_u8(marker::fixext8);
  put_u8(static_cast<std::uint8_t>(type_id));
  put_u64(static_cast<std::uint64_t>(value));
}

NVBIND_API void Writer::write_handle(const Handle& h)
{
  write_handle_tagged(registry_->type_id(h.kind), h.value);
}

NVBIND_API void Writer::write_value(const Value& v)
{
  switch (v.kind()) {
  case ValueKind::Nil:
    write_nil();
    break;
  case ValueKind::Boolean:
    write_boolean(v.as<bool>());
    break;
  case ValueKind::Integer:
    write_integer(v.as<std::int64_t>());
    break;
  case ValueKind::Float:
    write_float(v.as<double>());
    break;
  case ValueKind::String:
    write_string(v.as<std::string>());
    break;
  case ValueKind::Array:
    write(v.as<Array>());
    break;
  case ValueKind::Dictionary:
    write(v.as<Dictionary>());
    break;
  case ValueKind::Handle:
    write_handle(v.as<Handle>());
    break;
  }
}

} // namespace nvbind
