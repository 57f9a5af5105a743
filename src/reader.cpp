// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <cstring>

#include <boost/endian/conversion.hpp>

#include <nvbind/codec.hpp>

namespace nvbind {

const std::uint8_t* Reader::take(std::size_t n)
{
  if (n > remaining()) {
    throw TransportError("unexpected end of input: need " + std::to_string(n) +
                         " bytes at offset " + std::to_string(pos_) +
                         ", have " + std::to_string(remaining()));
  }
  auto p = data_.data() + pos_;
  pos_ += n;
  return p;
}

std::uint16_t Reader::take_u16()
{
  return boost::endian::load_big_u16(take(2));
}

std::uint32_t Reader::take_u32()
{
  return boost::endian::load_big_u32(take(4));
}

std::uint64_t Reader::take_u64()
{
  return boost::endian::load_big_u64(take(8));
}

NVBIND_API std::uint8_t Reader::peek() const
{
  if (pos_ >= data_.size())
    throw TransportError("unexpected end of input at offset " +
                         std::to_string(pos_));
  return data_[pos_];
}

NVBIND_API void Reader::read_nil()
{
  auto const m = take_u8();
  if (m != marker::nil)
    throw MarkerMismatch(ValueKind::Nil, m);
}

NVBIND_API bool Reader::read_boolean()
{
  auto const m = take_u8();
  switch (m) {
  case marker::true_:
    return true;
  case marker::false_:
    return false;
  default:
    throw MarkerMismatch(ValueKind::Boolean, m);
  }
}

std::int64_t Reader::read_integer_payload(std::uint8_t m)
{
  if (marker::is_positive_fixint(m))
    return m;
  if (marker::is_negative_fixint(m))
    return static_cast<std::int8_t>(m);

  switch (m) {
  case marker::uint8:
    return take_u8();
  case marker::uint16:
    return take_u16();
  case marker::uint32:
    return take_u32();
  case marker::uint64:
    // values above INT64_MAX wrap to negative
    return static_cast<std::int64_t>(take_u64());
  case marker::int8:
    return static_cast<std::int8_t>(take_u8());
  case marker::int16:
    return static_cast<std::int16_t>(take_u16());
  case marker::int32:
    return static_cast<std::int32_t>(take_u32());
  case marker::int64:
    return static_cast<std::int64_t>(take_u64());
  default:
    throw MarkerMismatch(ValueKind::Integer, m);
  }
}

NVBIND_API std::int64_t Reader::read_integer()
{
  return read_integer_payload(take_u8());
}

NVBIND_API double Reader::read_float()
{
  auto const m = take_u8();
  switch (m) {
  case marker::float32: {
    auto const bits = take_u32();
    float f;
    static_assert(sizeof(f) == sizeof(bits));
    std::memcpy(&f, &bits, sizeof(f));
    return f;
  }
  case marker::float64: {
    auto const bits = take_u64();
    double d;
    static_assert(sizeof(d) == sizeof(bits));
    std::memcpy(&d, &bits, sizeof(d));
    return d;
  }
  default:
    throw MarkerMismatch(ValueKind::Float, m);
  }
}

std::string Reader::read_string_payload(std::size_t len)
{
  auto p = reinterpret_cast<const char*>(take(len));
  std::string s(p, len);
  if (!is_valid_utf8(s))
    throw EncodingError("string payload at offset " +
                        std::to_string(pos_ - len) + " is not valid UTF-8");
  return s;
}

NVBIND_API std::string Reader::read_string()
{
  auto const m = take_u8();
  if (marker::is_fixstr(m))
    return read_string_payload(m & 0x1f);

  switch (m) {
  case marker::str8:
    return read_string_payload(take_u8());
  case marker::str16:
    return read_string_payload(take_u16());
  case marker::str32:
    return read_string_payload(take_u32());
  default:
    throw MarkerMismatch(ValueKind::String, m);
  }
}

NVBIND_API std::uint32_t Reader::read_array_header()
{
  auto const m = take_u8();
  std::uint32_t n;
  if (marker::is_fixarray(m))
    n = m & 0x0f;
  else if (m == marker::array16)
    n = take_u16();
  else if (m == marker::array32)
    n = take_u32();
  else
    throw MarkerMismatch(ValueKind::Array, m);

  // every element takes at least one byte
  if (n > remaining())
    throw TransportError("array of " + std::to_string(n) +
                         " elements runs past the end of input");
  return n;
}

NVBIND_API std::uint32_t Reader::read_map_header()
{
  auto const m = take_u8();
  std::uint32_t n;
  if (marker::is_fixmap(m))
    n = m & 0x0f;
  else if (m == marker::map16)
    n = take_u16();
  else if (m == marker::map32)
    n = take_u32();
  else
    throw MarkerMismatch(ValueKind::Dictionary, m);

  if (static_cast<std::uint64_t>(n) * 2 > remaining())
    throw TransportError("map of " + std::to_string(n) +
                         " entries runs past the end of input");
  return n;
}

Handle Reader::read_handle_payload(std::uint8_t m)
{
  std::int8_t tag;
  std::int64_t value;

  if (m == marker::fixext8) {
    tag = static_cast<std::int8_t>(take_u8());
    value = static_cast<std::int64_t>(take_u64());
  } else {
    std::size_t len;
    switch (m) {
    case marker::fixext1:
      len = 1;
      break;
    case marker::fixext2:
      len = 2;
      break;
    case marker::fixext4:
      len = 4;
      break;
    case marker::fixext16:
      len = 16;
      break;
    case marker::ext8:
      len = take_u8();
      break;
    case marker::ext16:
      len = take_u16();
      break;
    case marker::ext32:
      len = take_u32();
      break;
    default:
      throw MarkerMismatch(ValueKind::Handle, m);
    }

    tag = static_cast<std::int8_t>(take_u8());
    auto const payload = take(len);

    // Neovim's own form: the extension data is a packed integer.
    Reader inner(std::span<const std::uint8_t>(payload, len), *registry_);
    try {
      value = inner.read_integer();
    } catch (const TransportError&) {
      throw MarkerMismatch(ValueKind::Handle, m,
                           "truncated integer in handle payload");
    } catch (const MarkerMismatch& e) {
      throw MarkerMismatch(ValueKind::Handle, m,
                           "handle payload starts with marker " +
                               describe_marker(e.actual()));
    }
    if (!inner.at_end())
      throw MarkerMismatch(ValueKind::Handle, m,
                           "trailing bytes in handle payload");
  }

  auto const kind = registry_->find_kind(tag);
  if (!kind)
    throw MarkerMismatch(ValueKind::Handle, m,
                         "unknown handle type id " + std::to_string(tag));
  return Handle{*kind, value};
}

NVBIND_API Handle Reader::read_handle()
{
  return read_handle_payload(take_u8());
}

NVBIND_API Value Reader::read_value()
{
  auto const m = peek();

  if (marker::is_positive_fixint(m) || marker::is_negative_fixint(m) ||
      (m >= marker::uint8 && m <= marker::int64)) {
    return read_integer();
  }
  if (marker::is_fixstr(m) || (m >= marker::str8 && m <= marker::str32))
    return read_string();

  if (marker::is_fixarray(m) || m == marker::array16 || m == marker::array32) {
    auto const n = read_array_header();
    Array a;
    a.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i)
      a.push_back(read_value());
    return a;
  }

  if (marker::is_fixmap(m) || m == marker::map16 || m == marker::map32) {
    auto const n = read_map_header();
    Dictionary d;
    d.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) {
      auto key = read_value();
      auto value = read_value();
      d.insert_or_assign(std::move(key), std::move(value));
    }
    return d;
  }

  switch (m) {
  case marker::nil:
    ++pos_;
    return Nil{};
  case marker::false_:
  case marker::true_:
    return read_boolean();
  case marker::float32:
  case marker::float64:
    return read_float();
  case marker::fixext1:
  case marker::fixext2:
  case marker::fixext4:
  case marker::fixext8:
  case marker::fixext16:
  case marker::ext8:
  case marker::ext16:
  case marker::ext32:
    return read_handle();
  default:
    throw EncodingError("marker " + describe_marker(m) +
                        " has no representation in the value model");
  }
}

NVBIND_API void Reader::skip()
{
  // values still to step over; containers add their children
  std::uint64_t left = 1;
  while (left > 0) {
    --left;
    auto const m = take_u8();
    if (marker::is_positive_fixint(m) || marker::is_negative_fixint(m))
      continue;
    if (marker::is_fixstr(m)) {
      take(m & 0x1f);
      continue;
    }
    if (marker::is_fixarray(m)) {
      left += m & 0x0f;
      continue;
    }
    if (marker::is_fixmap(m)) {
      left += 2u * (m & 0x0f);
      continue;
    }

    switch (m) {
    case marker::nil:
    case marker::false_:
    case marker::true_:
      break;
    case marker::bin8:
    case marker::str8:
      take(take_u8());
      break;
    case marker::bin16:
    case marker::str16:
      take(take_u16());
      break;
    case marker::bin32:
    case marker::str32:
      take(take_u32());
      break;
    case marker::ext8:
      take(1 + std::size_t{take_u8()});
      break;
    case marker::ext16:
      take(1 + std::size_t{take_u16()});
      break;
    case marker::ext32:
      take(1 + std::size_t{take_u32()});
      break;
    case marker::uint8:
    case marker::int8:
      take(1);
      break;
    case marker::uint16:
    case marker::int16:
      take(2);
      break;
    case marker::uint32:
    case marker::int32:
    case marker::float32:
      take(4);
      break;
    case marker::uint64:
    case marker::int64:
    case marker::float64:
      take(8);
      break;
    case marker::fixext1:
      take(2);
      break;
    case marker::fixext2:
      take(3);
      break;
    case marker::fixext4:
      take(5);
      break;
    case marker::fixext8:
      take(9);
      break;
    case marker::fixext16:
      take(17);
      break;
    case marker::array16:
      left += take_u16();
      break;
    case marker::array32:
      left += take_u32();
      break;
    case marker::map16:
      left += 2u * take_u16();
      break;
    case marker::map32:
      left += 2u * std::uint64_t{take_u32()};
      break;
    default:
      throw EncodingError("marker " + describe_marker(m) + " at offset " +
                          std::to_string(pos_ - 1) + " cannot be skipped");
    }
  }
}

} // namespace nvbind
