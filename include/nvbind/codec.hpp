// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <nvbind/exception.hpp>
#include <nvbind/export.hpp>
#include <nvbind/flat_buffer.hpp>
#include <nvbind/handle.hpp>
#include <nvbind/value.hpp>

namespace nvbind {

/// True if the bytes form well formed UTF-8 (no overlongs, no surrogates,
/// nothing above U+10FFFF).
NVBIND_API bool is_valid_utf8(std::string_view s) noexcept;

/**
 * @brief Lazily produced, sized run of elements.
 *
 * Parameter type of array arguments: the writer asks for the length first and
 * then pulls the elements one at a time, so nothing is materialised. Ranges
 * are referenced, not copied, and must outlive the encoding (a stub encodes
 * before it returns).
 */
template <typename T> class Sequence
{
public:
  using value_type = T;
  using sink_type = std::function<void(T)>;

  Sequence() = default;

  Sequence(std::size_t size, std::function<T(std::size_t)> generator)
      : size_(size)
      , each_([size, gen = std::move(generator)](const sink_type& sink) {
        for (std::size_t i = 0; i < size; ++i)
          sink(gen(i));
      })
  {
  }

  template <std::ranges::sized_range R>
    requires(!std::is_same_v<std::remove_cvref_t<R>, Sequence> &&
             std::is_constructible_v<T, std::ranges::range_reference_t<R>>)
  Sequence(R&& range)
      : size_(static_cast<std::size_t>(std::ranges::size(range)))
      , each_([r = &range](const sink_type& sink) {
        for (auto&& x : *r)
          sink(T(x));
      })
  {
  }

  Sequence(std::initializer_list<T> items)
      : size_(items.size())
      , each_([items](const sink_type& sink) {
        for (auto const& x : items)
          sink(T(x));
      })
  {
  }

  std::size_t size() const noexcept { return size_; }

  void for_each(const sink_type& sink) const
  {
    if (each_)
      each_(sink);
  }

private:
  std::size_t size_ = 0;
  std::function<void(const sink_type&)> each_;
};

namespace detail {
template <typename T> struct is_vector : std::false_type {
};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {
};

template <typename T> struct is_std_array : std::false_type {
};
template <typename T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {
};

template <typename T> struct is_sequence : std::false_type {
};
template <typename T> struct is_sequence<Sequence<T>> : std::true_type {
};

template <typename T>
constexpr bool is_typed_handle_v = std::is_base_of_v<BasicHandle<T>, T>;

template <typename T>
constexpr bool is_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> &&
    !std::is_same_v<T, char>;
} // namespace detail

/**
 * @brief Decodes MessagePack from a byte range.
 *
 * Every read starts at a value boundary and dispatches on the marker byte.
 * A marker outside the requested category throws MarkerMismatch, running out
 * of input throws TransportError and a bad string payload throws
 * EncodingError. After a throw the position is unspecified.
 */
class Reader
{
  std::span<const std::uint8_t> data_;
  std::size_t pos_ = 0;
  const HandleRegistry* registry_;

  const std::uint8_t* take(std::size_t n);
  std::uint8_t take_u8() { return *take(1); }
  std::uint16_t take_u16();
  std::uint32_t take_u32();
  std::uint64_t take_u64();

  std::int64_t read_integer_payload(std::uint8_t m);
  Handle read_handle_payload(std::uint8_t m);
  std::string read_string_payload(std::size_t len);

public:
  explicit Reader(std::span<const std::uint8_t> data,
                  const HandleRegistry& registry = HandleRegistry::neovim())
      : data_(data)
      , registry_(&registry)
  {
  }

  explicit Reader(const flat_buffer& buf,
                  const HandleRegistry& registry = HandleRegistry::neovim())
      : Reader(buf.bytes(), registry)
  {
  }

  /// Next marker byte without consuming it.
  NVBIND_API std::uint8_t peek() const;

  NVBIND_API void read_nil();
  NVBIND_API bool read_boolean();
  NVBIND_API std::int64_t read_integer();
  NVBIND_API double read_float();
  NVBIND_API std::string read_string();
  NVBIND_API std::uint32_t read_array_header();
  NVBIND_API std::uint32_t read_map_header();
  NVBIND_API Handle read_handle();
  NVBIND_API Value read_value();

  /// Steps over one value using only its framing: string contents, bin
  /// payloads and ext tags are not checked. Throws TransportError if the
  /// value is incomplete and EncodingError on the never-used marker 0xc1.
  NVBIND_API void skip();

  template <typename T> T read();

  std::size_t position() const noexcept { return pos_; }
  std::size_t remaining() const noexcept { return data_.size() - pos_; }
  bool at_end() const noexcept { return pos_ == data_.size(); }
  const HandleRegistry& registry() const noexcept { return *registry_; }
};

/**
 * @brief Encodes MessagePack into a flat_buffer.
 *
 * Integers and lengths always take the most compact form; handles are always
 * written as fixext8.
 */
class Writer
{
  flat_buffer* buf_;
  const HandleRegistry* registry_;

  void put_u8(std::uint8_t v) { buf_->append(&v, 1); }
  void put_u16(std::uint16_t v);
  void put_u32(std::uint32_t v);
  void put_u64(std::uint64_t v);
  void write_length(std::size_t n,
                    std::uint8_t fix_marker,
                    std::size_t fix_limit,
                    std::uint8_t m8,
                    std::uint8_t m16,
                    std::uint8_t m32);
  void write_handle_tagged(std::int8_t type_id, std::int64_t value);

public:
  explicit Writer(flat_buffer& buf,
                  const HandleRegistry& registry = HandleRegistry::neovim())
      : buf_(&buf)
      , registry_(&registry)
  {
  }

  NVBIND_API void write_nil();
  NVBIND_API void write_boolean(bool v);
  NVBIND_API void write_integer(std::int64_t v);
  NVBIND_API void write_unsigned(std::uint64_t v);
  NVBIND_API void write_float(double v);
  NVBIND_API void write_string(std::string_view s);
  NVBIND_API void write_array_header(std::size_t n);
  NVBIND_API void write_map_header(std::size_t n);
  NVBIND_API void write_handle(const Handle& h);
  NVBIND_API void write_value(const Value& v);

  template <typename Derived> void write_handle(const BasicHandle<Derived>& h)
  {
    write_handle_tagged(Derived::type_id, h.get());
  }

  template <typename T> void write(const T& v);

  /// Array of the arguments, in order. Used for call parameter tuples.
  template <typename... Args> void write_tuple(const Args&... args)
  {
    write_array_header(sizeof...(Args));
    (write(args), ...);
  }

  flat_buffer& buffer() noexcept { return *buf_; }
  const HandleRegistry& registry() const noexcept { return *registry_; }
};

//--------------------------------------------------------------------------
// Typed reads
//--------------------------------------------------------------------------

template <typename T> T Reader::read()
{
  if constexpr (std::is_same_v<T, Value>) {
    return read_value();
  } else if constexpr (std::is_same_v<T, Nil>) {
    read_nil();
    return Nil{};
  } else if constexpr (std::is_same_v<T, bool>) {
    return read_boolean();
  } else if constexpr (detail::is_integer_v<T>) {
    auto const m = peek();
    auto const v = read_integer();
    if constexpr (std::is_same_v<T, std::int64_t>) {
      return v;
    } else {
      if (!std::in_range<T>(v)) {
        throw MarkerMismatch(ValueKind::Integer, m,
                             "value " + std::to_string(v) +
                                 " does not fit the target type");
      }
      return static_cast<T>(v);
    }
  } else if constexpr (std::is_floating_point_v<T>) {
    return static_cast<T>(read_float());
  } else if constexpr (std::is_same_v<T, std::string>) {
    return read_string();
  } else if constexpr (std::is_same_v<T, Array>) {
    auto const m = peek();
    auto v = read_value();
    if (!v.is<Array>())
      throw MarkerMismatch(ValueKind::Array, m);
    return std::move(v.as<Array>());
  } else if constexpr (std::is_same_v<T, Dictionary>) {
    auto const m = peek();
    auto v = read_value();
    if (!v.is<Dictionary>())
      throw MarkerMismatch(ValueKind::Dictionary, m);
    return std::move(v.as<Dictionary>());
  } else if constexpr (std::is_same_v<T, Handle>) {
    return read_handle();
  } else if constexpr (detail::is_typed_handle_v<T>) {
    auto const m = peek();
    auto const h = read_handle();
    if (h.kind != T::kind) {
      throw MarkerMismatch(ValueKind::Handle, m,
                           "got a " + std::string(to_string(h.kind)) +
                               " handle, wanted " +
                               std::string(to_string(T::kind)));
    }
    return T(h.value);
  } else if constexpr (detail::is_vector<T>::value) {
    auto const n = read_array_header();
    T out;
    out.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i)
      out.push_back(read<typename T::value_type>());
    return out;
  } else if constexpr (detail::is_std_array<T>::value) {
    auto const m = peek();
    auto const n = read_array_header();
    if (n != std::tuple_size_v<T>) {
      throw MarkerMismatch(ValueKind::Array, m,
                           "fixed array of " +
                               std::to_string(std::tuple_size_v<T>) +
                               " elements, wire has " + std::to_string(n));
    }
    T out{};
    for (auto& x : out)
      x = read<typename T::value_type>();
    return out;
  } else {
    static_assert(sizeof(T) == 0, "type cannot be decoded");
  }
}

//--------------------------------------------------------------------------
// Typed writes
//--------------------------------------------------------------------------

template <typename T> void Writer::write(const T& v)
{
  if constexpr (std::is_same_v<T, Value>) {
    write_value(v);
  } else if constexpr (std::is_same_v<T, Nil>) {
    write_nil();
  } else if constexpr (std::is_same_v<T, bool>) {
    write_boolean(v);
  } else if constexpr (detail::is_integer_v<T>) {
    if constexpr (std::is_unsigned_v<T>)
      write_unsigned(v);
    else
      write_integer(v);
  } else if constexpr (std::is_floating_point_v<T>) {
    write_float(static_cast<double>(v));
  } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
    write_string(std::string_view(v));
  } else if constexpr (std::is_same_v<T, Array>) {
    write_array_header(v.size());
    for (auto const& x : v)
      write_value(x);
  } else if constexpr (std::is_same_v<T, Dictionary>) {
    write_map_header(v.size());
    for (auto const& [key, value] : v) {
      write_value(key);
      write_value(value);
    }
  } else if constexpr (std::is_same_v<T, Handle>) {
    write_handle(v);
  } else if constexpr (detail::is_typed_handle_v<T>) {
    write_handle(static_cast<const BasicHandle<T>&>(v));
  } else if constexpr (detail::is_sequence<T>::value) {
    write_array_header(v.size());
    std::size_t count = 0;
    v.for_each([this, &count](typename T::value_type x) {
      ++count;
      write(x);
    });
    if (count != v.size()) {
      throw EncodingError("sequence announced " + std::to_string(v.size()) +
                          " elements but produced " + std::to_string(count));
    }
  } else if constexpr (detail::is_vector<T>::value ||
                       detail::is_std_array<T>::value) {
    write_array_header(v.size());
    for (auto const& x : v)
      write(x);
  } else {
    static_assert(sizeof(T) == 0, "type cannot be encoded");
  }
}

} // namespace nvbind
