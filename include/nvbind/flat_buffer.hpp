// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

#include <boost/asio/buffer.hpp>

namespace nvbind {

/**
 * @brief Growable byte buffer used for every encoded message.
 *
 * The interface follows boost::beast::flat_buffer so it can be handed to
 * asio style I/O directly.
 *
 * Memory Layout:
 * +------------------+------------------+------------------+
 * |   [consumed]     |    [readable]    |   [writable]     |
 * +------------------+------------------+------------------+
 * ^                  ^                  ^                  ^
 * buffer_           in_                out_               capacity_
 */
class flat_buffer
{
public:
  using mutable_buffers_type = boost::asio::mutable_buffer;

private:
  std::uint8_t* buffer_ = nullptr; // Base allocation pointer
  std::size_t in_ = 0;             // Read position (offset from buffer_)
  std::size_t out_ = 0;            // Write position (offset from buffer_)
  std::size_t capacity_ = 0;       // Total allocated capacity

  static constexpr std::size_t default_growth_factor = 2;
  static constexpr std::size_t min_allocation = 512;

  void grow(std::size_t n)
  {
    std::size_t const current_size = out_ - in_;
    std::size_t const required = current_size + n;

    std::size_t new_cap = std::max(capacity_ * default_growth_factor, required);
    new_cap = std::max(new_cap, min_allocation);

    std::uint8_t* new_buf = new std::uint8_t[new_cap];

    if (current_size > 0) {
      std::memcpy(new_buf, buffer_ + in_, current_size);
    }

    delete[] buffer_;

    buffer_ = new_buf;
    in_ = 0;
    out_ = current_size;
    capacity_ = new_cap;
  }

public:
  flat_buffer() = default;

  /// Owned copy of an existing byte range
  explicit flat_buffer(std::span<const std::uint8_t> bytes)
  {
    append(bytes.data(), bytes.size());
  }

  flat_buffer(flat_buffer&& other) noexcept
      : buffer_(other.buffer_)
      , in_(other.in_)
      , out_(other.out_)
      , capacity_(other.capacity_)
  {
    other.buffer_ = nullptr;
    other.in_ = 0;
    other.out_ = 0;
    other.capacity_ = 0;
  }

  flat_buffer& operator=(flat_buffer&& other) noexcept
  {
    if (this != &other) {
      delete[] buffer_;

      buffer_ = other.buffer_;
      in_ = other.in_;
      out_ = other.out_;
      capacity_ = other.capacity_;

      other.buffer_ = nullptr;
      other.in_ = 0;
      other.out_ = 0;
      other.capacity_ = 0;
    }
    return *this;
  }

  /// Copy constructor (deep copy)
  flat_buffer(const flat_buffer& other)
      : buffer_(other.size() > 0 ? new std::uint8_t[other.size()] : nullptr)
      , in_(0)
      , out_(other.size())
      , capacity_(other.size())
  {
    if (out_ > 0) {
      std::memcpy(buffer_, other.data_ptr(), out_);
    }
  }

  flat_buffer& operator=(const flat_buffer& other)
  {
    if (this != &other) {
      flat_buffer tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  ~flat_buffer() { delete[] buffer_; }

  //--------------------------------------------------------------------------
  // boost::beast::flat_buffer compatible interface
  //--------------------------------------------------------------------------

  /// Returns the size of the readable area
  std::size_t size() const noexcept { return out_ - in_; }

  /// Prepare writable area of specified size
  mutable_buffers_type prepare(std::size_t n)
  {
    if (out_ + n > capacity_) {
      grow(n);
    }
    return {buffer_ + out_, n};
  }

  /// Commit written bytes to readable area
  void commit(std::size_t n) noexcept { out_ = std::min(out_ + n, capacity_); }

  /// Consume bytes from the readable area
  void consume(std::size_t n) noexcept
  {
    in_ = std::min(in_ + n, out_);
    if (in_ == out_) {
      in_ = 0;
      out_ = 0;
    }
  }

  //--------------------------------------------------------------------------

  /// prepare() + memcpy + commit() in one step
  void append(const void* src, std::size_t n)
  {
    if (n == 0)
      return;
    auto mb = prepare(n);
    std::memcpy(mb.data(), src, n);
    commit(n);
  }

  std::uint8_t* data_ptr() noexcept { return buffer_ + in_; }

  const std::uint8_t* data_ptr() const noexcept { return buffer_ + in_; }

  std::span<const std::uint8_t> bytes() const noexcept
  {
    return {data_ptr(), size()};
  }
};

} // namespace nvbind
