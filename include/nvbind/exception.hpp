// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <nvbind/marker.hpp>

namespace nvbind {
class Exception : public std::runtime_error
{
public:
  explicit Exception(char const* const msg) noexcept : std::runtime_error(msg)
  {
  }

  explicit Exception(std::string const& msg) noexcept : std::runtime_error(msg)
  {
  }
};

// Short or failed read/write on the underlying byte stream.
class TransportError : public Exception
{
public:
  using Exception::Exception;
};

// Non UTF-8 string payload, or a value the wire format cannot carry.
class EncodingError : public Exception
{
public:
  using Exception::Exception;
};

// The marker read from the wire does not belong to the expected category.
class MarkerMismatch : public Exception
{
  ValueKind expected_;
  std::uint8_t actual_;

public:
  NVBIND_API MarkerMismatch(ValueKind expected, std::uint8_t actual);
  NVBIND_API MarkerMismatch(ValueKind expected,
                            std::uint8_t actual,
                            std::string const& detail);

  ValueKind expected() const noexcept { return expected_; }
  std::uint8_t actual() const noexcept { return actual_; }
};

// Error reply sent back by the remote side of a call.
class RemoteError : public Exception
{
  std::int64_t type_id_;

public:
  RemoteError(std::int64_t type_id, std::string const& msg)
      : Exception(msg)
      , type_id_(type_id)
  {
  }

  std::int64_t type_id() const noexcept { return type_id_; }
};
} // namespace nvbind
