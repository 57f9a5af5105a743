// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nvbind/export.hpp>

namespace nvbind {

// Closed set of remote object kinds the wire can reference.
enum class HandleKind : std::uint8_t {
  Buffer,
  Window,
  Tabpage,
};

NVBIND_API std::string_view to_string(HandleKind kind) noexcept;

// "Buffer" -> HandleKind::Buffer. Matches the names used by the manifest's
// type table.
NVBIND_API std::optional<HandleKind>
handle_kind_from_name(std::string_view name) noexcept;

// Dynamically typed handle, as stored inside a Value.
struct Handle {
  HandleKind kind;
  std::int64_t value;

  bool operator==(const Handle&) const = default;
};

/**
 * @brief Base for the nominal handle wrappers (Buffer, Window, Tabpage).
 *
 * Derived types provide the wire constants:
 * @code
 *   struct Buffer : ::nvbind::BasicHandle<Buffer> {
 *     static constexpr ::nvbind::HandleKind kind = ::nvbind::HandleKind::Buffer;
 *     static constexpr std::int8_t type_id = 0;
 *     static constexpr std::string_view prefix = "nvim_buf_";
 *     using BasicHandle::BasicHandle;
 *   };
 * @endcode
 */
template <typename Derived> class BasicHandle
{
  std::int64_t handle_ = 0;

public:
  constexpr BasicHandle() noexcept = default;
  constexpr explicit BasicHandle(std::int64_t handle) noexcept
      : handle_(handle)
  {
  }

  constexpr std::int64_t get() const noexcept { return handle_; }

  Handle to_handle() const noexcept { return Handle{Derived::kind, handle_}; }

  constexpr bool operator==(const BasicHandle&) const noexcept = default;
};

/**
 * @brief Assignment of extension type tags to handle kinds.
 *
 * Filled from the manifest's type table at generation time; encoder and
 * decoder must share one instance. Entries are kept ordered by kind name so
 * that anything emitted from the registry is stable.
 */
class HandleRegistry
{
public:
  struct Entry {
    HandleKind kind;
    std::string name;
    std::int8_t type_id;
    std::string prefix;
  };

  struct Init {
    std::string_view name;
    std::int64_t type_id;
    std::string_view prefix;
  };

  HandleRegistry() = default;
  NVBIND_API HandleRegistry(std::initializer_list<Init> entries);

  /// Buffer = 0, Window = 1, Tabpage = 2; the assignment Neovim ships with.
  NVBIND_API static const HandleRegistry& neovim();

  /// Throws nvbind::Exception on an unknown kind name, a tag outside int8_t or
  /// a duplicate kind/tag.
  NVBIND_API void
  add(std::string_view name, std::int64_t type_id, std::string_view prefix);

  /// Encode side: tag for a kind. Throws if the kind is not registered.
  NVBIND_API std::int8_t type_id(HandleKind kind) const;

  /// Decode side: kind for a tag, std::nullopt if the tag is unknown.
  NVBIND_API std::optional<HandleKind> find_kind(std::int8_t type_id) const
      noexcept;

  NVBIND_API const Entry* find(HandleKind kind) const noexcept;

  /// C++ declaration of the nominal wrapper for a kind, tag baked in.
  NVBIND_API std::string declaration(HandleKind kind) const;

  const std::vector<Entry>& entries() const noexcept { return entries_; }
  bool empty() const noexcept { return entries_.empty(); }

private:
  std::vector<Entry> entries_;
};

} // namespace nvbind
