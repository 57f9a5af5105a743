// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <limits>
#include <sstream>

#include <nvbind/exception.hpp>
#include <nvbind/handle.hpp>

namespace nvbind {

NVBIND_API std::string_view to_string(HandleKind kind) noexcept
{
  switch (kind) {
  case HandleKind::Buffer:
    return "Buffer";
  case HandleKind::Window:
    return "Window";
  case HandleKind::Tabpage:
    return "Tabpage";
  }
  return "Unknown";
}

NVBIND_API std::optional<HandleKind>
handle_kind_from_name(std::string_view name) noexcept
{
  for (auto kind : {HandleKind::Buffer, HandleKind::Window, HandleKind::Tabpage}) {
    if (to_string(kind) == name)
      return kind;
  }
  return std::nullopt;
}

NVBIND_API HandleRegistry::HandleRegistry(std::initializer_list<Init> entries)
{
  for (auto const& e : entries)
    add(e.name, e.type_id, e.prefix);
}

NVBIND_API const HandleRegistry& HandleRegistry::neovim()
{
  static const HandleRegistry registry{
      {"Buffer", 0, "nvim_buf_"},
      {"Window", 1, "nvim_win_"},
      {"Tabpage", 2, "nvim_tabpage_"},
  };
  return registry;
}

NVBIND_API void HandleRegistry::add(std::string_view name,
                                    std::int64_t type_id,
                                    std::string_view prefix)
{
  auto kind = handle_kind_from_name(name);
  if (!kind)
    throw Exception("unknown handle kind: \"" + std::string(name) + "\"");

  if (type_id < std::numeric_limits<std::int8_t>::min() ||
      type_id > std::numeric_limits<std::int8_t>::max()) {
    throw Exception("handle type id out of range for " + std::string(name) +
                    ": " + std::to_string(type_id));
  }

  auto const tag = static_cast<std::int8_t>(type_id);
  for (auto const& e : entries_) {
    if (e.kind == *kind)
      throw Exception("handle kind registered twice: " + std::string(name));
    if (e.type_id == tag)
      throw Exception("handle type id " + std::to_string(type_id) +
                      " is used by both " + e.name + " and " +
                      std::string(name));
  }

  auto pos = std::upper_bound(
      entries_.begin(), entries_.end(), name,
      [](std::string_view n, const Entry& e) { return n < e.name; });
  entries_.insert(pos, Entry{*kind, std::string(name), tag, std::string(prefix)});
}

NVBIND_API std::int8_t HandleRegistry::type_id(HandleKind kind) const
{
  if (auto e = find(kind))
    return e->type_id;
  throw Exception("handle kind is not registered: " +
                  std::string(to_string(kind)));
}

NVBIND_API std::optional<HandleKind>
HandleRegistry::find_kind(std::int8_t type_id) const noexcept
{
  for (auto const& e : entries_) {
    if (e.type_id == type_id)
      return e.kind;
  }
  return std::nullopt;
}

NVBIND_API const HandleRegistry::Entry*
HandleRegistry::find(HandleKind kind) const noexcept
{
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [kind](const Entry& e) { return e.kind == kind; });
  return it != entries_.end() ? &*it : nullptr;
}

NVBIND_API std::string HandleRegistry::declaration(HandleKind kind) const
{
  auto e = find(kind);
  if (!e)
    throw Exception("handle kind is not registered: " +
                    std::string(to_string(kind)));

  std::string prefix;
  for (char c : e->prefix) {
    if (c == '"' || c == '\\')
      prefix += '\\';
    prefix += c;
  }

  std::ostringstream os;
  os << "struct " << e->name << " : ::nvbind::BasicHandle<" << e->name
     << "> {\n"
     << "  static constexpr ::nvbind::HandleKind kind = ::nvbind::HandleKind::"
     << to_string(e->kind) << ";\n"
     << "  static constexpr std::int8_t type_id = "
     << static_cast<int>(e->type_id) << ";\n"
     << "  static constexpr std::string_view prefix = \"" << prefix
     << "\";\n"
     << "  using BasicHandle::BasicHandle;\n"
     << "};\n";
  return os.str();
}

} // namespace nvbind
