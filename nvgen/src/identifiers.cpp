// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <array>
#include <set>

#include "identifiers.hpp"

namespace nvgen {

namespace {

bool is_alnum(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9');
}

char to_upper(char c) noexcept
{
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

// sorted
constexpr std::array<std::string_view, 96> cpp_keywords = {
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
    "bool", "break", "case", "catch", "char", "char16_t", "char32_t", "char8_t",
    "class", "co_await", "co_return", "co_yield", "compl", "concept", "const",
    "const_cast", "consteval", "constexpr", "constinit", "continue", "decltype",
    "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
    "explicit", "export", "extern", "false", "final", "float", "for", "friend",
    "goto", "if", "import", "inline", "int", "long", "module", "mutable",
    "namespace", "new", "noexcept", "not", "not_eq", "nullptr", "operator",
    "or", "or_eq", "override", "private", "protected", "public", "register",
    "reinterpret_cast", "requires", "return", "short", "signed", "sizeof",
    "static", "static_assert", "static_cast", "struct", "switch", "template",
    "this", "thread_local", "throw", "true", "try", "typedef", "typeid",
    "typename", "union", "unsigned", "using", "virtual", "void", "volatile",
    "wchar_t", "while", "xor", "xor_eq",
};

// Names the generated stub signature already uses
constexpr std::array<std::string_view, 1> reserved = {"client"};

} // namespace

std::string to_pascal_case(std::string_view name)
{
  std::string out;
  out.reserve(name.size());
  bool start = true;
  for (char c : name) {
    if (!is_alnum(c)) {
      start = true;
      continue;
    }
    out += start ? to_upper(c) : c;
    start = false;
  }
  return out;
}

std::vector<std::string> make_enumerators(const std::vector<std::string>& names,
                                          std::string_view prefix)
{
  std::vector<std::string> out;
  out.reserve(names.size());
  std::set<std::string> used;

  for (auto const& name : names) {
    auto base = to_pascal_case(name);
    if (base.empty() || (base[0] >= '0' && base[0] <= '9'))
      base = std::string(prefix) + base;

    auto candidate = base;
    for (int n = 2; used.count(candidate); ++n)
      candidate = base + std::to_string(n);

    used.insert(candidate);
    out.push_back(std::move(candidate));
  }
  return out;
}

bool is_cpp_keyword(std::string_view name) noexcept
{
  return std::binary_search(cpp_keywords.begin(), cpp_keywords.end(), name);
}

std::string escape_identifier(std::string_view name)
{
  std::string out(name);
  if (is_cpp_keyword(name) ||
      std::find(reserved.begin(), reserved.end(), name) != reserved.end())
    out += '_';
  return out;
}

} // namespace nvgen
