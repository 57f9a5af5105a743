// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <charconv>
#include <type_traits>
#include <variant>

#include "type_name.hpp"

namespace nvgen {

namespace {

constexpr std::string_view array_of = "ArrayOf";

bool is_alpha(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

class TypeNameParser
{
  std::string_view s_;
  std::size_t pos_ = 0;

  bool at_end() const noexcept { return pos_ >= s_.size(); }

  [[noreturn]] void fail(std::size_t at,
                         std::size_t len,
                         const std::string& msg) const
  {
    auto const token = at < s_.size() ? s_.substr(at, len) : std::string_view{};
    throw type_name_error(s_, token, static_cast<int>(at) + 1,
                          "type name \"" + std::string(s_) + "\": " + msg);
  }

  [[noreturn]] void fail_here(const std::string& msg) const
  {
    fail(pos_, 1, at_end() ? "unexpected end of input, " + msg : msg);
  }

  std::string_view ident()
  {
    auto const start = pos_;
    while (!at_end() && is_alpha(s_[pos_]))
      ++pos_;
    return s_.substr(start, pos_ - start);
  }

  void expect(char c)
  {
    if (at_end() || s_[pos_] != c)
      fail_here(std::string("expected '") + c + "'");
    ++pos_;
  }

  void expect_end()
  {
    if (!at_end())
      fail(pos_, s_.size() - pos_, "unexpected trailing characters");
  }

public:
  explicit TypeNameParser(std::string_view s)
      : s_(s)
  {
  }

  TypeName parse()
  {
    if (s_.empty())
      fail_here("expected a type name");

    auto const head = ident();
    if (head.empty())
      fail_here("expected a type name");

    if (at_end()) {
      if (head == array_of)
        fail_here("ArrayOf requires an element type");
      return ScalarType{std::string(head)};
    }

    if (s_[pos_] != '(' || head != array_of)
      fail(pos_, 1, "unexpected character after \"" + std::string(head) + "\"");
    ++pos_;

    auto const elem_pos = pos_;
    auto const element = ident();
    if (element.empty())
      fail_here("expected an element type");
    if (!at_end() && s_[pos_] == '(') {
      fail(elem_pos, element.size(),
           "nested array types are not supported");
    }

    if (at_end())
      fail_here("expected ')' or ','");

    if (s_[pos_] == ')') {
      ++pos_;
      expect_end();
      return DynamicArrayType{std::string(element)};
    }

    expect(',');
    while (!at_end() && s_[pos_] == ' ')
      ++pos_;

    auto const num_pos = pos_;
    while (!at_end() && is_digit(s_[pos_]))
      ++pos_;
    if (num_pos == pos_)
      fail_here("expected an array length");

    std::uint64_t size = 0;
    auto const digits = s_.substr(num_pos, pos_ - num_pos);
    auto const [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), size);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
      fail(num_pos, digits.size(), "array length out of range");

    expect(')');
    expect_end();
    return FixedArrayType{size, std::string(element)};
  }
};

} // namespace

TypeName parse_type_name(std::string_view s)
{
  return TypeNameParser(s).parse();
}

std::string to_string(const TypeName& type)
{
  if (auto t = std::get_if<ScalarType>(&type))
    return t->name;
  if (auto t = std::get_if<DynamicArrayType>(&type))
    return "ArrayOf(" + t->element + ")";
  auto const& t = std::get<FixedArrayType>(type);
  return "ArrayOf(" + t.element + ", " + std::to_string(t.size) + ")";
}

const std::string& base_name(const TypeName& type) noexcept
{
  return std::visit(
      [](const auto& t) -> const std::string& {
        if constexpr (std::is_same_v<std::decay_t<decltype(t)>, ScalarType>)
          return t.name;
        else
          return t.element;
      },
      type);
}

} // namespace nvgen
