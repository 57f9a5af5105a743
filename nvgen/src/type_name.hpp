// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "api.hpp"

namespace nvgen {

class type_name_error : public std::runtime_error
{
public:
  const std::string input;
  const std::string token; // empty when the input ended early
  const int col;           // 1-based

  type_name_error(std::string_view _input,
                  std::string_view _token,
                  int _col,
                  const std::string& msg)
      : std::runtime_error(msg), input(_input), token(_token), col(_col)
  {
  }
};

/**
 * @brief Parses a manifest type name.
 *
 * Grammar:
 * @code
 *   type  := Ident | "ArrayOf(" Ident ")" | "ArrayOf(" Ident "," ws* N ")"
 *   Ident := [A-Za-z]+
 *   N     := [0-9]+
 * @endcode
 *
 * @throws type_name_error on malformed, truncated or nested input.
 */
TypeName parse_type_name(std::string_view s);

} // namespace nvgen
