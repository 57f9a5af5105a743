// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nvgen {

// Splits on anything that is not an ASCII letter or digit and capitalises
// each segment: "ext_cmdline" -> "ExtCmdline". The rest of a segment is kept.
std::string to_pascal_case(std::string_view name);

/**
 * @brief Enumerator names for a list of manifest names, one per input, in
 * order.
 *
 * Names are PascalCased; a result that would be empty or start with a digit
 * gets `prefix` in front, and a name already taken gets the smallest numeric
 * suffix (starting at 2) that makes it unique. Distinct inputs therefore
 * always map to distinct enumerators.
 */
std::vector<std::string> make_enumerators(const std::vector<std::string>& names,
                                          std::string_view prefix);

bool is_cpp_keyword(std::string_view name) noexcept;

// Parameter names: keywords, and names reserved by the stub signature, get a
// trailing underscore.
std::string escape_identifier(std::string_view name);

} // namespace nvgen
