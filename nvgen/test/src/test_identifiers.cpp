// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <set>

#include <gtest/gtest.h>

#include "../../src/identifiers.hpp"

using namespace nvgen;

namespace nvgentest {

TEST(Identifiers, PascalCase)
{
  EXPECT_EQ(to_pascal_case("ext_cmdline"), "ExtCmdline");
  EXPECT_EQ(to_pascal_case("rgb"), "Rgb");
  EXPECT_EQ(to_pascal_case("term-name"), "TermName");
  EXPECT_EQ(to_pascal_case("__x__y"), "XY");
  EXPECT_EQ(to_pascal_case("grid_line2"), "GridLine2");
  EXPECT_EQ(to_pascal_case("hlGroup"), "HlGroup");
  EXPECT_EQ(to_pascal_case("_"), "");
}

TEST(Identifiers, EnumeratorsAreABijection)
{
  std::vector<std::string> names{"ext_cmdline", "ext-cmdline", "extCmdline",
                                 "",            "2d",          "_",
                                 "ExtCmdline2", "rgb"};
  auto const e = make_enumerators(names, "Option");

  ASSERT_EQ(e.size(), names.size());
  EXPECT_EQ(e[0], "ExtCmdline");
  EXPECT_EQ(e[1], "ExtCmdline2");
  EXPECT_EQ(e[2], "ExtCmdline3");
  EXPECT_EQ(e[3], "Option");
  EXPECT_EQ(e[4], "Option2d");
  EXPECT_EQ(e[5], "Option2");
  // taken by the collision suffix above
  EXPECT_EQ(e[6], "ExtCmdline22");
  EXPECT_EQ(e[7], "Rgb");

  EXPECT_EQ(std::set<std::string>(e.begin(), e.end()).size(), e.size());
}

TEST(Identifiers, Keywords)
{
  EXPECT_TRUE(is_cpp_keyword("class"));
  EXPECT_TRUE(is_cpp_keyword("xor_eq"));
  EXPECT_TRUE(is_cpp_keyword("alignas"));
  EXPECT_FALSE(is_cpp_keyword("buffer"));
  EXPECT_FALSE(is_cpp_keyword("end"));

  EXPECT_EQ(escape_identifier("namespace"), "namespace_");
  EXPECT_EQ(escape_identifier("client"), "client_");
  EXPECT_EQ(escape_identifier("window"), "window");
}

} // namespace nvgentest
