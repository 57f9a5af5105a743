// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>

#include <nvbind/exception.hpp>
#include <nvbind/handle.hpp>

using namespace nvbind;

namespace nvbindtest {

TEST(HandleRegistry, NeovimDefaults)
{
  auto const& r = HandleRegistry::neovim();
  EXPECT_EQ(r.type_id(HandleKind::Buffer), 0);
  EXPECT_EQ(r.type_id(HandleKind::Window), 1);
  EXPECT_EQ(r.type_id(HandleKind::Tabpage), 2);
  EXPECT_EQ(r.find_kind(1), HandleKind::Window);
  EXPECT_FALSE(r.find_kind(3).has_value());

  ASSERT_NE(r.find(HandleKind::Tabpage), nullptr);
  EXPECT_EQ(r.find(HandleKind::Tabpage)->prefix, "nvim_tabpage_");
}

TEST(HandleRegistry, EntriesOrderedByName)
{
  HandleRegistry r;
  r.add("Window", 1, "nvim_win_");
  r.add("Tabpage", 2, "nvim_tabpage_");
  r.add("Buffer", 0, "nvim_buf_");

  ASSERT_EQ(r.entries().size(), 3u);
  EXPECT_EQ(r.entries()[0].name, "Buffer");
  EXPECT_EQ(r.entries()[1].name, "Tabpage");
  EXPECT_EQ(r.entries()[2].name, "Window");
}

TEST(HandleRegistry, RejectsBadEntries)
{
  HandleRegistry r{{"Buffer", 0, "nvim_buf_"}};

  EXPECT_THROW(r.add("Frame", 5, "nvim_frame_"), Exception);
  EXPECT_THROW(r.add("Window", 128, "nvim_win_"), Exception);
  EXPECT_THROW(r.add("Window", -129, "nvim_win_"), Exception);
  EXPECT_THROW(r.add("Buffer", 3, "nvim_buf_"), Exception);
  EXPECT_THROW(r.add("Window", 0, "nvim_win_"), Exception);

  EXPECT_EQ(r.entries().size(), 1u);
  EXPECT_THROW(r.type_id(HandleKind::Window), Exception);

  r.add("Window", -1, "nvim_win_");
  EXPECT_EQ(r.find_kind(-1), HandleKind::Window);
}

TEST(HandleRegistry, KindNames)
{
  EXPECT_EQ(handle_kind_from_name("Buffer"), HandleKind::Buffer);
  EXPECT_EQ(handle_kind_from_name("Tabpage"), HandleKind::Tabpage);
  EXPECT_FALSE(handle_kind_from_name("buffer").has_value());
  EXPECT_EQ(to_string(HandleKind::Window), "Window");
}

TEST(HandleRegistry, Declaration)
{
  HandleRegistry r{{"Window", 7, "nvim_win_"}};
  EXPECT_EQ(r.declaration(HandleKind::Window),
            "struct Window : ::nvbind::BasicHandle<Window> {\n"
            "  static constexpr ::nvbind::HandleKind kind = "
            "::nvbind::HandleKind::Window;\n"
            "  static constexpr std::int8_t type_id = 7;\n"
            "  static constexpr std::string_view prefix = \"nvim_win_\";\n"
            "  using BasicHandle::BasicHandle;\n"
            "};\n");
  EXPECT_THROW(r.declaration(HandleKind::Buffer), Exception);
}

} // namespace nvbindtest
