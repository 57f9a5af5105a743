// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <fstream>
#include <iterator>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nvbind/exception.hpp>

#include "fixture.hpp"

using namespace nvgen;
using ::testing::HasSubstr;
using ::testing::Not;

namespace nvgentest {

class Generator : public ::testing::Test
{
protected:
  builders::BuildStats stats;
  std::string header;

  void SetUp() override { header = generate(sample_manifest(), &stats); }
};

TEST_F(Generator, Prologue)
{
  EXPECT_EQ(header.rfind(
                "// Generated by nvgen from the Neovim API manifest. Do not "
                "edit.\n\n"
                "#ifndef NVGEN_NVIM_API_HPP_\n"
                "#define NVGEN_NVIM_API_HPP_\n\n"
                "#include <nvbind/nvbind.hpp>\n\n"
                "namespace nvim {\n",
                0),
            0u);
  EXPECT_THAT(header, HasSubstr("} // namespace nvim\n\n"
                                "#endif // NVGEN_NVIM_API_HPP_\n"));
}

TEST_F(Generator, VersionAndErrorTypes)
{
  EXPECT_THAT(header, HasSubstr("inline constexpr ::nvbind::Version version{\n"
                                "  .api_compatible = 0,\n"
                                "  .api_level = 12,\n"
                                "  .api_prerelease = false,\n"
                                "  .major = 0,\n"
                                "  .minor = 10,\n"
                                "  .patch = 2,\n"
                                "  .prerelease = false,\n"
                                "};\n"));
  EXPECT_THAT(header, HasSubstr("enum class ErrorType : std::int64_t {\n"
                                "  Exception = 0,\n"
                                "  Validation = 1,\n"
                                "};\n"));
}

TEST_F(Generator, HandleTypes)
{
  EXPECT_THAT(header, HasSubstr("struct Buffer : ::nvbind::BasicHandle<Buffer> {\n"));
  EXPECT_THAT(header,
              HasSubstr("  static constexpr std::string_view prefix = "
                        "\"nvim_tabpage_\";\n"));
  EXPECT_THAT(header,
              HasSubstr("inline const ::nvbind::HandleRegistry& handle_registry()\n"
                        "{\n"
                        "  static const ::nvbind::HandleRegistry registry{\n"
                        "    {\"Buffer\", 0, \"nvim_buf_\"},\n"
                        "    {\"Tabpage\", 2, \"nvim_tabpage_\"},\n"
                        "    {\"Window\", 1, \"nvim_win_\"},\n"
                        "  };\n"
                        "  return registry;\n"
                        "}\n"));
  EXPECT_EQ(stats.handle_kinds, 3u);
}

TEST_F(Generator, UiOptions)
{
  EXPECT_THAT(header, HasSubstr("enum class UiOption {\n"
                                "  Rgb,\n"
                                "  ExtCmdline,\n"
                                "  ExtPopupmenu,\n"
                                "};\n"));
  EXPECT_THAT(header, HasSubstr("  case UiOption::ExtCmdline:\n"
                                "    return \"ext_cmdline\";\n"));
  EXPECT_THAT(header, HasSubstr("inline std::optional<UiOption> "
                                "ui_option_from_string(std::string_view s) "
                                "noexcept\n"
                                "{\n"
                                "  if (s == \"rgb\")\n"
                                "    return UiOption::Rgb;\n"));
  EXPECT_EQ(stats.ui_options, 3u);
}

TEST_F(Generator, UiEvents)
{
  EXPECT_THAT(header, HasSubstr("enum class UiEvent {\n"
                                "  ModeChange,\n"
                                "  Flush,\n"
                                "};\n"));
  EXPECT_THAT(header, HasSubstr("inline std::int64_t ui_event_since(UiEvent v) "
                                "noexcept\n"));
  EXPECT_THAT(header, HasSubstr("  case UiEvent::ModeChange:\n"
                                "    return 4;\n"));
  EXPECT_EQ(stats.ui_events, 2u);
}

TEST_F(Generator, ObjectReturnNamedAfterHandle)
{
  EXPECT_THAT(header,
              HasSubstr("// since 1, deprecated since 1, method\n"
                        "[[deprecated(\"deprecated since API level 1\")]]\n"
                        "inline std::future<Window> "
                        "window_get_cursor(::nvbind::Client& client, Window "
                        "window)\n"
                        "{\n"
                        "  return client.call<Window>(\"window_get_cursor\", "
                        "window);\n"
                        "}\n"));
}

TEST_F(Generator, ObjectReturnOtherwiseValue)
{
  EXPECT_THAT(header,
              HasSubstr("// since 2\n"
                        "inline std::future<::nvbind::Value> "
                        "nvim_get_mode(::nvbind::Client& client)\n"
                        "{\n"
                        "  return client.call<::nvbind::Value>(\"nvim_get_mode\");\n"
                        "}\n"));
  EXPECT_THAT(header, HasSubstr("inline std::future<::nvbind::Value> "
                                "nvim_eval(::nvbind::Client& client, "
                                "std::string_view expr)\n"));
}

TEST_F(Generator, LuaRefFunctionSkipped)
{
  EXPECT_THAT(header, Not(HasSubstr("nvim_buf_call")));
  EXPECT_EQ(stats.functions_skipped, 1u);
  EXPECT_EQ(stats.functions_emitted, 10u);
}

TEST_F(Generator, ParameterMapping)
{
  EXPECT_THAT(header,
              HasSubstr("inline std::future<void> "
                        "nvim_buf_set_lines(::nvbind::Client& client, Buffer "
                        "buffer, std::int64_t start, std::int64_t end, bool "
                        "strict_indexing, const "
                        "::nvbind::Sequence<std::string_view>& replacement)\n"));
  EXPECT_THAT(header,
              HasSubstr("nvim_win_set_cursor(::nvbind::Client& client, Window "
                        "window, const std::array<std::int64_t, 2>& pos)\n"));
  EXPECT_THAT(header, HasSubstr("nvim_set_var(::nvbind::Client& client, "
                                "std::string_view name, const "
                                "::nvbind::Value& value)\n"));
}

TEST_F(Generator, ReturnMapping)
{
  EXPECT_THAT(header, HasSubstr("inline std::future<std::array<std::int64_t, 2>> "
                                "nvim_win_get_cursor("));
  EXPECT_THAT(header, HasSubstr("inline std::future<std::vector<Buffer>> "
                                "nvim_list_bufs(::nvbind::Client& client)\n"));
}

TEST_F(Generator, UnknownTypeFallsBackToValue)
{
  EXPECT_THAT(header, HasSubstr("inline std::future<double> "
                                "nvim_get_frob(::nvbind::Client& client, const "
                                "::nvbind::Value& x)\n"));
  EXPECT_EQ(stats.unknown_types, 1u);
}

TEST_F(Generator, KeywordParametersEscaped)
{
  EXPECT_THAT(header,
              HasSubstr("nvim_keyword_params(::nvbind::Client& client, "
                        "std::int64_t class_, const ::nvbind::Dictionary& "
                        "client_)\n"
                        "{\n"
                        "  return client.call<bool>(\"nvim_keyword_params\", "
                        "class_, client_);\n"));
}

TEST(GeneratorOptions, CustomNamespace)
{
  auto const header = generate(sample_manifest(), nullptr, "my::api");
  EXPECT_THAT(header, HasSubstr("#ifndef NVGEN_MY__API_API_HPP_\n"));
  EXPECT_THAT(header, HasSubstr("namespace my::api {\n"));
  EXPECT_THAT(header, HasSubstr("} // namespace my::api\n"));
}

TEST(GeneratorOptions, UnusableTypeTableEntriesSkipped)
{
  auto m = sample_manifest();
  m.insert_or_assign(
      "types",
      Dictionary{
          {"Buffer", Dictionary{{"id", 0}, {"prefix", "nvim_buf_"}}},
          {"Window", Dictionary{{"id", 1}, {"prefix", "nvim_win_"}}},
          {"Tabpage", Dictionary{{"id", 300}, {"prefix", "nvim_tabpage_"}}},
          {"Frame", Dictionary{{"id", 3}, {"prefix", "nvim_frame_"}}},
      });

  builders::BuildStats stats;
  auto const header = generate(m, &stats);
  EXPECT_EQ(stats.handle_kinds, 2u);
  EXPECT_THAT(header, Not(HasSubstr("struct Frame")));
  EXPECT_THAT(header, Not(HasSubstr("struct Tabpage")));
  EXPECT_THAT(header, HasSubstr("struct Window"));
}

TEST(GeneratorOptions, Deterministic)
{
  auto const bytes = encode(sample_manifest());
  EXPECT_EQ(generate(sample_manifest()), generate(sample_manifest()));

  // same tables, different wire order
  auto m = sample_manifest();
  m.insert_or_assign(
      "types",
      Dictionary{
          {"Window", Dictionary{{"prefix", "nvim_win_"}, {"id", 1}}},
          {"Tabpage", Dictionary{{"id", 2}, {"prefix", "nvim_tabpage_"}}},
          {"Buffer", Dictionary{{"id", 0}, {"prefix", "nvim_buf_"}}},
      });
  m.insert_or_assign("error_types",
                     Dictionary{{"Validation", Dictionary{{"id", 1}}},
                                {"Exception", Dictionary{{"id", 0}}}});
  EXPECT_NE(encode(m), bytes);
  EXPECT_EQ(generate(m), generate(sample_manifest()));
}

TEST(GeneratorOptions, WritesFile)
{
  auto const path =
      std::filesystem::temp_directory_path() / "nvgen_test_nvim_api.hpp";

  CompilationBuilder()
      .set_source(
          std::make_unique<MemoryManifestSource>(encode(sample_manifest())))
      .set_output(path)
      .build()
      ->compile();

  std::ifstream is(path, std::ios::binary);
  std::string contents{std::istreambuf_iterator<char>(is),
                       std::istreambuf_iterator<char>()};
  is.close();
  std::filesystem::remove(path);

  EXPECT_EQ(contents, generate(sample_manifest()));
}

TEST(GeneratorOptions, BuilderNeedsSourceAndOutput)
{
  EXPECT_THROW(CompilationBuilder().build(), nvbind::Exception);

  EXPECT_THROW(CompilationBuilder()
                   .set_source(std::make_unique<MemoryManifestSource>(
                       encode(sample_manifest())))
                   .build(),
               nvbind::Exception);
}

} // namespace nvgentest
