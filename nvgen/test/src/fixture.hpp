// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nvbind/codec.hpp>

#include "../../src/compilation.hpp"

// Small hand-made manifests in the shape of `nvim --api-info`
namespace nvgentest {

using nvbind::Array;
using nvbind::Dictionary;
using nvbind::Value;

inline Value param(const char* type, const char* name)
{
  return Array{type, name};
}

inline Value api_function(const char* name,
                          Array parameters,
                          const char* return_type,
                          std::int64_t since = 1,
                          Value deprecated_since = Value(),
                          bool method = false)
{
  Dictionary d{
      {"name", name},
      {"method", method},
      {"parameters", std::move(parameters)},
      {"return_type", return_type},
      {"since", since},
  };
  if (!deprecated_since.is_nil())
    d.insert_or_assign("deprecated_since", std::move(deprecated_since));
  return d;
}

inline Value handle_types()
{
  return Dictionary{
      {"Buffer", Dictionary{{"id", 0}, {"prefix", "nvim_buf_"}}},
      {"Window", Dictionary{{"id", 1}, {"prefix", "nvim_win_"}}},
      {"Tabpage", Dictionary{{"id", 2}, {"prefix", "nvim_tabpage_"}}},
  };
}

inline Value version()
{
  return Dictionary{
      {"api_compatible", 0}, {"api_level", 12}, {"api_prerelease", false},
      {"major", 0},          {"minor", 10},     {"patch", 2},
      {"prerelease", false},
  };
}

inline Dictionary manifest_with(Array functions)
{
  return Dictionary{
      {"version", version()},
      {"error_types", Dictionary{{"Exception", Dictionary{{"id", 0}}},
                                 {"Validation", Dictionary{{"id", 1}}}}},
      {"types", handle_types()},
      {"functions", std::move(functions)},
      {"ui_options", Array{"rgb", "ext_cmdline", "ext_popupmenu"}},
      {"ui_events",
       Array{
           Dictionary{{"name", "mode_change"},
                          {"parameters", Array{param("String", "mode"),
                                           param("Integer", "mode_idx")}},
                          {"since", 4}},
           Dictionary{{"name", "flush"}, {"parameters", Array{}}, {"since", 6}},
       }},
  };
}

inline Dictionary sample_manifest()
{
  return manifest_with(Array{
      api_function("nvim_get_mode", {}, "Object", 2),
      api_function("window_get_cursor", {param("Window", "window")}, "Object", 1,
                   1, true),
      api_function("nvim_win_get_cursor", {param("Window", "window")},
                   "ArrayOf(Integer, 2)", 1, Value(), true),
      api_function("nvim_buf_set_lines",
                   {param("Buffer", "buffer"), param("Integer", "start"),
                    param("Integer", "end"), param("Boolean", "strict_indexing"),
                    param("ArrayOf(String)", "replacement")},
                   "void", 1, Value(), true),
      api_function("nvim_win_set_cursor",
                   {param("Window", "window"), param("ArrayOf(Integer, 2)", "pos")},
                   "void", 1, Value(), true),
      api_function("nvim_buf_call",
                   {param("Buffer", "buffer"), param("LuaRef", "fun")}, "Object",
                   7, Value(), true),
      api_function("nvim_list_bufs", {}, "ArrayOf(Buffer)"),
      api_function("nvim_eval", {param("String", "expr")}, "Object"),
      api_function("nvim_set_var", {param("String", "name"), param("Object", "value")},
                   "void"),
      api_function("nvim_get_frob", {param("Frobnicator", "x")}, "Float"),
      api_function("nvim_keyword_params",
                   {param("Integer", "class"), param("Dictionary", "client")},
                   "Boolean"),
  });
}

inline std::vector<std::uint8_t> encode(const Value& v)
{
  nvbind::flat_buffer buf;
  nvbind::Writer w(buf);
  w.write_value(v);
  auto b = buf.bytes();
  return std::vector<std::uint8_t>(b.begin(), b.end());
}

inline std::string generate(const Value& manifest,
                            nvgen::builders::BuildStats* stats = nullptr,
                            std::string ns = "nvim")
{
  std::ostringstream os;
  auto compilation =
      nvgen::CompilationBuilder()
          .set_source(
              std::make_unique<nvgen::MemoryManifestSource>(encode(manifest)))
          .set_output(os)
          .set_namespace(std::move(ns))
          .build();
  compilation->compile();
  if (stats)
    *stats = compilation->stats();
  return os.str();
}

} // namespace nvgentest
