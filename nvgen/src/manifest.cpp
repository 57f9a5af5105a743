// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <nvbind/codec.hpp>
#include <nvbind/impl/logging.hpp>

#include "manifest.hpp"
#include "type_name.hpp"

using nvbind::Array;
using nvbind::Dictionary;
using nvbind::Value;

namespace nvgen {

namespace {

std::string kind_of(const Value& v)
{
  return std::string(nvbind::to_string(v.kind()));
}

const Dictionary& as_dict(const Value& v, const std::string& path)
{
  if (!v.is<Dictionary>())
    throw manifest_error(path, "expected a map, got " + kind_of(v));
  return v.as<Dictionary>();
}

const Array& as_array(const Value& v, const std::string& path)
{
  if (!v.is<Array>())
    throw manifest_error(path, "expected an array, got " + kind_of(v));
  return v.as<Array>();
}

const std::string& as_string(const Value& v, const std::string& path)
{
  if (!v.is<std::string>())
    throw manifest_error(path, "expected a string, got " + kind_of(v));
  return v.as<std::string>();
}

std::int64_t as_int(const Value& v, const std::string& path)
{
  if (!v.is<std::int64_t>())
    throw manifest_error(path, "expected an integer, got " + kind_of(v));
  return v.as<std::int64_t>();
}

bool as_bool(const Value& v, const std::string& path)
{
  if (!v.is<bool>())
    throw manifest_error(path, "expected a boolean, got " + kind_of(v));
  return v.as<bool>();
}

std::string member(const std::string& path, std::string_view key)
{
  return path.empty() ? std::string(key) : path + "." + std::string(key);
}

std::string at_index(const std::string& path, std::size_t i)
{
  return path + "[" + std::to_string(i) + "]";
}

const Value&
field(const Dictionary& d, std::string_view key, const std::string& path)
{
  if (auto v = d.find(key))
    return *v;
  throw manifest_error(member(path, key), "missing field");
}

TypeName type_name(const Value& v, const std::string& path)
{
  auto const& s = as_string(v, path);
  try {
    return parse_type_name(s);
  } catch (const type_name_error& e) {
    NVBIND_LOG_ERROR("{}: {}", path, e.what());
    throw;
  }
}

nvbind::Version parse_version(const Value& v, const std::string& path)
{
  auto const& d = as_dict(v, path);
  nvbind::Version version;
  version.api_compatible =
      as_int(field(d, "api_compatible", path), member(path, "api_compatible"));
  version.api_level =
      as_int(field(d, "api_level", path), member(path, "api_level"));
  version.api_prerelease =
      as_bool(field(d, "api_prerelease", path), member(path, "api_prerelease"));
  version.major = as_int(field(d, "major", path), member(path, "major"));
  version.minor = as_int(field(d, "minor", path), member(path, "minor"));
  version.patch = as_int(field(d, "patch", path), member(path, "patch"));
  version.prerelease =
      as_bool(field(d, "prerelease", path), member(path, "prerelease"));
  return version;
}

std::vector<Parameter> parse_parameters(const Value& v, const std::string& path)
{
  auto const& list = as_array(v, path);
  std::vector<Parameter> params;
  params.reserve(list.size());
  for (std::size_t i = 0; i < list.size(); ++i) {
    auto const p = at_index(path, i);
    auto const& pair = as_array(list[i], p);
    if (pair.size() != 2) {
      throw manifest_error(p, "expected [type, name], got " +
                                  std::to_string(pair.size()) + " elements");
    }
    params.push_back(Parameter{type_name(pair[0], at_index(p, 0)),
                               as_string(pair[1], at_index(p, 1))});
  }
  return params;
}

FunctionDecl parse_function(const Value& v, const std::string& path)
{
  auto const& d = as_dict(v, path);
  FunctionDecl fn;
  fn.name = as_string(field(d, "name", path), member(path, "name"));
  fn.method = as_bool(field(d, "method", path), member(path, "method"));
  fn.parameters =
      parse_parameters(field(d, "parameters", path), member(path, "parameters"));
  fn.return_type =
      type_name(field(d, "return_type", path), member(path, "return_type"));
  fn.since = as_int(field(d, "since", path), member(path, "since"));
  if (auto dep = d.find("deprecated_since"); dep && !dep->is_nil())
    fn.deprecated_since = as_int(*dep, member(path, "deprecated_since"));
  return fn;
}

UiEventDecl parse_ui_event(const Value& v, const std::string& path)
{
  auto const& d = as_dict(v, path);
  UiEventDecl ev;
  ev.name = as_string(field(d, "name", path), member(path, "name"));
  ev.parameters =
      parse_parameters(field(d, "parameters", path), member(path, "parameters"));
  ev.since = as_int(field(d, "since", path), member(path, "since"));
  return ev;
}

} // namespace

Api parse_manifest(const Value& root)
{
  const std::string path;
  auto const& d = as_dict(root, "<root>");
  Api api;

  api.version = parse_version(field(d, "version", path), "version");

  {
    auto const& table = as_dict(field(d, "error_types", path), "error_types");
    for (auto const& [key, value] : table) {
      auto const& name = as_string(key, "error_types.<key>");
      auto const p = member("error_types", name);
      auto const& entry = as_dict(value, p);
      api.error_types.insert_or_assign(
          name, as_int(field(entry, "id", p), member(p, "id")));
    }
  }

  {
    auto const& table = as_dict(field(d, "types", path), "types");
    for (auto const& [key, value] : table) {
      auto const& name = as_string(key, "types.<key>");
      auto const p = member("types", name);
      auto const& entry = as_dict(value, p);
      api.types.insert_or_assign(
          name,
          TypeDecl{as_int(field(entry, "id", p), member(p, "id")),
                   as_string(field(entry, "prefix", p), member(p, "prefix"))});
    }
  }

  {
    auto const& list = as_array(field(d, "functions", path), "functions");
    api.functions.reserve(list.size());
    for (std::size_t i = 0; i < list.size(); ++i)
      api.functions.push_back(parse_function(list[i], at_index("functions", i)));
  }

  {
    auto const& list = as_array(field(d, "ui_options", path), "ui_options");
    api.ui_options.reserve(list.size());
    for (std::size_t i = 0; i < list.size(); ++i)
      api.ui_options.push_back(as_string(list[i], at_index("ui_options", i)));
  }

  {
    auto const& list = as_array(field(d, "ui_events", path), "ui_events");
    api.ui_events.reserve(list.size());
    for (std::size_t i = 0; i < list.size(); ++i)
      api.ui_events.push_back(parse_ui_event(list[i], at_index("ui_events", i)));
  }

  return api;
}

Api parse_manifest(std::span<const std::uint8_t> bytes)
{
  nvbind::Reader reader(bytes);
  auto root = reader.read_value();
  if (!reader.at_end()) {
    NVBIND_LOG_WARN("ignoring {} trailing bytes after the manifest",
                    reader.remaining());
  }
  return parse_manifest(root);
}

} // namespace nvgen
