// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nvbind/version.hpp>

// Descriptor records projected from the API manifest. They live for one
// generation pass.

namespace nvgen {

// `Ident`
struct ScalarType {
  std::string name;

  bool operator==(const ScalarType&) const = default;
};

// `ArrayOf(Ident)`
struct DynamicArrayType {
  std::string element;

  bool operator==(const DynamicArrayType&) const = default;
};

// `ArrayOf(Ident, N)`
struct FixedArrayType {
  std::uint64_t size;
  std::string element;

  bool operator==(const FixedArrayType&) const = default;
};

using TypeName = std::variant<ScalarType, DynamicArrayType, FixedArrayType>;

// Manifest spelling, e.g. "ArrayOf(Integer, 2)"
std::string to_string(const TypeName& type);

// Scalar name, or the element name of an array type
const std::string& base_name(const TypeName& type) noexcept;

struct Parameter {
  TypeName type;
  std::string name;
};

struct FunctionDecl {
  std::string name;
  std::vector<Parameter> parameters;
  TypeName return_type;
  std::int64_t since = 0;
  std::optional<std::int64_t> deprecated_since;
  bool method = false;
};

struct UiEventDecl {
  std::string name;
  std::vector<Parameter> parameters;
  std::int64_t since = 0;
};

struct TypeDecl {
  std::int64_t id;
  std::string prefix;
};

struct Api {
  nvbind::Version version;
  std::map<std::string, std::int64_t> error_types;
  std::map<std::string, TypeDecl> types;
  std::vector<FunctionDecl> functions;
  std::vector<std::string> ui_options;
  std::vector<UiEventDecl> ui_events;
};

} // namespace nvgen
