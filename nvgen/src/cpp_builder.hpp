// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include <nvbind/handle.hpp>

#include "builder.hpp"

namespace nvgen::builders {

/**
 * @brief Emits a single self-contained C++ header binding the manifest.
 *
 * Output only depends on the descriptor records, so identical manifests give
 * identical headers.
 */
class CppBuilder : public Builder
{
  std::ostream& os_;
  std::stringstream out;
  std::string namespace_;
  // Filled by emit_handle_types; decides which type names are handles
  nvbind::HandleRegistry registry_;

  std::string guard_name() const;

  std::string map_scalar(const std::string& name,
                         std::string_view function_name,
                         bool is_return,
                         bool is_element);
  std::string map_type(const TypeName& type,
                       std::string_view function_name,
                       bool is_return);
  bool passed_by_value(const std::string& cpp_type) const;

  void emit_name_mapping(std::string_view enum_name,
                         std::string_view from_string_name,
                         const std::vector<std::string>& names,
                         const std::vector<std::string>& enumerators);
  void emit_function(const FunctionDecl& fn);

public:
  void emit_prologue() override;
  void emit_version(const nvbind::Version& version) override;
  void emit_error_types(
      const std::map<std::string, std::int64_t>& error_types) override;
  void emit_handle_types(const std::map<std::string, TypeDecl>& types) override;
  void emit_ui_options(const std::vector<std::string>& options) override;
  void emit_ui_events(const std::vector<UiEventDecl>& events) override;
  void emit_functions(const std::vector<FunctionDecl>& functions) override;
  void finalize() override;

  CppBuilder(std::ostream& os, std::string ns);
};

} // namespace nvgen::builders
