// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>

#include <nvbind/exception.hpp>
#include <nvbind/impl/logging.hpp>

#include "cpp_builder.hpp"
#include "identifiers.hpp"

namespace nvgen::builders {

namespace {

std::string quoted(std::string_view s)
{
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (char c : s) {
    if (c == '"' || c == '\\')
      out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

std::string to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
  });
  return out;
}

const char* bool_str(bool b) { return b ? "true" : "false"; }

} // namespace

CppBuilder::CppBuilder(std::ostream& os, std::string ns)
    : os_(os)
    , namespace_(std::move(ns))
{
}

std::string CppBuilder::guard_name() const
{
  std::string guard = "NVGEN_";
  for (char c : namespace_) {
    if ((c >= 'a' && c <= 'z'))
      guard += static_cast<char>(c - 'a' + 'A');
    else if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
      guard += c;
    else
      guard += '_';
  }
  guard += "_API_HPP_";
  return guard;
}

std::string CppBuilder::map_scalar(const std::string& name,
                                   std::string_view function_name,
                                   bool is_return,
                                   bool is_element)
{
  if (name == "Boolean")
    return "bool";
  if (name == "Integer")
    return "std::int64_t";
  if (name == "Float")
    return "double";
  if (name == "String")
    return is_return ? "std::string" : "std::string_view";
  if (name == "Array")
    return "::nvbind::Array";
  if (name == "Dictionary")
    return "::nvbind::Dictionary";
  if (name == "Object") {
    if (is_return) {
      // window_get_cursor and friends: the name says which handle comes back
      for (auto const& e : registry_.entries()) {
        if (function_name.starts_with(to_lower(e.name)))
          return e.name;
      }
    }
    return "::nvbind::Value";
  }
  if (name == "void" && is_return && !is_element)
    return "void";

  auto const& entries = registry_.entries();
  if (std::any_of(entries.begin(), entries.end(),
                  [&name](const auto& e) { return e.name == name; }))
    return name;

  NVBIND_LOG_WARN("{}: unknown type \"{}\", using ::nvbind::Value",
                  function_name, name);
  ++stats_.unknown_types;
  return "::nvbind::Value";
}

std::string CppBuilder::map_type(const TypeName& type,
                                 std::string_view function_name,
                                 bool is_return)
{
  if (auto t = std::get_if<ScalarType>(&type))
    return map_scalar(t->name, function_name, is_return, false);

  if (auto t = std::get_if<DynamicArrayType>(&type)) {
    auto const element = map_scalar(t->element, function_name, is_return, true);
    return is_return ? "std::vector<" + element + ">"
                     : "::nvbind::Sequence<" + element + ">";
  }

  auto const& t = std::get<FixedArrayType>(type);
  return "std::array<" + map_scalar(t.element, function_name, is_return, true) +
         ", " + std::to_string(t.size) + ">";
}

bool CppBuilder::passed_by_value(const std::string& cpp_type) const
{
  if (cpp_type == "bool" || cpp_type == "std::int64_t" ||
      cpp_type == "double" || cpp_type == "std::string_view")
    return true;
  auto const& entries = registry_.entries();
  return std::any_of(entries.begin(), entries.end(),
                     [&cpp_type](const auto& e) { return e.name == cpp_type; });
}

void CppBuilder::emit_prologue()
{
  auto const guard = guard_name();
  out << "// Generated by nvgen from the Neovim API manifest. Do not edit.\n\n"
      << "#ifndef " << guard << '\n'
      << "#define " << guard << "\n\n"
      << "#include <nvbind/nvbind.hpp>\n\n"
      << "namespace " << namespace_ << " {\n\n";
}

void CppBuilder::emit_version(const nvbind::Version& v)
{
  out << bl() << "inline constexpr ::nvbind::Version version{\n" << bb(false)
      << bl() << ".api_compatible = " << v.api_compatible << ",\n"
      << bl() << ".api_level = " << v.api_level << ",\n"
      << bl() << ".api_prerelease = " << bool_str(v.api_prerelease) << ",\n"
      << bl() << ".major = " << v.major << ",\n"
      << bl() << ".minor = " << v.minor << ",\n"
      << bl() << ".patch = " << v.patch << ",\n"
      << bl() << ".prerelease = " << bool_str(v.prerelease) << ",\n"
      << eb(false) << bl() << "};\n\n";
}

void CppBuilder::emit_error_types(
    const std::map<std::string, std::int64_t>& error_types)
{
  std::vector<std::string> names;
  for (auto const& [name, id] : error_types)
    names.push_back(name);
  auto const enumerators = make_enumerators(names, "Error");

  out << bl() << "enum class ErrorType : std::int64_t {\n" << bb(false);
  std::size_t i = 0;
  for (auto const& [name, id] : error_types)
    out << bl() << enumerators[i++] << " = " << id << ",\n";
  out << eb(false) << bl() << "};\n\n";
}

void CppBuilder::emit_handle_types(const std::map<std::string, TypeDecl>& types)
{
  for (auto const& [name, decl] : types) {
    if (!nvbind::handle_kind_from_name(name)) {
      NVBIND_LOG_WARN("type table entry \"{}\" is not a known handle kind, "
                      "skipped",
                      name);
      continue;
    }
    try {
      registry_.add(name, decl.id, decl.prefix);
    } catch (const nvbind::Exception& e) {
      NVBIND_LOG_WARN("type table entry \"{}\" skipped: {}", name, e.what());
    }
  }
  stats_.handle_kinds = registry_.entries().size();

  for (auto const& e : registry_.entries())
    out << registry_.declaration(e.kind) << '\n';

  out << bl() << "inline const ::nvbind::HandleRegistry& handle_registry()\n"
      << bb() << bl() << "static const ::nvbind::HandleRegistry registry{\n"
      << bb(false);
  for (auto const& e : registry_.entries()) {
    out << bl() << "{" << quoted(e.name) << ", " << static_cast<int>(e.type_id)
        << ", " << quoted(e.prefix) << "},\n";
  }
  out << eb(false) << bl() << "};\n"
      << bl() << "return registry;\n"
      << eb() << '\n';
}

void CppBuilder::emit_name_mapping(std::string_view enum_name,
                                   std::string_view from_string_name,
                                   const std::vector<std::string>& names,
                                   const std::vector<std::string>& enumerators)
{
  out << bl() << "enum class " << enum_name << " {\n" << bb(false);
  for (auto const& e : enumerators)
    out << bl() << e << ",\n";
  out << eb(false) << bl() << "};\n\n";

  out << bl() << "inline std::string_view to_string(" << enum_name
      << " v) noexcept\n"
      << bb() << bl() << "switch (v) {\n";
  for (std::size_t i = 0; i < names.size(); ++i) {
    out << bl() << "case " << enum_name << "::" << enumerators[i] << ":\n"
        << bb(false) << bl() << "return " << quoted(names[i]) << ";\n"
        << eb(false);
  }
  out << bl() << "}\n" << bl() << "return {};\n" << eb() << '\n';

  out << bl() << "inline std::optional<" << enum_name << "> " << from_string_name
      << "(std::string_view s) noexcept\n"
      << bb();
  for (std::size_t i = 0; i < names.size(); ++i) {
    out << bl() << "if (s == " << quoted(names[i]) << ")\n"
        << bb(false) << bl() << "return " << enum_name << "::" << enumerators[i]
        << ";\n"
        << eb(false);
  }
  out << bl() << "return std::nullopt;\n" << eb() << '\n';
}

void CppBuilder::emit_ui_options(const std::vector<std::string>& options)
{
  stats_.ui_options = options.size();
  emit_name_mapping("UiOption", "ui_option_from_string", options,
                    make_enumerators(options, "Option"));
}

void CppBuilder::emit_ui_events(const std::vector<UiEventDecl>& events)
{
  stats_.ui_events = events.size();

  std::vector<std::string> names;
  names.reserve(events.size());
  for (auto const& ev : events)
    names.push_back(ev.name);
  auto const enumerators = make_enumerators(names, "Event");

  emit_name_mapping("UiEvent", "ui_event_from_string", names, enumerators);

  out << bl() << "inline std::int64_t ui_event_since(UiEvent v) noexcept\n"
      << bb() << bl() << "switch (v) {\n";
  for (std::size_t i = 0; i < events.size(); ++i) {
    out << bl() << "case UiEvent::" << enumerators[i] << ":\n"
        << bb(false) << bl() << "return " << events[i].since << ";\n"
        << eb(false);
  }
  out << bl() << "}\n" << bl() << "return 0;\n" << eb() << '\n';
}

void CppBuilder::emit_function(const FunctionDecl& fn)
{
  auto const ret = map_type(fn.return_type, fn.name, true);
  auto const name =
      is_cpp_keyword(fn.name) ? fn.name + "_" : std::string(fn.name);

  out << bl() << "// since " << fn.since;
  if (fn.deprecated_since)
    out << ", deprecated since " << *fn.deprecated_since;
  if (fn.method)
    out << ", method";
  out << '\n';

  if (fn.deprecated_since) {
    out << bl() << "[[deprecated(\"deprecated since API level "
        << *fn.deprecated_since << "\")]]\n";
  }

  out << bl() << "inline std::future<" << ret << "> " << name
      << "(::nvbind::Client& client";
  std::vector<std::string> args;
  for (auto const& p : fn.parameters) {
    auto const type = map_type(p.type, fn.name, false);
    auto arg = escape_identifier(p.name);
    out << ", ";
    if (passed_by_value(type))
      out << type << ' ' << arg;
    else
      out << "const " << type << "& " << arg;
    args.push_back(std::move(arg));
  }
  out << ")\n" << bb() << bl() << "return client.call<" << ret << ">("
      << quoted(fn.name);
  for (auto const& a : args)
    out << ", " << a;
  out << ");\n" << eb() << '\n';
}

void CppBuilder::emit_functions(const std::vector<FunctionDecl>& functions)
{
  out << bl() << "namespace functions {\n\n";
  for (auto const& fn : functions) {
    auto lua_ref = std::find_if(
        fn.parameters.begin(), fn.parameters.end(),
        [](const Parameter& p) { return base_name(p.type) == "LuaRef"; });
    if (lua_ref != fn.parameters.end()) {
      NVBIND_LOG_DEBUG("skipping {}: parameter {} is a LuaRef", fn.name,
                       lua_ref->name);
      ++stats_.functions_skipped;
      continue;
    }
    emit_function(fn);
    ++stats_.functions_emitted;
  }
  out << bl() << "} // namespace functions\n\n";
}

void CppBuilder::finalize()
{
  out << "} // namespace " << namespace_ << "\n\n"
      << "#endif // " << guard_name() << '\n';
  os_ << out.str();
  os_.flush();
}

} // namespace nvgen::builders
