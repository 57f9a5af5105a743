// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

#include "builder.hpp"
#include "manifest_source.hpp"

namespace nvgen {

// One generation pass: read the manifest, project it, emit the header.
class ICompilation
{
  friend class CompilationBuilder;
  std::unique_ptr<struct Compilation> impl_;

public:
  ~ICompilation();
  void compile();
  const builders::BuildStats& stats() const;
};

class CompilationBuilder
{
public:
  CompilationBuilder& set_source(std::unique_ptr<IManifestSource> source);
  CompilationBuilder& set_output(const std::filesystem::path& output_file);
  // The stream must outlive the compilation
  CompilationBuilder& set_output(std::ostream& os);
  CompilationBuilder& set_namespace(std::string ns);
  std::unique_ptr<ICompilation> build();

private:
  std::unique_ptr<IManifestSource> source_;
  std::filesystem::path output_file_;
  std::ostream* output_stream_ = nullptr;
  std::string namespace_ = "nvim";
};

} // namespace nvgen
