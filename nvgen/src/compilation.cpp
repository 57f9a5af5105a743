// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nvbind/exception.hpp>
#include <nvbind/impl/logging.hpp>

#include "compilation.hpp"
#include "cpp_builder.hpp"
#include "manifest.hpp"

// Implementation of ICompilation and CompilationBuilder
namespace nvgen {

struct Compilation {
  const std::unique_ptr<IManifestSource> source_;
  const std::filesystem::path output_file_;
  std::ostream* const output_stream_;
  const std::string namespace_;

  builders::BuildStats stats_;

  Compilation(std::unique_ptr<IManifestSource>&& source,
              std::filesystem::path&& output_file,
              std::ostream* output_stream,
              std::string&& ns)
      : source_(std::move(source))
      , output_file_(std::move(output_file))
      , output_stream_(output_stream)
      , namespace_(std::move(ns))
  {
  }

  void generate(const Api& api, std::ostream& os)
  {
    builders::CppBuilder builder(os, namespace_);
    builder.emit_prologue();
    builder.emit_version(api.version);
    builder.emit_error_types(api.error_types);
    builder.emit_handle_types(api.types);
    builder.emit_ui_options(api.ui_options);
    builder.emit_ui_events(api.ui_events);
    builder.emit_functions(api.functions);
    builder.finalize();
    stats_ = builder.stats();
  }

  void compile()
  {
    NVBIND_LOG_DEBUG("reading manifest from {}", source_->describe());
    auto const bytes = source_->read();
    auto const api = parse_manifest(bytes);

    if (output_stream_) {
      generate(api, *output_stream_);
    } else {
      // Generate into memory first so that a failed pass leaves no
      // half-written header behind
      std::ostringstream os;
      generate(api, os);

      std::ofstream file(output_file_, std::ios::binary | std::ios::trunc);
      if (!file)
        throw std::runtime_error("cannot open " + output_file_.string() +
                                 " for writing");
      file << os.str();
      if (!file)
        throw std::runtime_error("failed writing " + output_file_.string());
    }

    NVBIND_LOG_INFO("API level {}: {} functions emitted, {} skipped, "
                    "{} handle kinds, {} UI options, {} UI events",
                    api.version.api_level, stats_.functions_emitted,
                    stats_.functions_skipped, stats_.handle_kinds,
                    stats_.ui_options, stats_.ui_events);
    if (stats_.unknown_types != 0)
      NVBIND_LOG_WARN("{} type names fell back to ::nvbind::Value",
                      stats_.unknown_types);
  }
};

ICompilation::~ICompilation() = default;

void ICompilation::compile() { impl_->compile(); }

const builders::BuildStats& ICompilation::stats() const { return impl_->stats_; }

CompilationBuilder&
CompilationBuilder::set_source(std::unique_ptr<IManifestSource> source)
{
  source_ = std::move(source);
  return *this;
}

CompilationBuilder&
CompilationBuilder::set_output(const std::filesystem::path& output_file)
{
  output_file_ = output_file;
  output_stream_ = nullptr;
  return *this;
}

CompilationBuilder& CompilationBuilder::set_output(std::ostream& os)
{
  output_file_.clear();
  output_stream_ = &os;
  return *this;
}

CompilationBuilder& CompilationBuilder::set_namespace(std::string ns)
{
  namespace_ = std::move(ns);
  return *this;
}

std::unique_ptr<ICompilation> CompilationBuilder::build()
{
  if (!source_)
    throw nvbind::Exception("no manifest source configured");
  if (!output_stream_ && output_file_.empty())
    throw nvbind::Exception("no output configured");

  auto compilation = std::make_unique<ICompilation>();
  compilation->impl_ = std::make_unique<Compilation>(
      std::move(source_), std::move(output_file_), output_stream_,
      std::move(namespace_));

  return compilation;
}

} // namespace nvgen
