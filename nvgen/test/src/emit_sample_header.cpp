// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <iostream>

#include <nvbind/impl/logging.hpp>

#include "fixture.hpp"

// Writes the header generated from sample_manifest() to the given path.
int main(int argc, char** argv)
{
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <output header>\n";
    return -1;
  }

  nvbind::impl::get_logger()->set_level(nvbind::impl::LogLevel::error);

  try {
    auto compilation =
        nvgen::CompilationBuilder()
            .set_source(std::make_unique<nvgen::MemoryManifestSource>(
                nvgentest::encode(nvgentest::sample_manifest())))
            .set_output(std::filesystem::path(argv[1]))
            .build();
    compilation->compile();
    return 0;
  } catch (std::exception& ex) {
    std::cerr << ex.what() << '\n';
  }
  return -1;
}
