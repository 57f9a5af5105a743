// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <nplib/utils/colored_cout.h>

#include <nvbind/exception.hpp>
#include <nvbind/impl/logging.hpp>

#include "compilation.hpp"
#include "manifest.hpp"
#include "type_name.hpp"

using namespace nvgen;

int main(int argc, char* argv[])
{
  namespace po = boost::program_options;

  std::filesystem::path api_info;
  std::filesystem::path output;
  std::string nvim;
  std::string ns;
  bool verbose;

  po::options_description desc("Allowed options");
  desc.add_options()
    ("help", "produce help message")
    ("api-info", po::value<std::filesystem::path>(&api_info), "Read a captured `nvim --api-info` dump instead of running nvim")
    ("nvim", po::value<std::string>(&nvim)->default_value("nvim"), "Neovim executable queried for the manifest")
    ("output,o", po::value<std::filesystem::path>(&output), "Generated header (default: standard output)")
    ("namespace", po::value<std::string>(&ns)->default_value("nvim"), "Namespace of the generated bindings")
    ("verbose,v", po::bool_switch(&verbose)->default_value(false), "Log every skipped function")
    ;

  try {
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cout << desc << "\n";
      return 0;
    }
  } catch (po::error& e) {
    std::cerr << e.what() << '\n';
    return -1;
  }

  if (verbose)
    nvbind::impl::get_logger()->set_level(nvbind::impl::LogLevel::debug);

  try {
    CompilationBuilder builder;
    if (api_info.empty())
      builder.set_source(std::make_unique<ProcessManifestSource>(nvim));
    else
      builder.set_source(std::make_unique<FileManifestSource>(api_info));

    if (output.empty())
      builder.set_output(std::cout);
    else
      builder.set_output(output);

    builder.set_namespace(ns).build()->compile();

    return 0;
  } catch (type_name_error& e) {
    std::cerr << clr::red << "Type name error in:\n\t" << clr::cyan << '"'
              << e.input << "\":" << e.col << ": " << clr::reset << e.what();
    if (!e.token.empty())
      std::cerr << " (at '" << e.token << "')";
    std::cerr << '\n';
  } catch (manifest_error& e) {
    std::cerr << clr::red << "Manifest error in:\n\t" << clr::cyan << e.path
              << ": " << clr::reset << e.what() << '\n';
  } catch (nvbind::Exception& e) {
    std::cerr << clr::red << "Error: " << clr::reset << e.what() << '\n';
  } catch (std::exception& ex) {
    std::cerr << ex.what() << '\n';
  }

  return -1;
}
