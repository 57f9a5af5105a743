// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <fstream>
#include <iterator>

#include <boost/process.hpp>

#include <nvbind/exception.hpp>
#include <nvbind/impl/logging.hpp>

#include "manifest_source.hpp"

namespace bp = boost::process;

namespace nvgen {

std::vector<std::uint8_t> FileManifestSource::read()
{
  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs)
    throw nvbind::TransportError("cannot open manifest file: " + path_.string());

  std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(ifs),
                                  std::istreambuf_iterator<char>()};
  if (ifs.bad())
    throw nvbind::TransportError("failed to read manifest file: " +
                                 path_.string());
  return bytes;
}

std::string ProcessManifestSource::describe() const
{
  std::string s = executable_;
  for (auto const& a : args_)
    s += " " + a;
  return s;
}

std::vector<std::uint8_t> ProcessManifestSource::read()
{
  boost::filesystem::path exe = executable_;
  if (exe.filename() == exe) {
    exe = bp::search_path(executable_);
    if (exe.empty())
      throw nvbind::TransportError("executable not found in PATH: " +
                                   executable_);
  }

  NVBIND_LOG_DEBUG("running {}", describe());

  std::vector<std::uint8_t> bytes;
  int exit_code;
  try {
    bp::ipstream out;
    bp::child child(exe, bp::args(args_), bp::std_out > out,
                    bp::std_in < bp::null);

    char chunk[4096];
    while (out.read(chunk, sizeof(chunk)) || out.gcount() > 0)
      bytes.insert(bytes.end(), chunk, chunk + out.gcount());

    child.wait();
    exit_code = child.exit_code();
  } catch (const bp::process_error& e) {
    throw nvbind::TransportError("failed to run " + describe() + ": " +
                                 e.what());
  }

  if (exit_code != 0) {
    throw nvbind::TransportError(describe() + " exited with code " +
                                 std::to_string(exit_code));
  }
  if (bytes.empty())
    throw nvbind::TransportError(describe() + " produced no output");

  NVBIND_LOG_DEBUG("read {} bytes of manifest", bytes.size());
  return bytes;
}

} // namespace nvgen
