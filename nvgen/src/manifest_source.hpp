// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace nvgen {

// Interface: where do the manifest bytes come from?
// Implementations either return the complete manifest or throw
// nvbind::TransportError. There is no retry.
class IManifestSource
{
public:
  virtual ~IManifestSource() = default;
  virtual std::vector<std::uint8_t> read() = 0;
  // For diagnostics, e.g. "nvim --api-info"
  virtual std::string describe() const = 0;
};

// Captured output of `nvim --api-info`
class FileManifestSource : public IManifestSource
{
  std::filesystem::path path_;

public:
  explicit FileManifestSource(std::filesystem::path path)
      : path_(std::move(path))
  {
  }

  std::vector<std::uint8_t> read() override;
  std::string describe() const override { return path_.string(); }
};

// Runs the executable and collects its standard output
class ProcessManifestSource : public IManifestSource
{
  std::string executable_;
  std::vector<std::string> args_;

public:
  explicit ProcessManifestSource(std::string executable = "nvim",
                                 std::vector<std::string> args = {"--api-info"})
      : executable_(std::move(executable))
      , args_(std::move(args))
  {
  }

  std::vector<std::uint8_t> read() override;
  std::string describe() const override;
};

// Bytes already in memory; tests build these with nvbind::Writer
class MemoryManifestSource : public IManifestSource
{
  std::vector<std::uint8_t> bytes_;

public:
  explicit MemoryManifestSource(std::vector<std::uint8_t> bytes)
      : bytes_(std::move(bytes))
  {
  }

  std::vector<std::uint8_t> read() override { return bytes_; }
  std::string describe() const override { return "<memory>"; }
};

} // namespace nvgen
