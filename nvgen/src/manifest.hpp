// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nvbind/value.hpp>

#include "api.hpp"

namespace nvgen {

// Missing or wrongly typed manifest field. path names the field, e.g.
// "functions[12].name".
class manifest_error : public std::runtime_error
{
public:
  const std::string path;

  manifest_error(std::string_view _path, const std::string& msg)
      : std::runtime_error(std::string(_path) + ": " + msg), path(_path)
  {
  }
};

/// Projects a decoded manifest onto descriptor records.
Api parse_manifest(const nvbind::Value& root);

/// Decodes the MessagePack bytes of `nvim --api-info` and projects them.
Api parse_manifest(std::span<const std::uint8_t> bytes);

} // namespace nvgen
