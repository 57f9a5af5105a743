// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

namespace nvbind {

// API version block of the manifest. Generated headers carry one as a
// constexpr constant.
struct Version {
  std::int64_t api_compatible = 0;
  std::int64_t api_level = 0;
  bool api_prerelease = false;
  std::int64_t major = 0;
  std::int64_t minor = 0;
  std::int64_t patch = 0;
  bool prerelease = false;

  constexpr bool operator==(const Version&) const noexcept = default;
};

} // namespace nvbind
