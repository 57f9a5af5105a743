// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "api.hpp"

namespace nvgen::builders {

template <typename Fn> struct OstreamWrapper {
  Fn fn;
};

template <typename Fn>
inline std::ostream& operator<<(std::ostream& os, const OstreamWrapper<Fn>& wrapper)
{
  wrapper.fn(os);
  return os;
}

class BlockDepth
{
  friend std::ostream& operator<<(std::ostream&, const BlockDepth&);
  std::size_t depth_ = 0;

public:
  BlockDepth& operator--()
  {
    if (depth_ == 0)
      depth_ = 1;
    --depth_;
    return *this;
  }

  BlockDepth& operator++()
  {
    ++depth_;
    return *this;
  }
};

inline std::ostream& operator<<(std::ostream& os, const BlockDepth& block)
{
  for (std::size_t i = 0; i < block.depth_; ++i)
    os << "  ";
  return os;
}

// Counters reported at the end of a pass
struct BuildStats {
  std::size_t functions_emitted = 0;
  std::size_t functions_skipped = 0;
  std::size_t handle_kinds = 0;
  std::size_t ui_options = 0;
  std::size_t ui_events = 0;
  std::size_t unknown_types = 0;
};

// One emit call per manifest section, in the order the compilation walks them.
class Builder
{
protected:
  BlockDepth block_depth_;
  BuildStats stats_;

  auto bb(bool newline = true)
  {
    return OstreamWrapper{[this, newline](std::ostream& os) {
      if (newline)
        os << block_depth_ << "{\n";
      ++block_depth_;
    }};
  }

  auto eb(bool newline = true)
  {
    return OstreamWrapper{[this, newline](std::ostream& os) {
      --block_depth_;
      if (newline)
        os << block_depth_ << "}\n";
    }};
  }

  auto bl()
  {
    return OstreamWrapper{[this](std::ostream& os) { os << block_depth_; }};
  }

public:
  virtual void emit_prologue() = 0;
  virtual void emit_version(const nvbind::Version& version) = 0;
  virtual void
  emit_error_types(const std::map<std::string, std::int64_t>& error_types) = 0;
  virtual void emit_handle_types(const std::map<std::string, TypeDecl>& types) = 0;
  virtual void emit_ui_options(const std::vector<std::string>& options) = 0;
  virtual void emit_ui_events(const std::vector<UiEventDecl>& events) = 0;
  virtual void emit_functions(const std::vector<FunctionDecl>& functions) = 0;
  /**
   * @brief Finalize the builder, write any pending data to the output.
   */
  virtual void finalize() = 0;

  const BuildStats& stats() const noexcept { return stats_; }

  virtual ~Builder() = default;
};

} // namespace nvgen::builders
