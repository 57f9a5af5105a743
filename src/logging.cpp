// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <nvbind/impl/logging.hpp>

namespace nvbind::impl {

NVBIND_API std::shared_ptr<SimpleLogger>& get_logger()
{
  static std::shared_ptr<SimpleLogger> logger =
      std::make_shared<SimpleLogger>("nvbind", LogLevel::info);
  return logger;
}

} // namespace nvbind::impl
