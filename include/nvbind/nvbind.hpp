// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

// Everything a generated binding header needs.

#include <array>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nvbind/client.hpp>
#include <nvbind/codec.hpp>
#include <nvbind/exception.hpp>
#include <nvbind/handle.hpp>
#include <nvbind/value.hpp>
#include <nvbind/version.hpp>
