// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <array>
#include <cstring>
#include <deque>
#include <type_traits>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <nvbind/rpc_client.hpp>

// Generated at build time from sample_manifest()
#include "sample_api.hpp"

namespace nvgentest {

using namespace nvbind;

// Replays canned responses and keeps what the stubs write.
class CannedPeer : public Transport
{
public:
  flat_buffer written;
  std::deque<std::vector<std::uint8_t>> incoming;

  void write(std::span<const std::uint8_t> bytes) override
  {
    written.append(bytes.data(), bytes.size());
  }

  std::size_t read_some(std::span<std::uint8_t> out) override
  {
    if (incoming.empty())
      return 0;
    auto& chunk = incoming.front();
    auto const n = std::min(out.size(), chunk.size());
    std::memcpy(out.data(), chunk.data(), n);
    chunk.erase(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
    if (chunk.empty())
      incoming.pop_front();
    return n;
  }

  void respond(std::uint32_t msgid, const Value& result)
  {
    flat_buffer buf;
    Writer w(buf, nvim::handle_registry());
    w.write_array_header(4);
    w.write_integer(1);
    w.write_unsigned(msgid);
    w.write_nil();
    w.write_value(result);
    auto b = buf.bytes();
    incoming.emplace_back(b.begin(), b.end());
  }
};

class GeneratedHeader : public ::testing::Test
{
protected:
  CannedPeer* peer = nullptr;
  std::unique_ptr<RpcClient> client;

  void SetUp() override
  {
    auto transport = std::make_unique<CannedPeer>();
    peer = transport.get();
    client = RpcClientBuilder()
                 .set_handle_registry(nvim::handle_registry())
                 .set_transport(std::move(transport))
                 .build();
  }
};

static_assert(std::is_same_v<decltype(nvim::functions::nvim_win_get_cursor(
                                 std::declval<Client&>(), nvim::Window())),
                             std::future<std::array<std::int64_t, 2>>>);
static_assert(std::is_same_v<decltype(nvim::functions::nvim_list_bufs(
                                 std::declval<Client&>())),
                             std::future<std::vector<nvim::Buffer>>>);
static_assert(nvim::Tabpage::type_id == 2);

TEST_F(GeneratedHeader, StubRoundTrip)
{
  auto cursor = nvim::functions::nvim_win_get_cursor(*client, nvim::Window(1000));

  Reader r(peer->written, nvim::handle_registry());
  EXPECT_EQ(r.read_array_header(), 4u);
  EXPECT_EQ(r.read_integer(), 0);
  EXPECT_EQ(r.read_integer(), 0);
  EXPECT_EQ(r.read_string(), "nvim_win_get_cursor");
  EXPECT_EQ(r.read_array_header(), 1u);
  EXPECT_EQ(r.read<nvim::Window>(), nvim::Window(1000));
  EXPECT_TRUE(r.at_end());

  peer->respond(0, Array{3, 4});
  EXPECT_EQ(cursor.get(), (std::array<std::int64_t, 2>{3, 4}));
}

TEST_F(GeneratedHeader, HandleListAndVoidStubs)
{
  auto bufs = nvim::functions::nvim_list_bufs(*client);
  std::vector<std::string_view> lines{"a", "b"};
  auto set = nvim::functions::nvim_buf_set_lines(*client, nvim::Buffer(1), 0,
                                                 -1, false, lines);

  peer->respond(0, Array{nvim::Buffer(1), nvim::Buffer(4)});
  peer->respond(1, Value());

  EXPECT_EQ(bufs.get(),
            (std::vector<nvim::Buffer>{nvim::Buffer(1), nvim::Buffer(4)}));
  EXPECT_NO_THROW(set.get());
}

TEST(GeneratedConstants, VersionAndUiOptions)
{
  EXPECT_EQ(nvim::version.api_level, 12);
  EXPECT_EQ(nvim::version.minor, 10);
  EXPECT_EQ(nvim::ui_option_from_string("ext_cmdline"),
            nvim::UiOption::ExtCmdline);
  EXPECT_EQ(nvim::to_string(nvim::UiOption::ExtCmdline), "ext_cmdline");
  EXPECT_FALSE(nvim::ui_option_from_string("ext_nothing").has_value());
  EXPECT_EQ(nvim::ui_event_since(nvim::UiEvent::Flush), 6);
  EXPECT_EQ(static_cast<std::int64_t>(nvim::ErrorType::Validation), 1);
}

} // namespace nvgentest
