// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include <nvbind/client.hpp>
#include <nvbind/export.hpp>
#include <nvbind/impl/logging.hpp>

namespace nvbind {

using LogLevel = impl::LogLevel;

// Byte stream the RPC client talks over.
class Transport
{
public:
  virtual ~Transport() = default;

  /// Writes every byte or throws TransportError.
  virtual void write(std::span<const std::uint8_t> bytes) = 0;

  /// Blocks until at least one byte is available. Returns 0 at end of stream.
  virtual std::size_t read_some(std::span<std::uint8_t> out) = 0;
};

/**
 * @brief Child process spoken to through its stdin and stdout,
 * e.g. `nvim --embed`.
 *
 * Closing the transport closes the child's stdin and gives it a moment to
 * exit before terminating it.
 */
class ProcessTransport : public Transport
{
public:
  /// Throws TransportError if the executable cannot be found or started.
  NVBIND_API ProcessTransport(const std::string& executable,
                              const std::vector<std::string>& args);
  NVBIND_API ~ProcessTransport() override;

  NVBIND_API void write(std::span<const std::uint8_t> bytes) override;
  NVBIND_API std::size_t read_some(std::span<std::uint8_t> out) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief MessagePack-RPC client.
 *
 * Request:      [0, msgid, method, params]
 * Response:     [1, msgid, error, result]
 * Notification: [2, method, params]
 *
 * Replies are matched by msgid; a reply for another request is parked until
 * its future asks for it. Notifications and requests from the peer are
 * logged and dropped.
 *
 * A message that is framed correctly but cannot be decoded fails only the
 * call it answers; any other malformed message is dropped. Dropping a future
 * without get() discards its reply. The client must outlive its futures.
 */
class RpcClient : public Client
{
  class Ticket;

  struct Reply {
    std::optional<Value> error;
    flat_buffer result;
    // set when the response could not be decoded
    std::exception_ptr failure;
  };

  mutable std::mutex mutex_;
  std::unique_ptr<Transport> transport_;
  HandleRegistry registry_;
  std::uint32_t next_msgid_ = 0;
  std::set<std::uint32_t> pending_;
  std::set<std::uint32_t> abandoned_;
  std::map<std::uint32_t, Reply> parked_;
  flat_buffer inbox_;
  std::optional<std::string> broken_;

  flat_buffer wait_for(std::uint32_t msgid);
  void abandon(std::uint32_t msgid);
  void receive_one();
  void deliver(std::uint32_t msgid, Reply reply);
  void send(const flat_buffer& msg);

public:
  NVBIND_API explicit RpcClient(
      std::unique_ptr<Transport> transport,
      HandleRegistry registry = HandleRegistry::neovim());

  NVBIND_API std::future<flat_buffer> request(std::string_view method,
                                              flat_buffer&& params) override;

  /// One-way message, no reply expected.
  NVBIND_API void notify(std::string_view method, flat_buffer&& params);

  /// Requests whose futures have not collected a reply yet.
  NVBIND_API std::size_t outstanding() const;

  const HandleRegistry& handles() const noexcept override { return registry_; }
};

class RpcClientBuilder
{
  HandleRegistry registry_ = HandleRegistry::neovim();
  std::unique_ptr<Transport> transport_;
  std::optional<std::pair<std::string, std::vector<std::string>>> spawn_;

public:
  RpcClientBuilder() = default;

  RpcClientBuilder& set_log_level(LogLevel level)
  {
    impl::get_logger()->set_level(level);
    return *this;
  }

  RpcClientBuilder& set_handle_registry(HandleRegistry registry)
  {
    registry_ = std::move(registry);
    return *this;
  }

  RpcClientBuilder& set_transport(std::unique_ptr<Transport> transport)
  {
    transport_ = std::move(transport);
    spawn_.reset();
    return *this;
  }

  /// Start the peer as a child process when build() is called.
  RpcClientBuilder& spawn(std::string executable = "nvim",
                          std::vector<std::string> args = {"--embed"})
  {
    transport_.reset();
    spawn_.emplace(std::move(executable), std::move(args));
    return *this;
  }

  /// Throws nvbind::Exception if neither a transport nor spawn() was given.
  NVBIND_API std::unique_ptr<RpcClient> build();
};

} // namespace nvbind
