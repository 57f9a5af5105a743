// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <future>
#include <string_view>
#include <type_traits>
#include <utility>

#include <nvbind/codec.hpp>
#include <nvbind/flat_buffer.hpp>
#include <nvbind/handle.hpp>

namespace nvbind {

/**
 * @brief Remote end of a typed call.
 *
 * Generated stubs only need this interface: they encode their argument tuple
 * and hand it over together with the method name. An implementation owns the
 * message framing and the matching of replies to requests.
 */
class Client
{
public:
  virtual ~Client() = default;

  /**
   * @brief Sends one request.
   * @param method remote procedure name
   * @param params encoded MessagePack array of the arguments
   * @return future resolving to the encoded result value; get() throws
   * RemoteError for an error reply and TransportError for a broken link.
   */
  virtual std::future<flat_buffer> request(std::string_view method,
                                           flat_buffer&& params) = 0;

  /// Tag assignment used to encode arguments and decode results.
  virtual const HandleRegistry& handles() const noexcept = 0;

  /**
   * @brief Encodes args, sends them and decodes the result as R.
   *
   * The request is written before call() returns. The client must outlive the
   * returned future.
   */
  template <typename R, typename... Args>
  std::future<R> call(std::string_view method, const Args&... args)
  {
    flat_buffer params;
    Writer w(params, handles());
    w.write_tuple(args...);

    auto reply = request(method, std::move(params));
    return std::async(
        std::launch::deferred,
        [reply = std::move(reply), this]() mutable -> R {
          if constexpr (std::is_void_v<R>) {
            reply.get();
          } else {
            auto result = reply.get();
            Reader r(result, handles());
            return r.read<R>();
          }
        });
  }
};

} // namespace nvbind
