// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <exception>
#include <utility>
#include <variant>

#include <nvbind/impl/logging.hpp>
#include <nvbind/rpc_client.hpp>

namespace nvbind {

namespace {

enum MessageType : std::int64_t {
  Request = 0,
  Response = 1,
  Notification = 2,
};

constexpr std::size_t read_chunk = 4096;

struct ResponseMsg {
  std::uint32_t msgid;
  Value error;
  flat_buffer result;
};

struct NotificationMsg {
  std::string method;
};

struct RequestMsg {
  std::uint32_t msgid;
  std::string method;
};

using Message = std::variant<ResponseMsg, NotificationMsg, RequestMsg>;

// Length of the message at the front of bytes, or 0 while it is incomplete.
std::size_t frame_length(std::span<const std::uint8_t> bytes)
{
  Reader r(bytes);
  try {
    r.skip();
  } catch (const TransportError&) {
    return 0;
  }
  return r.position();
}

// Decodes one complete message.
Message parse_message(std::span<const std::uint8_t> bytes,
                      const HandleRegistry& registry)
{
  Reader r(bytes, registry);
  auto const n = r.read_array_header();
  auto const type = r.read_integer();

  switch (type) {
  case MessageType::Response: {
    if (n != 4)
      break;
    ResponseMsg msg;
    msg.msgid = r.read<std::uint32_t>();
    msg.error = r.read_value();
    auto const begin = r.position();
    r.read_value();
    msg.result = flat_buffer(bytes.subspan(begin, r.position() - begin));
    return msg;
  }
  case MessageType::Notification: {
    if (n != 3)
      break;
    NotificationMsg msg;
    msg.method = r.read_string();
    r.read_value();
    return msg;
  }
  case MessageType::Request: {
    if (n != 4)
      break;
    RequestMsg msg;
    msg.msgid = r.read<std::uint32_t>();
    msg.method = r.read_string();
    r.read_value();
    return msg;
  }
  default:
    break;
  }
  throw EncodingError("malformed message: type " + std::to_string(type) +
                      " with " + std::to_string(n) + " fields");
}

// msgid of a message that has the response header, whatever its body holds.
std::optional<std::uint32_t>
response_id(std::span<const std::uint8_t> bytes) noexcept
{
  Reader r(bytes);
  try {
    if (r.read_array_header() == 4 && r.read_integer() == MessageType::Response)
      return r.read<std::uint32_t>();
  } catch (const Exception&) {
    // no usable header
  }
  return std::nullopt;
}

[[noreturn]] void throw_remote_error(const Value& error)
{
  if (error.is<Array>()) {
    auto const& a = error.as<Array>();
    if (a.size() >= 2 && a[0].is<std::int64_t>() && a[1].is<std::string>())
      throw RemoteError(a[0].as<std::int64_t>(), a[1].as<std::string>());
  }
  throw RemoteError(-1, to_string(error));
}

} // namespace

NVBIND_API RpcClient::RpcClient(std::unique_ptr<Transport> transport,
                                HandleRegistry registry)
    : transport_(std::move(transport))
    , registry_(std::move(registry))
{
  if (!transport_)
    throw Exception("RpcClient requires a transport");
}

void RpcClient::send(const flat_buffer& msg)
{
  transport_->write(msg.bytes());
}

// Owned by the deferred future of one request. Dropping the future unread
// forgets the request and discards its reply.
class RpcClient::Ticket
{
  RpcClient* client_;
  std::uint32_t msgid_;

public:
  Ticket(RpcClient* client, std::uint32_t msgid) noexcept
      : client_(client)
      , msgid_(msgid)
  {
  }

  Ticket(Ticket&& other) noexcept
      : client_(std::exchange(other.client_, nullptr))
      , msgid_(other.msgid_)
  {
  }

  Ticket& operator=(Ticket&&) = delete;

  ~Ticket()
  {
    if (client_)
      client_->abandon(msgid_);
  }

  flat_buffer redeem()
  {
    return std::exchange(client_, nullptr)->wait_for(msgid_);
  }
};

NVBIND_API std::future<flat_buffer>
RpcClient::request(std::string_view method, flat_buffer&& params)
{
  std::uint32_t msgid;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    msgid = next_msgid_++;

    flat_buffer msg;
    Writer w(msg, registry_);
    w.write_array_header(4);
    w.write_integer(MessageType::Request);
    w.write_unsigned(msgid);
    w.write_string(method);
    msg.append(params.data_ptr(), params.size());

    send(msg);
    pending_.insert(msgid);
  }

  NVBIND_LOG_TRACE("request #{} {}", msgid, method);

  return std::async(std::launch::deferred,
                    [ticket = Ticket(this, msgid)]() mutable {
                      return ticket.redeem();
                    });
}

NVBIND_API void RpcClient::notify(std::string_view method, flat_buffer&& params)
{
  std::lock_guard<std::mutex> lock(mutex_);

  flat_buffer msg;
  Writer w(msg, registry_);
  w.write_array_header(3);
  w.write_integer(MessageType::Notification);
  w.write_string(method);
  msg.append(params.data_ptr(), params.size());

  send(msg);
}

NVBIND_API std::size_t RpcClient::outstanding() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size() + parked_.size();
}

void RpcClient::abandon(std::uint32_t msgid)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (parked_.erase(msgid) == 0 && pending_.erase(msgid) != 0)
    abandoned_.insert(msgid);
  NVBIND_LOG_TRACE("request #{} abandoned", msgid);
}

// Called with mutex_ held.
void RpcClient::deliver(std::uint32_t msgid, Reply reply)
{
  if (pending_.erase(msgid) != 0) {
    parked_.emplace(msgid, std::move(reply));
  } else if (abandoned_.erase(msgid) != 0) {
    NVBIND_LOG_DEBUG("discarding response for abandoned request #{}", msgid);
  } else {
    NVBIND_LOG_WARN("dropping response for unknown request #{}", msgid);
  }
}

// Reads from the transport until one whole message is buffered, then routes
// it. Called with mutex_ held.
void RpcClient::receive_one()
{
  for (;;) {
    std::size_t len = 0;
    if (inbox_.size() != 0) {
      try {
        len = frame_length(inbox_.bytes());
      } catch (const EncodingError& e) {
        // no way to find where the next message starts
        broken_ = e.what();
        inbox_.consume(inbox_.size());
        NVBIND_LOG_ERROR("lost message framing: {}", *broken_);
        throw TransportError("lost message framing: " + *broken_);
      }
    }

    if (len != 0) {
      auto const bytes = inbox_.bytes().first(len);
      try {
        auto msg = parse_message(bytes, registry_);
        if (auto resp = std::get_if<ResponseMsg>(&msg)) {
          Reply reply;
          if (!resp->error.is_nil())
            reply.error = std::move(resp->error);
          reply.result = std::move(resp->result);
          deliver(resp->msgid, std::move(reply));
        } else if (auto note = std::get_if<NotificationMsg>(&msg)) {
          NVBIND_LOG_DEBUG("dropping notification {}", note->method);
        } else if (auto req = std::get_if<RequestMsg>(&msg)) {
          NVBIND_LOG_WARN("dropping request #{} {} from peer", req->msgid,
                          req->method);
        }
      } catch (const Exception& e) {
        if (auto msgid = response_id(bytes)) {
          NVBIND_LOG_WARN("response #{} is malformed: {}", *msgid, e.what());
          Reply reply;
          reply.failure = std::current_exception();
          deliver(*msgid, std::move(reply));
        } else {
          NVBIND_LOG_WARN("dropping malformed message: {}", e.what());
        }
      }
      inbox_.consume(len);
      return;
    }

    auto mb = inbox_.prepare(read_chunk);
    auto const n = transport_->read_some(
        {static_cast<std::uint8_t*>(mb.data()), mb.size()});
    if (n == 0) {
      throw TransportError("connection closed with " +
                           std::to_string(pending_.size()) +
                           " request(s) outstanding");
    }
    inbox_.commit(n);
  }
}

flat_buffer RpcClient::wait_for(std::uint32_t msgid)
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (;;) {
    if (auto it = parked_.find(msgid); it != parked_.end()) {
      auto reply = std::move(it->second);
      parked_.erase(it);
      NVBIND_LOG_TRACE("response #{}", msgid);
      if (reply.failure)
        std::rethrow_exception(reply.failure);
      if (reply.error)
        throw_remote_error(*reply.error);
      return std::move(reply.result);
    }
    if (broken_)
      throw TransportError("lost message framing: " + *broken_);
    receive_one();
  }
}

NVBIND_API std::unique_ptr<RpcClient> RpcClientBuilder::build()
{
  if (spawn_) {
    NVBIND_LOG_INFO("spawning {}", spawn_->first);
    transport_ =
        std::make_unique<ProcessTransport>(spawn_->first, spawn_->second);
    spawn_.reset();
  }
  if (!transport_)
    throw Exception("no transport configured: call set_transport() or spawn()");
  return std::make_unique<RpcClient>(std::move(transport_), registry_);
}

} // namespace nvbind
