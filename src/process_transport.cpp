// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <ctime>
#include <system_error>

#include <pthread.h>

#include <boost/process.hpp>

#include <nvbind/impl/logging.hpp>
#include <nvbind/rpc_client.hpp>

namespace bp = boost::process;

namespace nvbind {

namespace {

// Pipes have no MSG_NOSIGNAL. Blocks SIGPIPE for the calling thread and
// consumes one raised inside the scope, so a write to an exited child fails
// with EPIPE.
class SigpipeGuard
{
  sigset_t old_;
  bool was_pending_;

  static bool sigpipe_pending() noexcept
  {
    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    return sigismember(&pending, SIGPIPE) == 1;
  }

public:
  SigpipeGuard() noexcept
      : was_pending_(sigpipe_pending())
  {
    sigset_t block;
    sigemptyset(&block);
    sigaddset(&block, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &block, &old_);
  }

  ~SigpipeGuard()
  {
    if (!was_pending_ && sigpipe_pending()) {
      sigset_t sigpipe;
      sigemptyset(&sigpipe);
      sigaddset(&sigpipe, SIGPIPE);
      timespec const no_wait{0, 0};
      while (sigtimedwait(&sigpipe, nullptr, &no_wait) == -1 && errno == EINTR) {
      }
    }
    pthread_sigmask(SIG_SETMASK, &old_, nullptr);
  }

  SigpipeGuard(const SigpipeGuard&) = delete;
  SigpipeGuard& operator=(const SigpipeGuard&) = delete;
};

} // namespace

struct ProcessTransport::Impl {
  bp::pipe to_child;
  bp::pipe from_child;
  bp::child child;
};

NVBIND_API ProcessTransport::ProcessTransport(
    const std::string& executable,
    const std::vector<std::string>& args)
    : impl_(std::make_unique<Impl>())
{
  boost::filesystem::path exe = executable;
  if (exe.filename() == exe) {
    exe = bp::search_path(executable);
    if (exe.empty())
      throw TransportError("executable not found in PATH: " + executable);
  }

  try {
    impl_->child = bp::child(exe, bp::args(args),
                             bp::std_in < impl_->to_child,
                             bp::std_out > impl_->from_child);
  } catch (const bp::process_error& e) {
    throw TransportError("failed to start " + executable + ": " + e.what());
  }

  NVBIND_LOG_DEBUG("started {} (pid {})", exe.string(), impl_->child.id());
}

NVBIND_API ProcessTransport::~ProcessTransport()
{
  // EOF on stdin asks the child to quit
  impl_->to_child.close();

  std::error_code ec;
  if (impl_->child.running(ec)) {
    if (!impl_->child.wait_for(std::chrono::seconds(1), ec)) {
      NVBIND_LOG_WARN("child {} did not exit, terminating", impl_->child.id());
      impl_->child.terminate(ec);
    }
  }
}

NVBIND_API void ProcessTransport::write(std::span<const std::uint8_t> bytes)
{
  auto p = reinterpret_cast<const char*>(bytes.data());
  auto left = bytes.size();
  SigpipeGuard guard;
  try {
    while (left > 0) {
      auto const chunk = static_cast<int>(std::min<std::size_t>(left, INT_MAX));
      auto const n = impl_->to_child.write(p, chunk);
      if (n <= 0)
        throw TransportError("write to child process failed");
      p += n;
      left -= static_cast<std::size_t>(n);
    }
  } catch (const bp::process_error& e) {
    throw TransportError(std::string("write to child process failed: ") +
                         e.what());
  }
}

NVBIND_API std::size_t ProcessTransport::read_some(std::span<std::uint8_t> out)
{
  try {
    auto const chunk = static_cast<int>(std::min<std::size_t>(out.size(), INT_MAX));
    auto const n =
        impl_->from_child.read(reinterpret_cast<char*>(out.data()), chunk);
    return n < 0 ? 0 : static_cast<std::size_t>(n);
  } catch (const bp::process_error& e) {
    throw TransportError(std::string("read from child process failed: ") +
                         e.what());
  }
}

} // namespace nvbind
