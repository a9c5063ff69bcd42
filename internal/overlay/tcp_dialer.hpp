#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/overlay/overlay_network.hpp"

namespace edgerun::overlay {

/*
  Opens TCP connections on one long-lived io_context driven by its own
  thread.

  Dial waits at most `timeout`. An attempt that is still resolving or
  connecting when the caller gives up is cancelled and left to finish on
  the io thread, so a stalled name lookup never holds the caller.

  Dial throws util::ConnectivityFailure on resolve/connect errors and on
  timeout.
*/
class TcpDialer {
 public:
  TcpDialer();
  ~TcpDialer();

  TcpDialer(const TcpDialer&)            = delete;
  TcpDialer& operator=(const TcpDialer&) = delete;

  std::unique_ptr<OverlayConnection> Dial(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

 private:
  struct IoThread;

  std::shared_ptr<IoThread> io_;
};

} // namespace edgerun::overlay
