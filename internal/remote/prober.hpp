#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/util/deadline.hpp"

namespace edgerun::overlay {
class OverlayNetwork;
}

namespace edgerun::remote {

/*
  Best-effort reachability check of a device's remote-shell port.

  Never throws. A false result is only a diagnostic: NAT traversal and lazy
  peer discovery on the overlay routinely produce false negatives.
*/
class Prober {
 public:
  Prober(std::shared_ptr<overlay::OverlayNetwork> overlay, uint16_t port, std::chrono::milliseconds timeout);

  bool Probe(const std::string& device_id, const util::Deadline& deadline) const;

 private:
  std::shared_ptr<overlay::OverlayNetwork> overlay_;
  uint16_t                                 port_;
  std::chrono::milliseconds                timeout_;
};

} // namespace edgerun::remote
