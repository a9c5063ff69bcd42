#include "prober.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/overlay/overlay_network.hpp"

namespace edgerun::remote {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

Prober::Prober(std::shared_ptr<overlay::OverlayNetwork> overlay, uint16_t port, std::chrono::milliseconds timeout)
    : overlay_(std::move(overlay)), port_(port), timeout_(timeout) {
}

bool Prober::Probe(const std::string& device_id, const util::Deadline& deadline) const {
  const auto timeout = deadline.Clamp(timeout_);
  EDGERUN_LOG_DEBUG("Probing device", {StringField("device_id", device_id), IntField("port", port_), DurationField("timeout", timeout)});

  try {
    auto conn = overlay_->Dial(device_id, port_, timeout);
    if (conn) {
      EDGERUN_LOG_INFO("Device reachable", {StringField("device_id", device_id), StringField("remote", conn->RemoteAddress())});
      conn->Close();
      return true;
    }
    EDGERUN_LOG_WARN("Device probe returned no connection", {StringField("device_id", device_id)});
  } catch (const std::exception& e) {
    EDGERUN_LOG_WARN("Device probe failed, continuing", {StringField("device_id", device_id), StringField("error", e.what())});
  }
  return false;
}

} // namespace edgerun::remote
