#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace edgerun::util {

/*
  Execution ids: "exec-<device>-<unix nanos>".

  The nanosecond component is strictly increasing per generator even when the
  wall clock stalls or steps backwards, so two calls never collide.
*/
class ExecutionIdGenerator {
 public:
  std::string Next(const std::string& device_id);

 private:
  int64_t NextStamp();

  std::atomic<int64_t> last_stamp_{0};
};

} // namespace edgerun::util
