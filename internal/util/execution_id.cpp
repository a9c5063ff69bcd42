#include "execution_id.hpp"

#include "time.hpp"

namespace edgerun::util {

int64_t ExecutionIdGenerator::NextStamp() {
  const int64_t now  = ToUnixNanos(Now());
  int64_t       last = last_stamp_.load();
  int64_t       next = 0;
  do {
    next = now > last ? now : last + 1;
  } while (!last_stamp_.compare_exchange_weak(last, next));
  return next;
}

std::string ExecutionIdGenerator::Next(const std::string& device_id) {
  return "exec-" + device_id + "-" + std::to_string(NextStamp());
}

} // namespace edgerun::util
