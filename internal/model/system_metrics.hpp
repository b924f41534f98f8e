#pragma once

#include <cstdint>

namespace auklet::model {

/*
  System-wide figures sampled when the child exits.

  cpu_percent covers the interval since the child started; the traffic
  counters are cumulative since boot. They are emitted as JSON numbers, which
  are exact up to 2^53 bytes.
*/
struct SystemMetrics {
  double   cpu_percent{0.0};
  double   mem_percent{0.0};
  uint64_t inbound_bytes{0};
  uint64_t outbound_bytes{0};
};

} // namespace auklet::model
