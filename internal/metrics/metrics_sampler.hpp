#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "internal/metrics/procfs.hpp"
#include "internal/model/system_metrics.hpp"

namespace auklet::metrics {

/*
  MetricsSampler

  System-wide snapshot for the exit Event. CPU load is averaged over the
  window since the last Prime(); memory and network are instantaneous.
  Any value that cannot be read is reported as 0, sampling never throws.
*/
class MetricsSampler {
 public:
  // proc_root lets tests point at a fake procfs tree.
  explicit MetricsSampler(std::string proc_root = "/proc");

  void                 Prime();
  model::SystemMetrics Sample();

 private:
  const std::string       proc_root_;
  std::mutex              mutex_;
  std::optional<CpuTimes> baseline_;
};

} // namespace auklet::metrics
