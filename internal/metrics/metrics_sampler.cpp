#include "metrics_sampler.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "internal/observability/logging.hpp"

namespace auklet::metrics {

namespace {

std::optional<CpuTimes> ReadCpu(const std::string& root) {
  if (auto text = ReadFile(root + "/stat")) {
    return ParseCpuTimes(*text);
  }
  return std::nullopt;
}

} // namespace

MetricsSampler::MetricsSampler(std::string proc_root) : proc_root_(std::move(proc_root)) {}

void MetricsSampler::Prime() {
  std::lock_guard lock(mutex_);
  baseline_ = ReadCpu(proc_root_);
}

model::SystemMetrics MetricsSampler::Sample() {
  model::SystemMetrics out;

  {
    std::lock_guard lock(mutex_);
    const auto      now = ReadCpu(proc_root_);
    if (now && baseline_ && now->total > baseline_->total) {
      const auto busy  = static_cast<double>(now->busy - std::min(now->busy, baseline_->busy));
      const auto total = static_cast<double>(now->total - baseline_->total);
      out.cpu_percent  = 100.0 * busy / total;
    } else if (!now) {
      AUKLET_LOG_WARN("cpu sample unavailable");
    }
    baseline_ = now;
  }

  if (auto text = ReadFile(proc_root_ + "/meminfo")) {
    out.mem_percent = ParseMemUsedPercent(*text).value_or(0.0);
  } else {
    AUKLET_LOG_WARN("memory sample unavailable");
  }

  if (auto text = ReadFile(proc_root_ + "/net/dev")) {
    if (auto net = ParseNetCounters(*text)) {
      out.inbound_bytes  = net->rx_bytes;
      out.outbound_bytes = net->tx_bytes;
    }
  } else {
    AUKLET_LOG_WARN("network sample unavailable");
  }

  AUKLET_LOG_DEBUG("system metrics sampled",
                   {observability::DoubleField("cpu_percent", out.cpu_percent),
                    observability::DoubleField("mem_percent", out.mem_percent),
                    observability::IntField("inbound_bytes", static_cast<std::int64_t>(out.inbound_bytes)),
                    observability::IntField("outbound_bytes", static_cast<std::int64_t>(out.outbound_bytes))});
  return out;
}

} // namespace auklet::metrics
