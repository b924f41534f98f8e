#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace auklet::metrics {

// Aggregate "cpu" line of /proc/stat, in clock ticks.
struct CpuTimes {
  std::uint64_t busy  = 0;
  std::uint64_t total = 0;
};

struct NetCounters {
  std::uint64_t rx_bytes = 0;
  std::uint64_t tx_bytes = 0;
};

// Whole file contents, or nullopt if it cannot be read.
std::optional<std::string> ReadFile(const std::string& path);

std::optional<CpuTimes>    ParseCpuTimes(const std::string& proc_stat);
std::optional<double>      ParseMemUsedPercent(const std::string& proc_meminfo);
std::optional<NetCounters> ParseNetCounters(const std::string& proc_net_dev);

} // namespace auklet::metrics
