#include "procfs.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

namespace auklet::metrics {

namespace {

std::uint64_t ParseKb(const std::string& rest) {
  std::istringstream in(rest);
  std::uint64_t      value = 0;
  in >> value;
  return value;
}

} // namespace

std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::nullopt;
  }
  return contents;
}

std::optional<CpuTimes> ParseCpuTimes(const std::string& proc_stat) {
  std::istringstream ss(proc_stat);
  std::string        line;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu ", 0) != 0) {
      continue;
    }

    // user nice system idle iowait irq softirq steal
    std::istringstream fields(line.substr(4));
    std::uint64_t      v[8]{};
    int                n = 0;
    while (n < 8 && fields >> v[n]) {
      ++n;
    }
    if (n < 4) {
      return std::nullopt;
    }

    CpuTimes out;
    const std::uint64_t idle = v[3] + v[4];
    for (int i = 0; i < n; ++i) {
      out.total += v[i];
    }
    out.busy = out.total - idle;
    return out;
  }
  return std::nullopt;
}

std::optional<double> ParseMemUsedPercent(const std::string& proc_meminfo) {
  std::istringstream ss(proc_meminfo);
  std::string        line;
  std::uint64_t      total = 0, available = 0;
  bool               have_available = false;
  while (std::getline(ss, line)) {
    if (line.starts_with("MemTotal:")) {
      total = ParseKb(line.substr(9));
    } else if (line.starts_with("MemAvailable:")) {
      available      = ParseKb(line.substr(13));
      have_available = true;
    }
  }
  if (total == 0 || !have_available || available > total) {
    return std::nullopt;
  }
  return 100.0 * static_cast<double>(total - available) / static_cast<double>(total);
}

std::optional<NetCounters> ParseNetCounters(const std::string& proc_net_dev) {
  std::istringstream ss(proc_net_dev);
  std::string        line;
  int                line_no = 0;
  NetCounters        out;
  bool               any = false;
  while (std::getline(ss, line)) {
    if (++line_no <= 2) {
      continue; // headers
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }

    // rx bytes is the 1st column, tx bytes the 9th
    std::istringstream ns(line.substr(colon + 1));
    std::uint64_t      rx = 0, tx = 0, skip = 0;
    if (!(ns >> rx)) {
      continue;
    }
    for (int i = 0; i < 7; ++i) {
      ns >> skip;
    }
    if (!(ns >> tx)) {
      continue;
    }
    out.rx_bytes += rx;
    out.tx_bytes += tx;
    any = true;
  }
  if (!any) {
    return std::nullopt;
  }
  return out;
}

} // namespace auklet::metrics
